#include "lft/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace lft::core {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    // from_str maps unknown names to off
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

Result<void> configure_logging(const std::string& level) {
    const auto parsed = parse_log_level(level);
    if (!parsed) {
        return Err<void>(ErrorCode::InvalidArgument, "Unknown log level '" + level + "'");
    }
    spdlog::set_level(*parsed);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    return Ok();
}

} // namespace lft::core
