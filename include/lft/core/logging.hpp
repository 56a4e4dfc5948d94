#pragma once

#include "lft/core/result.hpp"

#include <spdlog/common.h>

#include <optional>
#include <string>

namespace lft::core {

/// "trace" ... "off"; nullopt for anything spdlog does not know
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

/// Set the global spdlog level and the console pattern used by the tools
Result<void> configure_logging(const std::string& level);

} // namespace lft::core
