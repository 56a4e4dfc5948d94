#include "lft/core/config.hpp"
#include "lft/core/logging.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace lft::core {
namespace {

using json = nlohmann::json;

Result<std::optional<std::uint64_t>> read_unsigned(const json& doc, const char* key, std::uint64_t max) {
    using Value = std::optional<std::uint64_t>;
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return Ok(Value{});
    }
    if (!it->is_number_unsigned()) {
        return Err<Value>(ErrorCode::InvalidArgument,
                          std::string("'") + key + "' must be a non-negative integer");
    }
    const auto value = it->get<std::uint64_t>();
    if (value > max) {
        return Err<Value>(ErrorCode::InvalidArgument,
                          std::string("'") + key + "' must not exceed " + std::to_string(max));
    }
    return Ok(Value{value});
}

Result<std::optional<std::string>> read_string(const json& doc, const char* key) {
    using Value = std::optional<std::string>;
    const auto it = doc.find(key);
    if (it == doc.end()) {
        return Ok(Value{});
    }
    if (!it->is_string()) {
        return Err<Value>(ErrorCode::InvalidArgument, std::string("'") + key + "' must be a string");
    }
    return Ok(Value{it->get<std::string>()});
}

Result<void> apply_millis(const json& doc, const char* key, std::chrono::milliseconds& target) {
    auto value = read_unsigned(doc, key, static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max()));
    if (value.is_error()) {
        return Err<void>(value.error());
    }
    if (value.value()) {
        target = std::chrono::milliseconds(static_cast<std::int64_t>(*value.value()));
    }
    return Ok();
}

Result<std::vector<std::uint16_t>> read_ports(const json& value) {
    using Ports = std::vector<std::uint16_t>;
    if (!value.is_array()) {
        return Err<Ports>(ErrorCode::InvalidArgument, "'ports' must be an array of port numbers");
    }
    Ports ports;
    for (const auto& item : value) {
        if (!item.is_number_unsigned() || item.get<std::uint64_t>() > 65535) {
            return Err<Ports>(ErrorCode::InvalidArgument, "'ports' entries must be integers in 0..65535");
        }
        ports.push_back(static_cast<std::uint16_t>(item.get<std::uint64_t>()));
    }
    return Ok(std::move(ports));
}

} // namespace

Result<void> TransferConfig::validate() const {
    if (chunk_size == 0 || chunk_size > protocol::kMaxChunkSize) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "chunk_size must be between 1 and " + std::to_string(protocol::kMaxChunkSize));
    }
    if (ports.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "At least one port is required");
    }
    if (ack_timeout.count() <= 0) {
        return Err<void>(ErrorCode::InvalidArgument, "ack_timeout must be positive");
    }
    if (connect_timeout.count() <= 0) {
        return Err<void>(ErrorCode::InvalidArgument, "connect_timeout must be positive");
    }
    if (io_timeout.count() < 0 || progress_interval.count() < 0) {
        return Err<void>(ErrorCode::InvalidArgument, "Timeouts and intervals must not be negative");
    }
    if (bind_address.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "bind_address must not be empty");
    }
    if (!parse_log_level(log_level)) {
        return Err<void>(ErrorCode::InvalidArgument, "Unknown log level '" + log_level + "'");
    }
    return Ok();
}

std::optional<std::chrono::milliseconds> TransferConfig::io_deadline() const {
    if (io_timeout.count() == 0) {
        return std::nullopt;
    }
    return io_timeout;
}

Result<TransferConfig> TransferConfig::from_json_text(const std::string& text, TransferConfig base) {
    const auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return Err<TransferConfig>(ErrorCode::InvalidArgument, "Invalid JSON");
    }
    if (!doc.is_object()) {
        return Err<TransferConfig>(ErrorCode::InvalidArgument, "Configuration must be a JSON object");
    }

    TransferConfig config = std::move(base);

    auto chunk = read_unsigned(doc, "chunk_size", protocol::kMaxChunkSize);
    if (chunk.is_error()) {
        return Err<TransferConfig>(chunk.error());
    }
    if (chunk.value()) {
        config.chunk_size = static_cast<std::size_t>(*chunk.value());
    }

    const std::pair<const char*, std::chrono::milliseconds*> durations[] = {
        {"ack_timeout_ms", &config.ack_timeout},
        {"io_timeout_ms", &config.io_timeout},
        {"connect_timeout_ms", &config.connect_timeout},
        {"progress_interval_ms", &config.progress_interval},
    };
    for (const auto& [key, target] : durations) {
        if (auto applied = apply_millis(doc, key, *target); applied.is_error()) {
            return Err<TransferConfig>(applied.error());
        }
    }

    if (const auto it = doc.find("ports"); it != doc.end()) {
        auto ports = read_ports(*it);
        if (ports.is_error()) {
            return Err<TransferConfig>(ports.error());
        }
        config.ports = std::move(ports.value());
    }

    auto bind = read_string(doc, "bind_address");
    if (bind.is_error()) {
        return Err<TransferConfig>(bind.error());
    }
    if (bind.value()) {
        config.bind_address = *bind.value();
    }

    auto root = read_string(doc, "receive_root");
    if (root.is_error()) {
        return Err<TransferConfig>(root.error());
    }
    if (root.value()) {
        config.receive_root = *root.value();
    }

    auto level = read_string(doc, "log_level");
    if (level.is_error()) {
        return Err<TransferConfig>(level.error());
    }
    if (level.value()) {
        config.log_level = *level.value();
    }

    return Ok(std::move(config));
}

Result<TransferConfig> TransferConfig::from_json_text(const std::string& text) {
    return from_json_text(text, TransferConfig{});
}

Result<TransferConfig> TransferConfig::load_file(const std::filesystem::path& path, TransferConfig base) {
    std::ifstream input(path);
    if (!input) {
        return Err<TransferConfig>(ErrorCode::InvalidArgument,
                                   "Cannot open configuration file " + path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();

    auto config = from_json_text(contents.str(), std::move(base));
    if (config.is_error()) {
        return Err<TransferConfig>(ErrorCode::InvalidArgument,
                                   path.string() + ": " + config.error().message);
    }
    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
}

Result<TransferConfig> TransferConfig::load_file(const std::filesystem::path& path) {
    return load_file(path, TransferConfig{});
}

} // namespace lft::core
