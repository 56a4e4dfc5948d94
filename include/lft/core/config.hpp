#pragma once

#include "lft/core/result.hpp"
#include "lft/protocol/frame.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lft::core {

/**
 * @brief Runtime settings for both sides of a transfer
 *
 * Layered: built-in defaults, then a JSON file, then command-line flags.
 *
 * JSON keys (all optional, unknown keys ignored):
 *   chunk_size            bytes, 1..16 MiB
 *   ack_timeout_ms        sender wait for the Acknowledgment
 *   io_timeout_ms         receiver wait between frames, 0 disables
 *   connect_timeout_ms
 *   progress_interval_ms
 *   ports                 array of listening ports, tried in order
 *   bind_address
 *   receive_root
 *   log_level             trace|debug|info|warn|error|critical|off
 */
struct TransferConfig {
    std::size_t chunk_size = protocol::kDefaultChunkSize;
    std::chrono::milliseconds ack_timeout{30000};
    std::chrono::milliseconds io_timeout{10000};
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds progress_interval{500};
    std::vector<std::uint16_t> ports{5001, 5002, 5003, 5004, 5005};
    std::string bind_address = "0.0.0.0";
    std::filesystem::path receive_root = ".";
    std::string log_level = "info";

    Result<void> validate() const;

    /// io_timeout as a per-read deadline; nullopt when disabled
    std::optional<std::chrono::milliseconds> io_deadline() const;

    /// Overlay the keys present in a JSON document onto base
    static Result<TransferConfig> from_json_text(const std::string& text, TransferConfig base);
    static Result<TransferConfig> from_json_text(const std::string& text);

    static Result<TransferConfig> load_file(const std::filesystem::path& path, TransferConfig base);
    static Result<TransferConfig> load_file(const std::filesystem::path& path);
};

} // namespace lft::core
