#pragma once

#include "lft/core/config.hpp"
#include "lft/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lft::core {

enum class Command {
    Help,
    Send,
    Receive
};

/**
 * @brief Parsed arguments of lft_transfer
 *
 *   lft_transfer receive [--root DIR] [--port P] [--bind ADDR] [--once]
 *   lft_transfer send --host H [--port P] PATH
 *
 * Flags left unset here fall back to the config file, then to defaults.
 */
struct CommandLine {
    Command command = Command::Help;
    std::string host;
    std::filesystem::path path;
    bool once = false;

    std::optional<std::filesystem::path> config_file;
    std::optional<std::uint16_t> port;
    std::optional<std::string> bind_address;
    std::optional<std::filesystem::path> receive_root;
    std::optional<std::size_t> chunk_size;
    std::optional<std::chrono::milliseconds> ack_timeout;
    std::optional<std::chrono::milliseconds> io_timeout;
    std::optional<std::string> log_level;
};

/// args excludes the program name
Result<CommandLine> parse_command_line(const std::vector<std::string>& args);

/// defaults, then --config FILE, then the flags; the result is validated
Result<TransferConfig> resolve_config(const CommandLine& command_line, TransferConfig defaults = {});

std::string usage(const std::string& program);

} // namespace lft::core
