#include "lft/core/command_line.hpp"

#include <charconv>
#include <limits>
#include <sstream>

namespace lft::core {
namespace {

Result<std::uint64_t> parse_unsigned(const std::string& flag, const std::string& text, std::uint64_t max) {
    std::uint64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return Err<std::uint64_t>(ErrorCode::InvalidArgument,
                                  flag + " expects a non-negative integer, got '" + text + "'");
    }
    if (value > max) {
        return Err<std::uint64_t>(ErrorCode::InvalidArgument,
                                  flag + " must not exceed " + std::to_string(max));
    }
    return Ok(value);
}

} // namespace

Result<CommandLine> parse_command_line(const std::vector<std::string>& args) {
    CommandLine parsed;
    if (args.empty()) {
        return Err<CommandLine>(ErrorCode::InvalidArgument, "Missing command (send or receive)");
    }

    const std::string& command = args.front();
    if (command == "send") {
        parsed.command = Command::Send;
    } else if (command == "receive") {
        parsed.command = Command::Receive;
    } else if (command == "-h" || command == "--help" || command == "help") {
        parsed.command = Command::Help;
        return Ok(std::move(parsed));
    } else {
        return Err<CommandLine>(ErrorCode::InvalidArgument, "Unknown command '" + command + "'");
    }

    std::vector<std::string> positional;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            parsed.command = Command::Help;
            return Ok(std::move(parsed));
        }
        if (arg == "--once") {
            parsed.once = true;
            continue;
        }
        if (arg.size() < 2 || arg.compare(0, 2, "--") != 0) {
            positional.push_back(arg);
            continue;
        }

        if (i + 1 >= args.size()) {
            return Err<CommandLine>(ErrorCode::InvalidArgument, arg + " requires a value");
        }
        const std::string& value = args[++i];

        if (arg == "--host") {
            parsed.host = value;
        } else if (arg == "--port") {
            auto port = parse_unsigned(arg, value, std::numeric_limits<std::uint16_t>::max());
            if (port.is_error()) {
                return Err<CommandLine>(port.error());
            }
            parsed.port = static_cast<std::uint16_t>(port.value());
        } else if (arg == "--bind") {
            parsed.bind_address = value;
        } else if (arg == "--root") {
            parsed.receive_root = std::filesystem::path(value);
        } else if (arg == "--config") {
            parsed.config_file = std::filesystem::path(value);
        } else if (arg == "--chunk-size") {
            auto size = parse_unsigned(arg, value, protocol::kMaxChunkSize);
            if (size.is_error()) {
                return Err<CommandLine>(size.error());
            }
            parsed.chunk_size = static_cast<std::size_t>(size.value());
        } else if (arg == "--ack-timeout" || arg == "--io-timeout") {
            auto seconds = parse_unsigned(arg, value, 24 * 60 * 60);
            if (seconds.is_error()) {
                return Err<CommandLine>(seconds.error());
            }
            const std::chrono::milliseconds timeout =
                std::chrono::seconds(static_cast<std::int64_t>(seconds.value()));
            if (arg == "--ack-timeout") {
                parsed.ack_timeout = timeout;
            } else {
                parsed.io_timeout = timeout;
            }
        } else if (arg == "--log-level") {
            parsed.log_level = value;
        } else {
            return Err<CommandLine>(ErrorCode::InvalidArgument, "Unknown option " + arg);
        }
    }

    if (parsed.command == Command::Send) {
        if (parsed.host.empty()) {
            return Err<CommandLine>(ErrorCode::InvalidArgument, "send requires --host");
        }
        if (positional.size() != 1) {
            return Err<CommandLine>(ErrorCode::InvalidArgument, "send expects exactly one PATH");
        }
        parsed.path = positional.front();
    } else if (!positional.empty()) {
        return Err<CommandLine>(ErrorCode::InvalidArgument,
                                "Unexpected argument '" + positional.front() + "'");
    }

    return Ok(std::move(parsed));
}

Result<TransferConfig> resolve_config(const CommandLine& command_line, TransferConfig defaults) {
    TransferConfig config = std::move(defaults);

    if (command_line.config_file) {
        auto loaded = TransferConfig::load_file(*command_line.config_file, std::move(config));
        if (loaded.is_error()) {
            return loaded;
        }
        config = std::move(loaded.value());
    }

    if (command_line.port) config.ports = {*command_line.port};
    if (command_line.bind_address) config.bind_address = *command_line.bind_address;
    if (command_line.receive_root) config.receive_root = *command_line.receive_root;
    if (command_line.chunk_size) config.chunk_size = *command_line.chunk_size;
    if (command_line.ack_timeout) config.ack_timeout = *command_line.ack_timeout;
    if (command_line.io_timeout) config.io_timeout = *command_line.io_timeout;
    if (command_line.log_level) config.log_level = *command_line.log_level;

    if (auto valid = config.validate(); valid.is_error()) {
        return Err<TransferConfig>(valid.error());
    }
    return Ok(std::move(config));
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage:\n"
        << "  " << program << " receive [--root DIR] [--port P] [--bind ADDR] [--once]\n"
        << "  " << program << " send --host HOST [--port P] PATH\n"
        << "\n"
        << "Options:\n"
        << "  --config FILE       JSON configuration file\n"
        << "  --chunk-size N      bytes per data chunk (default 65536)\n"
        << "  --ack-timeout SEC   sender wait for the receiver's verdict (default 30)\n"
        << "  --io-timeout SEC    receiver wait between frames, 0 disables (default 10)\n"
        << "  --log-level LEVEL   trace, debug, info, warn, error, critical, off\n"
        << "  -h, --help          show this help\n"
        << "\n"
        << "The receiver listens on the first free port of 5001-5005 unless --port is given.\n"
        << "Files are stored under ROOT/received_files, folders under ROOT/received_folders.\n";
    return oss.str();
}

} // namespace lft::core
