#include "lft/core/command_line.hpp"
#include "lft/core/logging.hpp"
#include "lft/events/event_logger.hpp"
#include "lft/network/tcp.hpp"
#include "lft/transfer/folder_enumerator.hpp"
#include "lft/transfer/worker.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using lft::core::Command;
using lft::core::CommandLine;
using lft::core::TransferConfig;
using lft::network::TcpListener;
using lft::network::TcpStream;
using lft::transfer::TransferOutcome;
using lft::transfer::TransferWorker;

namespace {

constexpr int kExitComplete = 0;
constexpr int kExitAborted = 1;
constexpr int kExitUsage = 2;

constexpr std::chrono::milliseconds kAcceptPoll{500};
constexpr std::chrono::milliseconds kEventPoll{200};

volatile std::sig_atomic_t g_stop_requested = 0;

void on_signal(int) {
    g_stop_requested = 1;
}

/// Pumps worker events into the log until the transfer ends; Ctrl-C cancels it
TransferOutcome supervise(TransferWorker& worker) {
    lft::events::EventLogger logger;
    bool cancel_sent = false;

    for (;;) {
        auto outcome = worker.wait_for(kEventPoll);
        for (const auto& event : worker.events().drain()) {
            logger.log(event);
        }
        if (outcome) {
            return *outcome;
        }
        if (g_stop_requested && !cancel_sent) {
            spdlog::warn("Interrupted, cancelling the transfer");
            worker.cancel();
            cancel_sent = true;
        }
    }
}

int run_receive(const CommandLine& command_line, const TransferConfig& config) {
    TcpListener listener;
    auto port = listener.bind_first_available(config.bind_address, config.ports);
    if (port.is_error()) {
        spdlog::error("{}", port.error().describe());
        return kExitAborted;
    }
    spdlog::info("Receiving into {} (Ctrl-C to stop)", config.receive_root.string());

    int last_status = kExitComplete;
    TransferWorker worker(config);
    while (!g_stop_requested) {
        auto stream = listener.accept(kAcceptPoll);
        if (stream.is_error()) {
            if (stream.error().code == lft::ErrorCode::Timeout) {
                continue;
            }
            spdlog::error("{}", stream.error().describe());
            return kExitAborted;
        }

        if (auto started = worker.start_receive(std::move(stream.value())); started.is_error()) {
            spdlog::error("{}", started.error().describe());
            return kExitAborted;
        }
        const auto outcome = supervise(worker);
        last_status = outcome.succeeded() ? kExitComplete : kExitAborted;

        if (command_line.once) {
            break;
        }
    }

    listener.close();
    return last_status;
}

/// Tries the configured ports in order; the receiver binds the first free one
lft::Result<std::unique_ptr<TcpStream>> connect_to_receiver(const std::string& host,
                                                            const TransferConfig& config) {
    std::optional<lft::Error> last_error;
    for (std::uint16_t port : config.ports) {
        auto stream = TcpStream::connect(host, port, config.connect_timeout);
        if (stream.is_ok()) {
            return stream;
        }
        spdlog::debug("{}", stream.error().describe());
        last_error = stream.error();
    }
    return lft::Err<std::unique_ptr<TcpStream>>(
        last_error ? *last_error : lft::Error(lft::ErrorCode::InvalidArgument, "No ports configured"));
}

int run_send(const CommandLine& command_line, const TransferConfig& config) {
    auto request = lft::transfer::make_transfer_request(command_line.path);
    if (request.is_error()) {
        spdlog::error("{}", request.error().describe());
        return kExitUsage;
    }
    for (const auto& skipped : request.value().manifest.skipped) {
        spdlog::warn("Not sending '{}': {}", skipped.relative_path, skipped.reason);
    }

    auto stream = connect_to_receiver(command_line.host, config);
    if (stream.is_error()) {
        spdlog::error("{}", stream.error().describe());
        return kExitAborted;
    }

    TransferWorker worker(config);
    if (auto started = worker.start_send(std::move(stream.value()), std::move(request.value()));
        started.is_error()) {
        spdlog::error("{}", started.error().describe());
        return kExitAborted;
    }
    const auto outcome = supervise(worker);
    return outcome.succeeded() ? kExitComplete : kExitAborted;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    const std::string program = argc > 0 ? argv[0] : "lft_transfer";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto command_line = lft::core::parse_command_line(args);
    if (command_line.is_error()) {
        std::cerr << command_line.error().message << "\n\n" << lft::core::usage(program);
        return kExitUsage;
    }
    if (command_line.value().command == Command::Help) {
        std::cout << lft::core::usage(program);
        return kExitComplete;
    }

    auto config = lft::core::resolve_config(command_line.value());
    if (config.is_error()) {
        std::cerr << config.error().describe() << "\n";
        return kExitUsage;
    }
    if (auto logging = lft::core::configure_logging(config.value().log_level); logging.is_error()) {
        std::cerr << logging.error().describe() << "\n";
        return kExitUsage;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    if (command_line.value().command == Command::Receive) {
        return run_receive(command_line.value(), config.value());
    }
    return run_send(command_line.value(), config.value());
}
