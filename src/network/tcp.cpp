#include "lft/network/tcp.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace lft::network {
namespace {

std::string endpoint_string(const tcp::endpoint& endpoint) {
    std::ostringstream oss;
    oss << endpoint.address().to_string() << ":" << endpoint.port();
    return oss.str();
}

std::string join_ports(const std::vector<std::uint16_t>& ports) {
    std::string out;
    for (std::uint16_t port : ports) {
        if (!out.empty()) out += ", ";
        out += std::to_string(port);
    }
    return out;
}

} // namespace

// ════════════════════════════════════════════════════════════════════════════
// TcpStream
// ════════════════════════════════════════════════════════════════════════════

TcpStream::TcpStream() : socket_(io_context_) {}

TcpStream::~TcpStream() {
    boost::system::error_code ec;
    socket_.close(ec);
}

Result<std::unique_ptr<TcpStream>> TcpStream::connect(const std::string& host,
                                                      std::uint16_t port,
                                                      std::chrono::milliseconds timeout) {
    using StreamResult = std::unique_ptr<TcpStream>;

    std::unique_ptr<TcpStream> stream(new TcpStream());
    const std::string target = host + ":" + std::to_string(port);

    boost::system::error_code ec;
    tcp::resolver resolver(stream->io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        return Err<StreamResult>(ErrorCode::IOFailure,
                                 "Failed to resolve " + host + ": " + ec.message());
    }

    bool done = false;
    asio::async_connect(stream->socket_, endpoints,
                        [&](const boost::system::error_code& error, const tcp::endpoint&) {
                            ec = error;
                            done = true;
                        });

    if (!stream->run(timeout, done)) {
        return Err<StreamResult>(ErrorCode::Timeout, "Connection to " + target + " timed out after " +
                                                         std::to_string(timeout.count()) + " ms");
    }
    if (ec) {
        return Err<StreamResult>(ErrorCode::IOFailure,
                                 "Failed to connect to " + target + ": " + ec.message());
    }

    stream->socket_.set_option(tcp::no_delay(true), ec);
    if (ec) {
        spdlog::debug("TCP_NODELAY not applied on {}: {}", target, ec.message());
    }

    stream->peer_ = target;
    spdlog::info("Connected to {}", target);
    return Ok(std::move(stream));
}

bool TcpStream::run(Timeout timeout, const bool& done) {
    io_context_.restart();
    if (!timeout) {
        io_context_.run();
        return true;
    }

    io_context_.run_for(*timeout);
    if (done) {
        return true;
    }

    // Deadline passed: closing the socket aborts the outstanding operation
    boost::system::error_code ec;
    socket_.close(ec);
    io_context_.run();
    return false;
}

Error TcpStream::map_error(const boost::system::error_code& ec, const char* operation) const {
    if (closed_) {
        return Error(ErrorCode::Cancelled, std::string(operation) + " cancelled");
    }
    if (ec == asio::error::eof || ec == asio::error::connection_reset ||
        ec == asio::error::broken_pipe) {
        return Error(ErrorCode::ConnectionClosed, "Peer " + peer_ + " closed the connection");
    }
    return Error(ErrorCode::IOFailure, std::string(operation) + " failed: " + ec.message());
}

Result<void> TcpStream::read_exact(std::uint8_t* data, std::size_t size, Timeout timeout) {
    if (size == 0) {
        return Ok();
    }
    if (closed_) {
        return Err<void>(ErrorCode::Cancelled, "Read cancelled");
    }

    boost::system::error_code ec;
    bool done = false;
    asio::async_read(socket_, asio::buffer(data, size),
                     [&](const boost::system::error_code& error, std::size_t) {
                         ec = error;
                         done = true;
                     });

    if (!run(timeout, done)) {
        return Err<void>(ErrorCode::Timeout, "No data from " + peer_ + " within " +
                                                 std::to_string(timeout->count()) + " ms");
    }
    if (ec) {
        return Err<void>(map_error(ec, "Read"));
    }
    return Ok();
}

Result<void> TcpStream::write_all(const std::uint8_t* data, std::size_t size, Timeout timeout) {
    if (size == 0) {
        return Ok();
    }
    if (closed_) {
        return Err<void>(ErrorCode::Cancelled, "Write cancelled");
    }

    boost::system::error_code ec;
    bool done = false;
    asio::async_write(socket_, asio::buffer(data, size),
                      [&](const boost::system::error_code& error, std::size_t) {
                          ec = error;
                          done = true;
                      });

    if (!run(timeout, done)) {
        return Err<void>(ErrorCode::Timeout, "Peer " + peer_ + " stopped reading for " +
                                                 std::to_string(timeout->count()) + " ms");
    }
    if (ec) {
        return Err<void>(map_error(ec, "Write"));
    }
    return Ok();
}

void TcpStream::close() {
    if (closed_.exchange(true)) {
        return;
    }
    spdlog::debug("Closing connection to {}", peer_);
    asio::post(io_context_, [this] {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    });
}

// ════════════════════════════════════════════════════════════════════════════
// TcpListener
// ════════════════════════════════════════════════════════════════════════════

TcpListener::TcpListener() : acceptor_(io_context_) {}

TcpListener::~TcpListener() {
    close();
}

Result<std::uint16_t> TcpListener::bind_first_available(const std::string& address,
                                                        const std::vector<std::uint16_t>& ports,
                                                        int backlog) {
    if (ports.empty()) {
        return Err<std::uint16_t>(ErrorCode::InvalidArgument, "No ports to listen on");
    }

    boost::system::error_code ec;
    auto bind_address = asio::ip::make_address(address, ec);
    if (ec) {
        return Err<std::uint16_t>(ErrorCode::InvalidArgument,
                                  "Invalid bind address '" + address + "': " + ec.message());
    }

    for (std::uint16_t candidate : ports) {
        tcp::endpoint endpoint(bind_address, candidate);

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            return Err<std::uint16_t>(ErrorCode::IOFailure,
                                      "Failed to open listening socket: " + ec.message());
        }

        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec) acceptor_.bind(endpoint, ec);
        if (!ec) acceptor_.listen(backlog, ec);

        if (!ec) {
            auto local = acceptor_.local_endpoint(ec);
            if (!ec) {
                port_ = local.port();
                spdlog::info("Listening on {}", endpoint_string(local));
                return Ok(port_);
            }
        }

        spdlog::debug("Port {} unavailable: {}", candidate, ec.message());
        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
    }

    return Err<std::uint16_t>(ErrorCode::IOFailure,
                              "No port available on " + address + " among [" + join_ports(ports) + "]");
}

Result<std::unique_ptr<TcpStream>> TcpListener::accept(Timeout timeout) {
    using StreamResult = std::unique_ptr<TcpStream>;

    if (!acceptor_.is_open()) {
        return Err<StreamResult>(ErrorCode::InvalidArgument, "Listener is not bound");
    }

    std::unique_ptr<TcpStream> stream(new TcpStream());
    boost::system::error_code ec;
    bool done = false;
    acceptor_.async_accept(stream->socket_, [&](const boost::system::error_code& error) {
        ec = error;
        done = true;
    });

    io_context_.restart();
    bool timed_out = false;
    if (timeout) {
        io_context_.run_for(*timeout);
        if (!done) {
            timed_out = true;
            boost::system::error_code cancel_ec;
            acceptor_.cancel(cancel_ec);
            io_context_.run();
        }
    } else {
        io_context_.run();
    }

    if (ec) {
        if (timed_out) {
            return Err<StreamResult>(ErrorCode::Timeout, "No incoming connection");
        }
        return Err<StreamResult>(ErrorCode::IOFailure, "Accept failed: " + ec.message());
    }

    auto remote = stream->socket_.remote_endpoint(ec);
    stream->peer_ = ec ? std::string("unknown peer") : endpoint_string(remote);
    spdlog::info("Accepted connection from {}", stream->peer_);
    return Ok(std::move(stream));
}

void TcpListener::close() {
    if (!acceptor_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("Error closing listener on port {}: {}", port_, ec.message());
    }
}

} // namespace lft::network
