#pragma once

#include "lft/core/result.hpp"
#include "lft/network/byte_stream.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace lft::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

/**
 * @brief Blocking TCP stream with per-operation deadlines
 *
 * Each operation is started asynchronously and the private io_context is run
 * until it completes or the deadline passes. On expiry the socket is closed,
 * which aborts the pending operation. Each stream owns its io_context, so the
 * owning worker thread is the only one that ever runs it.
 */
class TcpStream : public ByteStream {
public:
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    static Result<std::unique_ptr<TcpStream>> connect(const std::string& host,
                                                      std::uint16_t port,
                                                      std::chrono::milliseconds timeout);

    Result<void> read_exact(std::uint8_t* data, std::size_t size, Timeout timeout) override;
    Result<void> write_all(const std::uint8_t* data, std::size_t size, Timeout timeout) override;

    /// Thread-safe; the close itself runs on the stream's io_context
    void close() override;

    std::string peer() const override { return peer_; }

private:
    friend class TcpListener;

    TcpStream();

    /// Runs the io_context until `done` is set. Returns false on timeout.
    bool run(Timeout timeout, const bool& done);

    Error map_error(const boost::system::error_code& ec, const char* operation) const;

    asio::io_context io_context_;
    tcp::socket socket_;
    std::atomic<bool> closed_{false};
    std::string peer_;
};

/**
 * @brief Listening socket for the receive side
 *
 * bind_first_available() walks a port list and keeps the first one that binds,
 * so several receivers can coexist on one host.
 */
class TcpListener {
public:
    TcpListener();
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    /// Port 0 binds an ephemeral port; the chosen port is returned
    Result<std::uint16_t> bind_first_available(const std::string& address,
                                               const std::vector<std::uint16_t>& ports,
                                               int backlog = 5);

    /// Waits for one connection; Timeout error if none arrives in time
    Result<std::unique_ptr<TcpStream>> accept(Timeout timeout);

    std::uint16_t port() const noexcept { return port_; }
    bool is_open() const { return acceptor_.is_open(); }

    void close();

private:
    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::uint16_t port_ = 0;
};

} // namespace lft::network
