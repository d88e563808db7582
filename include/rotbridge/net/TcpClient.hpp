#pragma once
#include "rotbridge/net/NetConfig.hpp"
#include "rotbridge/net/Deadline.hpp"
#include "rotbridge/net/NetService.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace rotbridge::net {
/**
 * @brief Thin wrapper around `tcp::socket` that adds deadlines and low-latency options.
 *
 * Highlights:
 * - `connect(...)` tries each resolved endpoint and respects a per-attempt timeout.
 * - `read_some(...)` and `write_all(...)` block the caller while enforcing deadlines;
 *   a zero read timeout waits until data, EOF or `interrupt()`.
 * - `adopt(...)` takes ownership of a socket produced by `TcpListener`.
 * - `interrupt()` may be called from any thread, including the I/O thread, to
 *   abort the pending operation and refuse new ones.
 *
 * The caller must keep the owning `asio::io_context` running while using the
 * API, and must not call the blocking helpers from the I/O thread.
 */
class TcpClient {
public:
    TcpClient()
    : io_(shared_io_context())
    , socket_(*io_)
    , strand_(asio::make_strand(*io_))
    , defaultTimeout_(DEFAULT_IO_TIMEOUT)
    , connectTimeout_(DEFAULT_IO_TIMEOUT)
    {}

    ~TcpClient() { close(); }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    void setDefaultTimeout(duration timeout) {
        defaultTimeout_ = sanitizeTimeout(timeout);
    }

    duration defaultTimeout() const { return defaultTimeout_; }

    void setConnectTimeout(duration timeout) {
        connectTimeout_ = sanitizeTimeout(timeout);
    }

    duration connectTimeout() const { return connectTimeout_; }

    std::error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        {
            std::lock_guard<std::mutex> lk(socketMutex_);
            socket_ = tcp::socket(strand_);
        }
        return connect_one(endpoint, timeout);
    }

    std::error_code connect(const tcp::endpoint& endpoint) {
        return connect(endpoint, connectTimeout_);
    }

    // Connect from resolver results (entries have .endpoint()); remembers the
    // last error and moves on to the next endpoint.
    std::error_code connect(const tcp::resolver::results_type& results, duration timeout) {
        std::error_code last = asio::error::host_not_found;

        for (const auto& e : results) {
            auto ec = connect(e.endpoint(), timeout);
            if (!ec) return ec;
            last = ec;
            if (interrupted_) break;
        }
        return last;
    }

    std::error_code connect(const tcp::resolver::results_type& results) {
        return connect(results, connectTimeout_);
    }

    /// Take over an already-connected socket (from an acceptor).
    void adopt(tcp::socket&& socket) {
        close();
        std::lock_guard<std::mutex> lk(socketMutex_);
        socket_ = std::move(socket);
    }

    /**
     * @brief Read whatever is available, up to @p n bytes.
     *
     * A zero @p timeout disables the deadline. End of stream is reported as
     * `asio::error::eof` with zero bytes transferred.
     */
    std::error_code read_some(void* buf, std::size_t n, duration timeout,
                              std::size_t* bytesTransferredOut = nullptr) {
        auto transferred = std::make_shared<std::size_t>(0);
        auto start = [&](auto completion){
            std::lock_guard<std::mutex> lk(socketMutex_);
            if (interrupted_) {
                asio::post(*io_, [completion]{ completion(asio::error::operation_aborted); });
                return;
            }
            socket_.async_read_some(asio::buffer(buf, n),
                [transferred, completion](const std::error_code& op_ec, std::size_t count){
                    *transferred = count;
                    completion(op_ec);
                });
        };

        const auto effectiveTimeout = sanitizeTimeout(timeout);
        std::error_code ec;
        if (effectiveTimeout == duration::zero()) {
            ec = without_deadline(start);
        } else {
            ec = with_deadline(io_->get_executor(), effectiveTimeout, start,
                               [this]{ cancel(); });
        }
        if (bytesTransferredOut) {
            *bytesTransferredOut = *transferred;
        }
        return ec;
    }

    std::error_code write_all(const void* buf, std::size_t n, duration timeout) {
        const auto effectiveTimeout = sanitizeTimeout(timeout);
        auto ec = with_deadline(io_->get_executor(), effectiveTimeout,
            [&](auto completion){
                std::lock_guard<std::mutex> lk(socketMutex_);
                if (interrupted_) {
                    asio::post(*io_, [completion]{ completion(asio::error::operation_aborted); });
                    return;
                }
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const std::error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );
        return ec;
    }

    std::error_code read_some(void* buf, std::size_t n, std::size_t* bytesTransferredOut = nullptr) {
        return read_some(buf, n, defaultTimeout_, bytesTransferredOut);
    }

    std::error_code write_all(const void* buf, std::size_t n) {
        return write_all(buf, n, defaultTimeout_);
    }

    std::error_code write_all(const std::string& text, duration timeout) {
        return write_all(text.data(), text.size(), timeout);
    }

    void setLowLatency() {
        std::lock_guard<std::mutex> lk(socketMutex_);
        std::error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);
        socket_.set_option(asio::socket_base::keep_alive(true), ec);
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lk(socketMutex_);
        return socket_.is_open();
    }

    bool interrupted() const { return interrupted_; }

    /// "address:port" of the peer, or "?" when unknown.
    std::string remoteEndpointString() const {
        std::lock_guard<std::mutex> lk(socketMutex_);
        std::error_code ec;
        auto ep = socket_.remote_endpoint(ec);
        if (ec) return "?";
        return ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    // Best-effort cancellation of pending ops on the socket.
    void cancel() {
        std::lock_guard<std::mutex> lk(socketMutex_);
        std::error_code ec;
        socket_.cancel(ec);
    }

    // Abort the pending operation and fail every later one with
    // operation_aborted. Safe from any thread.
    void interrupt() {
        std::lock_guard<std::mutex> lk(socketMutex_);
        interrupted_ = true;
        std::error_code ec;
        socket_.cancel(ec);
    }

    // Idempotent. Returns true when this call actually closed an open socket.
    bool close() {
        std::lock_guard<std::mutex> lk(socketMutex_);
        if (!socket_.is_open()) return false;
        std::error_code ec;
        // Proactively cancel outstanding operations first (pattern: cancel -> shutdown -> close).
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        return true;
    }

private:
    std::error_code connect_one(const tcp::endpoint& ep, duration timeout) {
        const auto effectiveTimeout = sanitizeTimeout(timeout);
        return with_deadline(io_->get_executor(), effectiveTimeout,
            [&](auto completion){
                std::lock_guard<std::mutex> lk(socketMutex_);
                if (interrupted_) {
                    asio::post(*io_, [completion]{ completion(asio::error::operation_aborted); });
                    return;
                }
                socket_.async_connect(ep, completion);
            },
            [this]{ cancel(); }
        );
    }

    std::shared_ptr<asio::io_context> io_;
    mutable std::mutex socketMutex_;
    tcp::socket socket_;
    asio::strand<asio::io_context::executor_type> strand_;
    std::atomic<bool> interrupted_{false};
    duration defaultTimeout_;
    duration connectTimeout_;
};

} // namespace rotbridge::net
