#pragma once
#include "rotbridge/core/Expected.hpp"
#include "rotbridge/net/NetConfig.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace rotbridge::net {

/**
 * @brief Blocking accept loop helper over `tcp::acceptor`.
 *
 * `accept()` blocks the calling thread until a peer connects or `close()` is
 * called (from any thread, the I/O thread included). Accepted sockets are
 * bound to the shared `io_context`; hand them to `TcpClient::adopt()`.
 */
class TcpListener {
public:
    TcpListener();
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    /// Open, set SO_REUSEADDR, bind and listen. Port 0 picks an ephemeral port.
    std::error_code listen(const std::string& address, unsigned short port, int backlog = 5);

    expected<tcp::socket> accept();

    /// Port actually bound (useful after listening on port 0).
    unsigned short port() const;

    bool isOpen() const;

    // Idempotent; wakes a blocked accept() with operation_aborted.
    void close();

private:
    std::shared_ptr<asio::io_context> io_;
    mutable std::mutex acceptorMutex_;
    tcp::acceptor acceptor_;
    std::atomic<bool> closed_{false};
};

} // namespace rotbridge::net
