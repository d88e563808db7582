#include "rotbridge/net/TcpListener.hpp"
#include "rotbridge/net/Deadline.hpp"
#include "rotbridge/net/NetService.hpp"
#include "rotbridge/log/Log.hpp"

namespace rotbridge::net {

TcpListener::TcpListener()
: io_(shared_io_context())
, acceptor_(*io_)
{}

TcpListener::~TcpListener() {
    close();
}

std::error_code TcpListener::listen(const std::string& address, unsigned short port, int backlog) {
    std::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
        logError("[TcpListener] invalid listen address '", address, "': ", ec.message(), "\n");
        return ec;
    }

    const tcp::endpoint endpoint(ip, port);

    std::lock_guard<std::mutex> lk(acceptorMutex_);
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) return ec;

    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) return ec;

    acceptor_.bind(endpoint, ec);
    if (!ec) {
        acceptor_.listen(backlog, ec);
    }
    if (ec) {
        std::error_code ignore;
        acceptor_.close(ignore);
        return ec;
    }

    closed_ = false;
    return {};
}

expected<tcp::socket> TcpListener::accept() {
    auto peer = std::make_shared<tcp::socket>(*io_);

    auto ec = without_deadline([&](auto completion){
        std::lock_guard<std::mutex> lk(acceptorMutex_);
        if (closed_ || !acceptor_.is_open()) {
            asio::post(*io_, [completion]{ completion(asio::error::operation_aborted); });
            return;
        }
        acceptor_.async_accept(*peer, [peer, completion](const std::error_code& op_ec){
            completion(op_ec);
        });
    });

    if (ec) {
        return unexpected(ec);
    }
    return std::move(*peer);
}

unsigned short TcpListener::port() const {
    std::lock_guard<std::mutex> lk(acceptorMutex_);
    std::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

bool TcpListener::isOpen() const {
    std::lock_guard<std::mutex> lk(acceptorMutex_);
    return acceptor_.is_open();
}

void TcpListener::close() {
    std::lock_guard<std::mutex> lk(acceptorMutex_);
    closed_ = true;
    if (!acceptor_.is_open()) return;
    std::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
}

} // namespace rotbridge::net
