#include "rotbridge/net/NetService.hpp"
#include "rotbridge/log/Log.hpp"

#include <thread>

namespace rotbridge::net {

namespace {

class IoThread {
public:
    IoThread()
    : io_(std::make_shared<asio::io_context>())
    , workGuard_(asio::make_work_guard(*io_))
    , thread_([this]{ io_->run(); })
    {
        logInfo("[NetService] I/O thread started\n");
    }

    ~IoThread() {
        workGuard_.reset();
        io_->stop();
        if (thread_.joinable()) thread_.join();
    }

    IoThread(const IoThread&) = delete;
    IoThread& operator=(const IoThread&) = delete;

    const std::shared_ptr<asio::io_context>& io() const { return io_; }
    std::thread::id id() const { return thread_.get_id(); }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> workGuard_;
    std::thread thread_;
};

IoThread& service() {
    static IoThread instance;
    return instance;
}

} // namespace

void ensureNetService() {
    service();
}

std::shared_ptr<asio::io_context> shared_io_context() {
    return service().io();
}

asio::io_context& io_context() {
    return *service().io();
}

bool onNetServiceThread() {
    return std::this_thread::get_id() == service().id();
}

} // namespace rotbridge::net
