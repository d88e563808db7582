#pragma once
#include "rotbridge/bridge/Session.hpp"
#include "rotbridge/config/BridgeConfig.hpp"
#include "rotbridge/core/CancellationToken.hpp"
#include "rotbridge/core/Expected.hpp"
#include "rotbridge/net/TcpListener.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace rotbridge::bridge {

/**
 * @brief Accepts K4 clients and runs one Session per connection on its own thread.
 *
 * There is no cap on concurrent Sessions and each dials its own RT21 link.
 * An RT21 that only takes one connection at a time will refuse or queue the
 * second one; that Session then fails its connect and closes its client.
 *
 * Usage:
 *   Listener listener(config, token);
 *   listener.open();       // bind + listen
 *   listener.run();        // blocks until stop()
 */
class Listener {
public:
    Listener(const config::BridgeConfig& cfg, core::CancellationToken stopToken);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    expected<void> open();

    /**
     * @brief Accept until stopped, then interrupt and join every Session.
     *
     * Must not run on the NetService I/O thread.
     */
    void run();

    /// Cancel the token and close the acceptor. Non-blocking, any thread.
    void stop();

    unsigned short port() const { return acceptor.port(); }
    std::size_t activeSessions() const;
    std::size_t sessionsStarted() const { return started.load(); }

private:
    struct Worker {
        std::shared_ptr<Session> session;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void spawn(net::tcp::socket socket);
    void reapFinished();
    void shutdownSessions();

    config::BridgeConfig bridgeConfig;
    core::CancellationToken token;
    net::TcpListener acceptor;

    mutable std::mutex workersMutex;
    std::list<Worker> workers;
    std::atomic<std::size_t> started{0};
};

} // namespace rotbridge::bridge
