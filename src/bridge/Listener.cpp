#include "rotbridge/bridge/Listener.hpp"
#include "rotbridge/log/Log.hpp"

#include <algorithm>

namespace rotbridge::bridge {

namespace asio = rotbridge::net::asio;

Listener::Listener(const config::BridgeConfig& cfg, core::CancellationToken stopToken)
: bridgeConfig(cfg)
, token(std::move(stopToken))
{}

Listener::~Listener() {
    stop();
    shutdownSessions();
}

expected<void> Listener::open() {
    if (auto ec = acceptor.listen(bridgeConfig.listenAddress, bridgeConfig.listenPort); ec) {
        logError("[Listener] cannot listen on ", bridgeConfig.listenAddress, ":",
                 bridgeConfig.listenPort, ": ", ec.message(), "\n");
        return unexpected(ec);
    }
    logInfo("Protocol Translator started on port ", acceptor.port(), "\n",
            "Forwarding to RT21 at ", bridgeConfig.rt21Host, ":", bridgeConfig.rt21Port, "\n");
    return {};
}

void Listener::run() {
    if (net::onNetServiceThread()) {
        logError("[Listener] run() called on the I/O thread; refusing to block it\n");
        return;
    }

    while (!token.isCancelled()) {
        auto socket = acceptor.accept();
        if (!socket) {
            if (token.isCancelled() || socket.error() == asio::error::operation_aborted) {
                break;
            }
            logError("[Listener] accept failed: ", socket.error().message(), "\n");
            if (!acceptor.isOpen()) {
                break;
            }
            continue;
        }

        reapFinished();
        spawn(std::move(*socket));
    }

    acceptor.close();
    shutdownSessions();
    logInfo("[Listener] stopped after ", started.load(), " session(s)\n");
}

void Listener::stop() {
    token.cancel();
    acceptor.close();
}

std::size_t Listener::activeSessions() const {
    std::lock_guard<std::mutex> lk(workersMutex);
    return static_cast<std::size_t>(std::count_if(workers.begin(), workers.end(),
        [](const Worker& w){ return !w.finished->load(); }));
}

void Listener::spawn(net::tcp::socket socket) {
    auto session = std::make_shared<Session>(std::move(socket), bridgeConfig, token);
    auto finished = std::make_shared<std::atomic<bool>>(false);

    std::thread thread([session, finished]{
        session->run();
        finished->store(true);
    });

    std::lock_guard<std::mutex> lk(workersMutex);
    workers.push_back(Worker{std::move(session), std::move(thread), std::move(finished)});
    ++started;
}

void Listener::reapFinished() {
    std::list<Worker> done;
    {
        std::lock_guard<std::mutex> lk(workersMutex);
        for (auto it = workers.begin(); it != workers.end();) {
            if (it->finished->load()) {
                auto next = std::next(it);
                done.splice(done.end(), workers, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : done) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

// In-flight reads are woken by interrupting the sockets; the Sessions then
// close both links on their own threads.
void Listener::shutdownSessions() {
    std::list<Worker> all;
    {
        std::lock_guard<std::mutex> lk(workersMutex);
        all.swap(workers);
    }
    for (auto& worker : all) {
        worker.session->interrupt();
    }
    for (auto& worker : all) {
        if (worker.thread.joinable()) worker.thread.join();
    }
}

} // namespace rotbridge::bridge
