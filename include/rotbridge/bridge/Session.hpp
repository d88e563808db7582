#pragma once
#include "rotbridge/core/CancellationToken.hpp"
#include "rotbridge/core/Command.hpp"
#include "rotbridge/core/TranslationResult.hpp"
#include "rotbridge/config/BridgeConfig.hpp"
#include "rotbridge/net/TcpClient.hpp"
#include "rotbridge/rt21/Rt21Transport.hpp"

#include <atomic>
#include <string>

namespace rotbridge::bridge {

/**
 * @brief Couples one K4 client connection to one RT21 connection.
 *
 * States: Connecting -> Active -> Closing -> Closed. A failed RT21 connect
 * skips Active. `run()` blocks the calling thread for the whole lifetime and
 * always leaves both sockets closed, whatever ended the loop.
 *
 * Requests are strictly sequential: one read from the client is one command,
 * and the next read only starts after its reply has been written.
 */
class Session {
public:
    enum class State {
        Connecting,
        Active,
        Closing,
        Closed
    };

    Session(net::tcp::socket client,
            const config::BridgeConfig& config,
            core::CancellationToken token);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Connect to the RT21, serve the client until it leaves, tear down.
    void run();

    /// Wake a blocked run() from another thread; it then tears down.
    void interrupt();

    /// Close both sockets. Idempotent.
    void close();

    State state() const { return state_.load(); }
    std::size_t commandsServed() const { return commandsServed_.load(); }
    const std::string& peer() const { return peer_; }

    static const char* toString(State state);

private:
    void serve();
    core::TranslationResult translate(const core::Command& command);
    bool reply(const std::string& text);
    void setState(State next);

    config::BridgeConfig config_;
    core::CancellationToken token_;
    net::TcpClient client_;
    rt21::Rt21Transport transport_;
    std::string peer_;
    std::atomic<State> state_{State::Connecting};
    std::atomic<std::size_t> commandsServed_{0};
};

} // namespace rotbridge::bridge
