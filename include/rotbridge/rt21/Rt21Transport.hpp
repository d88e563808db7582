#pragma once
#include "rotbridge/core/Command.hpp"
#include "rotbridge/core/Expected.hpp"
#include "rotbridge/net/TcpClient.hpp"
#include "rotbridge/rt21/Rt21Config.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace rotbridge::rt21 {

using core::Command;

/**
 * @brief Owns the TCP link to one RT21 rotator controller.
 *
 * One instance per Session. The link is opened once and never reopened: any
 * failure is reported to the caller, who decides whether the Session goes on.
 *
 * Deadlines:
 * - connect uses `connectTimeout` (5 s default).
 * - position queries wait for the reply with `queryTimeout`; the default of
 *   zero waits indefinitely, so a silent device stalls the caller until
 *   `interrupt()` or `close()`.
 * - move/stop wait `ackTimeout` (2 s default) for an optional acknowledgment.
 */
class Rt21Transport {
public:
    struct Timeouts {
        std::chrono::milliseconds connect = config::RT21_CONNECT_TIMEOUT;
        std::chrono::milliseconds ack = config::RT21_ACK_TIMEOUT;
        std::chrono::milliseconds query = config::RT21_QUERY_TIMEOUT;
        std::chrono::milliseconds write{1000};
    };

    Rt21Transport();
    explicit Rt21Transport(const Timeouts& timeouts);
    ~Rt21Transport();

    Rt21Transport(const Rt21Transport&) = delete;
    Rt21Transport& operator=(const Rt21Transport&) = delete;

    /**
     * @brief Resolve @p host and connect within the connect timeout.
     * @param host Dotted quad or host name.
     * @param port RT21 TCP port (defaults to 6555).
     */
    expected<void> connect(const std::string& host,
                           unsigned short port = config::RT21_PORT_DEFAULT);

    /// Send `AI1\r;` and decode the first digit run of the reply.
    expected<int> queryPosition();

    /**
     * @brief Send a move or stop command.
     *
     * Returns the device's acknowledgment text if one arrived within the ack
     * timeout, `std::nullopt` if none did. Only the write itself can fail.
     */
    expected<std::optional<std::string>> send(const Command& command);

    void close();                        // idempotent
    void interrupt();                    // any thread
    bool isConnected() const;

    const Timeouts& timeouts() const { return timeouts_; }

private:
    expected<void> writeRaw(const std::string& wire);

    Timeouts timeouts_;
    net::TcpClient tcpClient;
    std::string endpointLabel;
};

} // namespace rotbridge::rt21
