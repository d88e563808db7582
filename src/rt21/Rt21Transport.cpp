/**
 * @brief Implements the RT21 link: connect, position query, move/stop delivery.
 */
#include "rotbridge/rt21/Rt21Transport.hpp"

#include "rotbridge/log/Log.hpp"
#include "rotbridge/net/Resolve.hpp"
#include "rotbridge/rt21/Rt21Command.hpp"
#include "rotbridge/rt21/Rt21Response.hpp"

#include <array>
#include <string_view>
#include <system_error>

namespace rotbridge::rt21 {

using rotbridge::expected;
using rotbridge::unexpected;
namespace asio = rotbridge::net::asio;

Rt21Transport::Rt21Transport()
: Rt21Transport(Timeouts{}) {}

Rt21Transport::Rt21Transport(const Timeouts& timeouts)
: timeouts_(timeouts)
{
    tcpClient.setConnectTimeout(timeouts_.connect);
    tcpClient.setDefaultTimeout(timeouts_.write);
}

Rt21Transport::~Rt21Transport() {
    close();
}

expected<void>
Rt21Transport::connect(const std::string& host, unsigned short port) {
    net::tcp::resolver::results_type endpoints;
    if (auto ec = net::resolve(net::io_context(), host, std::to_string(port), endpoints); ec) {
        logError("[Rt21Transport] cannot resolve ", host, ": ", ec.message(), "\n");
        return unexpected(ec);
    }

    if (auto ec = tcpClient.connect(endpoints); ec) {
        logError("[Rt21Transport] connect failed: ", ec.message(),
                 " (to ", host, ":", port, ")",
                 " timeout=", tcpClient.connectTimeout().count(), "ms\n");
        return unexpected(ec);
    }

    tcpClient.setLowLatency();
    endpointLabel = host + ":" + std::to_string(port);

    logTraffic("CONNECTION", "RT21", "Connected to RT21 at " + endpointLabel);
    return {};
}

expected<void> Rt21Transport::writeRaw(const std::string& wire) {
    if (!tcpClient.is_open()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }
    if (auto ec = tcpClient.write_all(wire, timeouts_.write); ec) {
        return unexpected(ec);
    }
    logTraffic("SENT", "RT21", wire);
    return {};
}

expected<int> Rt21Transport::queryPosition() {
    if (auto sent = writeRaw(config::RT21_QUERY_POSITION); !sent) {
        logTraffic("ERROR", "TRANSLATOR", "RT21 query failed: " + sent.error().message());
        return unexpected(sent.error());
    }

    std::array<char, config::RT21_READ_CHUNK> raw{};
    std::size_t received = 0;
    if (auto ec = tcpClient.read_some(raw.data(), raw.size(), timeouts_.query, &received); ec) {
        logTraffic("ERROR", "TRANSLATOR", "RT21 query failed: " + ec.message());
        return unexpected(ec);
    }

    const std::string_view response(raw.data(), received);
    logTraffic("RESPONSE", "RT21", response);

    auto azimuth = decodeAzimuth(response);
    if (!azimuth) {
        logTraffic("ERROR", "TRANSLATOR", "RT21 position reply has no azimuth");
    }
    return azimuth;
}

expected<std::optional<std::string>> Rt21Transport::send(const Command& command) {
    auto wire = encodeCommand(command);
    if (!wire) {
        return unexpected(wire.error());
    }

    if (auto sent = writeRaw(*wire); !sent) {
        logTraffic("ERROR", "TRANSLATOR", "RT21 communication failed: " + sent.error().message());
        return unexpected(sent.error());
    }

    // The RT21 does not always acknowledge; silence within the window is normal.
    std::array<char, config::RT21_READ_CHUNK> raw{};
    std::size_t received = 0;
    auto ec = tcpClient.read_some(raw.data(), raw.size(), timeouts_.ack, &received);
    if (ec == asio::error::timed_out) {
        return std::optional<std::string>{};
    }
    if (ec) {
        logError("[Rt21Transport] acknowledgment read failed: ", ec.message(), "\n");
        return std::optional<std::string>{};
    }

    std::string ack(raw.data(), received);
    logTraffic("RESPONSE", "RT21", ack);
    return std::optional<std::string>{std::move(ack)};
}

void Rt21Transport::close() {
    if (tcpClient.close()) {
        logTraffic("CONNECTION", "RT21", "Disconnected from RT21");
    }
}

void Rt21Transport::interrupt() {
    tcpClient.interrupt();
}

bool Rt21Transport::isConnected() const {
    return tcpClient.is_open();
}

} // namespace rotbridge::rt21
