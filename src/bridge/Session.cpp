/**
 * @brief Per-client loop: RT21 connect, parse -> translate -> reply, teardown.
 */
#include "rotbridge/bridge/Session.hpp"

#include "rotbridge/k4/CommandParser.hpp"
#include "rotbridge/k4/ReplyFormatter.hpp"
#include "rotbridge/log/Log.hpp"
#include "rotbridge/rt21/Rt21Command.hpp"

#include <array>
#include <exception>
#include <string_view>

namespace rotbridge::bridge {

using core::Command;
using core::TranslationResult;
namespace asio = rotbridge::net::asio;

namespace {
constexpr std::size_t CLIENT_READ_CHUNK = 1024;
}

Session::Session(net::tcp::socket client,
                 const config::BridgeConfig& config,
                 core::CancellationToken token)
: config_(config)
, token_(std::move(token))
, transport_(config.transportTimeouts())
{
    client_.adopt(std::move(client));
    client_.setDefaultTimeout(config_.clientWriteTimeout);
    peer_ = client_.remoteEndpointString();
}

Session::~Session() {
    close();
}

const char* Session::toString(State state) {
    switch (state) {
        case State::Connecting: return "connecting";
        case State::Active:     return "active";
        case State::Closing:    return "closing";
        case State::Closed:     return "closed";
    }
    return "unknown";
}

void Session::setState(State next) {
    const State previous = state_.exchange(next);
    if (previous != next) {
        logInfo("[Session ", peer_, "] ", toString(previous), " -> ", toString(next), "\n");
    }
}

void Session::run() {
    logTraffic("CONNECTION", "PROXY", "Client connected: " + peer_);

    try {
        if (token_.isCancelled()) {
            logInfo("[Session ", peer_, "] shutdown in progress, not connecting\n");
        } else if (auto connected = transport_.connect(config_.rt21Host, config_.rt21Port); !connected) {
            logTraffic("ERROR", "PROXY", "Client handler error: cannot reach RT21 at " +
                       config_.rt21Host + ":" + std::to_string(config_.rt21Port) +
                       " (" + connected.error().message() + ")");
        } else {
            setState(State::Active);
            serve();
        }
    } catch (const std::exception& e) {
        logTraffic("ERROR", "PROXY", std::string("Client handler error: ") + e.what());
    }

    close();
}

void Session::serve() {
    std::array<char, CLIENT_READ_CHUNK> buffer{};

    while (!token_.isCancelled()) {
        std::size_t received = 0;
        auto ec = client_.read_some(buffer.data(), buffer.size(),
                                    net::duration::zero(), &received);
        if (ec == asio::error::eof || (!ec && received == 0)) {
            return; // orderly disconnect
        }
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                logError("[Session ", peer_, "] client read failed: ", ec.message(), "\n");
            }
            return;
        }

        const Command command = k4::parseCommand(std::string_view(buffer.data(), received));

        std::string text;
        if (command.isMove() && !rt21::encodeCommand(command)) {
            // Not representable in the three-digit RT21 field; never reaches the device.
            logTraffic("PARSED", "TRANSLATOR",
                       "Azimuth out of range: " + std::to_string(command.azimuth));
            text = k4::kReplyError;
        } else {
            const TranslationResult result = translate(command);
            if (!result.ok() && command.isValid()) {
                logInfo("[Session ", peer_, "] ", command.describe(), " -> ", result.describe(), "\n");
            }
            text = k4::formatReply(command, result, config_.moveStopFailurePolicy);
        }

        if (!reply(text)) {
            return;
        }
        ++commandsServed_;
    }
}

TranslationResult Session::translate(const Command& command) {
    switch (command.kind) {
        case Command::Kind::Query: {
            auto azimuth = transport_.queryPosition();
            if (!azimuth) {
                return TranslationResult::failed(azimuth.error());
            }
            return TranslationResult::position(*azimuth);
        }

        case Command::Kind::MoveTo:
        case Command::Kind::Stop: {
            auto ack = transport_.send(command);
            if (!ack) {
                return TranslationResult::failed(ack.error());
            }
            return TranslationResult::acknowledged();
        }

        case Command::Kind::Invalid:
            break;
    }
    return TranslationResult::failed(std::make_error_code(std::errc::invalid_argument));
}

bool Session::reply(const std::string& text) {
    if (auto ec = client_.write_all(text, config_.clientWriteTimeout); ec) {
        logError("[Session ", peer_, "] client write failed: ", ec.message(), "\n");
        return false;
    }
    logTraffic("REPLIED", "PROGRAM", text);
    return true;
}

void Session::interrupt() {
    client_.interrupt();
    transport_.interrupt();
}

void Session::close() {
    if (state_.load() == State::Closed) {
        return;
    }
    if (state_.load() == State::Active) {
        setState(State::Closing);
    }

    transport_.close();
    if (client_.close()) {
        logTraffic("CONNECTION", "PROXY", "Client disconnected");
    }
    setState(State::Closed);
}

} // namespace rotbridge::bridge
