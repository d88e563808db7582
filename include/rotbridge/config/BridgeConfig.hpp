#pragma once

#include "rotbridge/core/Expected.hpp"
#include "rotbridge/k4/ReplyFormatter.hpp"
#include "rotbridge/rt21/Rt21Config.hpp"
#include "rotbridge/rt21/Rt21Transport.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace rotbridge::config {

constexpr unsigned short LISTEN_PORT_DEFAULT = 6555;
constexpr const char* LISTEN_ADDRESS_DEFAULT = "0.0.0.0";

/**
 * @brief Every tunable of the bridge, with the defaults the RT21 setup ships with.
 */
struct BridgeConfig {
    std::string rt21Host = rt21::config::RT21_HOST_DEFAULT;
    unsigned short rt21Port = rt21::config::RT21_PORT_DEFAULT;

    std::string listenAddress = LISTEN_ADDRESS_DEFAULT;
    unsigned short listenPort = LISTEN_PORT_DEFAULT;

    std::chrono::milliseconds connectTimeout = rt21::config::RT21_CONNECT_TIMEOUT;
    std::chrono::milliseconds ackTimeout = rt21::config::RT21_ACK_TIMEOUT;
    std::chrono::milliseconds queryTimeout = rt21::config::RT21_QUERY_TIMEOUT;
    std::chrono::milliseconds clientWriteTimeout{1000};

    k4::MoveStopFailurePolicy moveStopFailurePolicy = k4::MoveStopFailurePolicy::ReportOk;

    bool probeOnStartup = true;
    bool selfTest = false;
    bool showHelp = false;

    rt21::Rt21Transport::Timeouts transportTimeouts() const;
    std::string describe() const;
};

/// Looks up one environment variable; returns nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Apply `ROTBRIDGE_*` environment overrides on top of @p config.
 * @return Error message naming the offending variable on bad input.
 */
expected<BridgeConfig, std::string>
applyEnvironment(BridgeConfig config, const EnvLookup& lookup);

/**
 * @brief Apply command-line overrides on top of @p config.
 * @param args Arguments without the program name.
 * @return Error message naming the offending option on bad input.
 */
expected<BridgeConfig, std::string>
applyArguments(BridgeConfig config, const std::vector<std::string>& args);

/// Defaults, then the process environment, then argv.
expected<BridgeConfig, std::string>
loadConfig(int argc, const char* const* argv);

std::string usage(const char* programName);

} // namespace rotbridge::config
