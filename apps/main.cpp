#include "rotbridge/bridge/Listener.hpp"
#include "rotbridge/config/BridgeConfig.hpp"
#include "rotbridge/core/CancellationToken.hpp"
#include "rotbridge/log/Log.hpp"
#include "rotbridge/net/NetService.hpp"
#include "rotbridge/rt21/Rt21Command.hpp"
#include "rotbridge/rt21/Rt21Transport.hpp"

#include <csignal>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace rotbridge;

namespace {

// Checks the RT21 command table against literal wire strings.
int runSelfTest() {
    const std::vector<std::pair<core::Command, std::string>> cases = {
        {core::Command::moveTo(0),   "AP0000\r;"},
        {core::Command::moveTo(35),  "AP0035\r;"},
        {core::Command::moveTo(180), "AP0180\r;"},
        {core::Command::moveTo(359), "AP0359\r;"},
        {core::Command::stop(),      ";"},
    };

    std::cout << "Testing RT21 command formatting:\n"
              << std::string(30, '-') << "\n";

    int failures = 0;
    for (const auto& [command, expectedWire] : cases) {
        auto wire = rt21::encodeCommand(command);
        const bool ok = wire && *wire == expectedWire;
        if (!ok) ++failures;
        std::cout << (ok ? "PASS " : "FAIL ") << command.describe() << " -> "
                  << (wire ? log::escapePayload(*wire) : wire.error().message())
                  << " (expected: " << log::escapePayload(expectedWire) << ")\n";
    }
    return failures == 0 ? 0 : 1;
}

// One-shot connection check; never fatal.
void probeDevice(const config::BridgeConfig& cfg) {
    std::cout << "Testing RT21 connection...\n";

    auto timeouts = cfg.transportTimeouts();
    timeouts.query = cfg.connectTimeout;
    rt21::Rt21Transport probe(timeouts);

    if (auto connected = probe.connect(cfg.rt21Host, cfg.rt21Port); !connected) {
        std::cout << "Warning: could not connect to RT21 device - "
                  << connected.error().message() << "\n\n";
        return;
    }

    if (auto azimuth = probe.queryPosition(); azimuth) {
        std::cout << "RT21 connected - current position: " << *azimuth << "\n\n";
    } else {
        std::cout << "Warning: RT21 connected but no usable response ("
                  << azimuth.error().message() << ")\n\n";
    }
    probe.close();
}

} // namespace

int main(int argc, char** argv) {
    auto loaded = config::loadConfig(argc, argv);
    if (!loaded) {
        std::cerr << "rotbridge: " << loaded.error() << "\n\n" << config::usage(argv[0]);
        return 2;
    }
    const config::BridgeConfig cfg = std::move(*loaded);

    if (cfg.showHelp) {
        std::cout << config::usage(argv[0]);
        return 0;
    }
    if (cfg.selfTest) {
        return runSelfTest();
    }

    std::cout << "=== ROTATOR PROTOCOL TRANSLATOR ===\n"
              << "Converts K4 rotator commands to RT21 format\n"
              << cfg.describe() << "\n\n";

    net::ensureNetService();

    if (cfg.probeOnStartup) {
        probeDevice(cfg);
    }

    core::CancellationToken token;
    bridge::Listener listener(cfg, token);
    if (auto opened = listener.open(); !opened) {
        std::cerr << "Failed to start server: " << opened.error().message() << "\n";
        return 1;
    }

    net::asio::signal_set signals(net::io_context(), SIGINT, SIGTERM);
    signals.async_wait([&listener](const std::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        logInfo("\nSignal ", signalNumber, " received, stopping\n");
        listener.stop();
    });

    std::cout << "Translator running. Press Ctrl+C to stop.\n"
              << "K4 clients can connect and disconnect as needed.\n\n";

    listener.run();

    std::error_code ignore;
    signals.cancel(ignore);
    std::cout << "\nTranslator stopped.\n";
    return 0;
}
