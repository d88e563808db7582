#include "rotbridge/config/BridgeConfig.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>

namespace rotbridge::config {
namespace {

bool parseUnsigned(const std::string& text, unsigned long long max, unsigned long long& out) {
    if (text.empty()) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0' || value > max) {
        return false;
    }
    out = value;
    return true;
}

bool parsePort(const std::string& text, unsigned short& out) {
    unsigned long long value = 0;
    if (!parseUnsigned(text, std::numeric_limits<unsigned short>::max(), value)) {
        return false;
    }
    out = static_cast<unsigned short>(value);
    return true;
}

bool parseMillis(const std::string& text, std::chrono::milliseconds& out) {
    unsigned long long value = 0;
    if (!parseUnsigned(text, 24ull * 60 * 60 * 1000, value)) {
        return false;
    }
    out = std::chrono::milliseconds{static_cast<long long>(value)};
    return true;
}

bool parseFlag(const std::string& text, bool& out) {
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        out = true;
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string invalidValue(const std::string& name, const std::string& value) {
    return "invalid value '" + value + "' for " + name;
}

enum class Setting {
    Rt21Host,
    Rt21Port,
    ListenAddress,
    ListenPort,
    ConnectTimeout,
    AckTimeout,
    QueryTimeout,
    ReportMoveFailures
};

// Shared by the environment and argv paths; returns false on a bad value.
bool applySetting(BridgeConfig& config, Setting setting, const std::string& value) {
    switch (setting) {
        case Setting::Rt21Host:
            if (value.empty()) return false;
            config.rt21Host = value;
            return true;
        case Setting::Rt21Port:
            return parsePort(value, config.rt21Port) && config.rt21Port != 0;
        case Setting::ListenAddress:
            if (value.empty()) return false;
            config.listenAddress = value;
            return true;
        case Setting::ListenPort:
            return parsePort(value, config.listenPort);
        case Setting::ConnectTimeout:
            return parseMillis(value, config.connectTimeout) && config.connectTimeout.count() > 0;
        case Setting::AckTimeout:
            return parseMillis(value, config.ackTimeout) && config.ackTimeout.count() > 0;
        case Setting::QueryTimeout:
            return parseMillis(value, config.queryTimeout);
        case Setting::ReportMoveFailures: {
            bool report = false;
            if (!parseFlag(value, report)) return false;
            config.moveStopFailurePolicy = report ? k4::MoveStopFailurePolicy::ReportError
                                                  : k4::MoveStopFailurePolicy::ReportOk;
            return true;
        }
    }
    return false;
}

struct Binding {
    const char* envName;
    const char* option;
    Setting setting;
};

constexpr Binding kBindings[] = {
    {"ROTBRIDGE_RT21_HOST",           "--rt21-host",          Setting::Rt21Host},
    {"ROTBRIDGE_RT21_PORT",           "--rt21-port",          Setting::Rt21Port},
    {"ROTBRIDGE_LISTEN_ADDRESS",      "--listen-address",     Setting::ListenAddress},
    {"ROTBRIDGE_LISTEN_PORT",         "--listen-port",        Setting::ListenPort},
    {"ROTBRIDGE_CONNECT_TIMEOUT_MS",  "--connect-timeout-ms", Setting::ConnectTimeout},
    {"ROTBRIDGE_ACK_TIMEOUT_MS",      "--ack-timeout-ms",     Setting::AckTimeout},
    {"ROTBRIDGE_QUERY_TIMEOUT_MS",    "--query-timeout-ms",   Setting::QueryTimeout},
    {"ROTBRIDGE_REPORT_MOVE_FAILURES", nullptr,               Setting::ReportMoveFailures},
};

} // namespace

rt21::Rt21Transport::Timeouts BridgeConfig::transportTimeouts() const {
    rt21::Rt21Transport::Timeouts timeouts;
    timeouts.connect = connectTimeout;
    timeouts.ack = ackTimeout;
    timeouts.query = queryTimeout;
    return timeouts;
}

std::string BridgeConfig::describe() const {
    std::ostringstream os;
    os << "listen=" << listenAddress << ":" << listenPort
       << " rt21=" << rt21Host << ":" << rt21Port
       << " connect=" << connectTimeout.count() << "ms"
       << " ack=" << ackTimeout.count() << "ms"
       << " query=";
    if (queryTimeout.count() == 0) {
        os << "unbounded";
    } else {
        os << queryTimeout.count() << "ms";
    }
    os << " move-failures="
       << (moveStopFailurePolicy == k4::MoveStopFailurePolicy::ReportError ? "error" : "ok");
    return os.str();
}

expected<BridgeConfig, std::string>
applyEnvironment(BridgeConfig config, const EnvLookup& lookup) {
    if (!lookup) {
        return config;
    }
    for (const auto& binding : kBindings) {
        const char* raw = lookup(binding.envName);
        if (raw == nullptr) {
            continue;
        }
        const std::string value(raw);
        if (!applySetting(config, binding.setting, value)) {
            return unexpected(invalidValue(binding.envName, value));
        }
    }
    return config;
}

expected<BridgeConfig, std::string>
applyArguments(BridgeConfig config, const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            continue;
        }
        if (arg == "--self-test" || arg == "test") {
            config.selfTest = true;
            continue;
        }
        if (arg == "--no-probe") {
            config.probeOnStartup = false;
            continue;
        }
        if (arg == "--report-move-failures") {
            config.moveStopFailurePolicy = k4::MoveStopFailurePolicy::ReportError;
            continue;
        }

        // --option value  or  --option=value
        std::string name = arg;
        std::string value;
        bool haveValue = false;
        if (const auto eq = arg.find('='); eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            haveValue = true;
        }

        const Binding* match = nullptr;
        for (const auto& binding : kBindings) {
            if (binding.option != nullptr && name == binding.option) {
                match = &binding;
                break;
            }
        }
        if (match == nullptr) {
            return unexpected("unknown option '" + arg + "'");
        }

        if (!haveValue) {
            if (i + 1 >= args.size()) {
                return unexpected(std::string("missing value for ") + match->option);
            }
            value = args[++i];
        }

        if (!applySetting(config, match->setting, value)) {
            return unexpected(invalidValue(match->option, value));
        }
    }
    return config;
}

expected<BridgeConfig, std::string>
loadConfig(int argc, const char* const* argv) {
    auto fromEnv = applyEnvironment(BridgeConfig{}, [](const char* name) {
        return std::getenv(name);
    });
    if (!fromEnv) {
        return fromEnv;
    }

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return applyArguments(std::move(*fromEnv), args);
}

std::string usage(const char* programName) {
    std::ostringstream os;
    os << "Usage: " << (programName ? programName : "rotbridge") << " [options]\n"
       << "\n"
       << "Bridges K4-format rotator clients to an RT21 rotator controller.\n"
       << "\n"
       << "  --rt21-host HOST          RT21 address (default " << rt21::config::RT21_HOST_DEFAULT << ")\n"
       << "  --rt21-port PORT          RT21 TCP port (default " << rt21::config::RT21_PORT_DEFAULT << ")\n"
       << "  --listen-address ADDR     address to accept clients on (default " << LISTEN_ADDRESS_DEFAULT << ")\n"
       << "  --listen-port PORT        port to accept clients on (default " << LISTEN_PORT_DEFAULT << ")\n"
       << "  --connect-timeout-ms MS   RT21 connect timeout (default "
       << rt21::config::RT21_CONNECT_TIMEOUT.count() << ")\n"
       << "  --ack-timeout-ms MS       wait for move/stop acknowledgment (default "
       << rt21::config::RT21_ACK_TIMEOUT.count() << ")\n"
       << "  --query-timeout-ms MS     wait for position reply, 0 = forever (default 0)\n"
       << "  --report-move-failures    answer ERROR when a move/stop cannot be sent\n"
       << "  --no-probe                skip the startup RT21 position check\n"
       << "  --self-test               check the RT21 command table and exit\n"
       << "  --help                    show this text\n"
       << "\n"
       << "Environment: ROTBRIDGE_RT21_HOST, ROTBRIDGE_RT21_PORT, ROTBRIDGE_LISTEN_ADDRESS,\n"
       << "ROTBRIDGE_LISTEN_PORT, ROTBRIDGE_CONNECT_TIMEOUT_MS, ROTBRIDGE_ACK_TIMEOUT_MS,\n"
       << "ROTBRIDGE_QUERY_TIMEOUT_MS, ROTBRIDGE_REPORT_MOVE_FAILURES (1/0).\n";
    return os.str();
}

} // namespace rotbridge::config
