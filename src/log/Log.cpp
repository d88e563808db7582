#include "rotbridge/log/Log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace rotbridge::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();

// Wall-clock HH:MM:SS.mmm in local time.
std::string timestampNow() {
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream os;
    os << std::put_time(&local, "%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << millis;
    return os.str();
}

} // namespace

void setInfoLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
}

void setErrorLogHandler(LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
}

void logInfo(std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = infoHandler;
    }
    if (handler) {
        handler(message);
    }
}

void logError(std::string_view message) {
    LogHandler handler;
    {
        std::lock_guard lock(sinkMutex);
        handler = errorHandler;
    }
    if (handler) {
        handler(message);
    }
}

std::string escapePayload(std::string_view payload) {
    std::ostringstream os;
    os << '\'';
    for (char c : payload) {
        const auto byte = static_cast<unsigned char>(c);
        switch (c) {
            case '\r': os << "\\r"; break;
            case '\n': os << "\\n"; break;
            case '\t': os << "\\t"; break;
            case '\\': os << "\\\\"; break;
            case '\'': os << "\\'"; break;
            default:
                if (byte < 0x20 || byte >= 0x7F) {
                    os << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                       << static_cast<int>(byte) << std::dec;
                } else {
                    os << c;
                }
        }
    }
    os << '\'';
    return os.str();
}

void logTraffic(std::string_view direction, std::string_view channel, std::string_view payload) {
    logInfo("[", timestampNow(), "] ", direction, ' ', channel, ": ",
            escapePayload(payload), '\n');
}

} // namespace rotbridge::log
