#pragma once

#include <chrono>
#include <cstddef>

namespace rotbridge::rt21::config {

/**
 * @brief Constants that define RT21 networking and wire behaviour.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units and makes it easy to tune the integration in one place.
 */

// Networking ------------------------------------------------------------------
constexpr const char* RT21_HOST_DEFAULT = "192.168.1.8";
constexpr unsigned short RT21_PORT_DEFAULT = 6555;
constexpr std::chrono::milliseconds RT21_CONNECT_TIMEOUT{5000};
constexpr std::chrono::milliseconds RT21_ACK_TIMEOUT{2000};
constexpr std::chrono::milliseconds RT21_QUERY_TIMEOUT{0};    // 0 = wait for the device indefinitely
constexpr std::size_t RT21_READ_CHUNK = 1024;

// Wire format -----------------------------------------------------------------
constexpr const char* RT21_QUERY_POSITION = "AI1\r;";
constexpr const char* RT21_STOP = ";";
constexpr const char* RT21_MOVE_PREFIX = "AP0";
constexpr const char* RT21_MOVE_SUFFIX = "\r;";
constexpr int RT21_MAX_WIRE_AZIMUTH = 999;                   // three-digit field

} // namespace rotbridge::rt21::config
