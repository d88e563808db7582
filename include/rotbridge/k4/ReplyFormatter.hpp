#pragma once

#include "rotbridge/core/Command.hpp"
#include "rotbridge/core/TranslationResult.hpp"

#include <string>

namespace rotbridge::k4 {

using core::Command;
using core::TranslationResult;

constexpr const char* kReplyOk = "OK\r\n";
constexpr const char* kReplyError = "ERROR\r\n";

/**
 * @brief What the client sees when a move/stop could not be delivered.
 *
 * `ReportOk` keeps the behaviour existing K4 controllers were built against:
 * move and stop always answer `OK`, and the next position query reveals
 * whether the rotator actually moved. `ReportError` surfaces the failure.
 */
enum class MoveStopFailurePolicy {
    ReportOk,
    ReportError
};

/// `AZ=nnn\r\n` with the azimuth zero-padded to three digits.
std::string formatPosition(int azimuth);

/**
 * @brief Render the K4 reply for @p command given what the rotator did.
 *
 * - Query:     Position -> `AZ=nnn`, anything else -> `ERROR`
 * - Move/Stop: `OK`, unless Failed under MoveStopFailurePolicy::ReportError
 * - Invalid:   `ERROR`
 */
std::string formatReply(const Command& command,
                        const TranslationResult& result,
                        MoveStopFailurePolicy policy = MoveStopFailurePolicy::ReportOk);

} // namespace rotbridge::k4
