#pragma once

#include "rotbridge/core/Command.hpp"
#include "rotbridge/core/Expected.hpp"

#include <string>

namespace rotbridge::rt21 {

using core::Command;

/**
 * @brief Encode a move/stop command in RT21 wire syntax.
 *
 * - Stop        -> `;`
 * - MoveTo(n)   -> `AP0nnn\r;` for 0 <= n <= 999
 *
 * Errors:
 * - MoveTo outside 0..999: `std::errc::result_out_of_range`. The three-digit
 *   field cannot carry it and the value is never truncated or clamped.
 * - Query: `std::errc::operation_not_supported` (the transport sends the fixed
 *   `AI1\r;` literal itself).
 * - Invalid: `std::errc::invalid_argument`.
 */
expected<std::string> encodeCommand(const Command& command);

/// `AP0nnn\r;` without range checks; callers validate first.
std::string encodeMove(int azimuth);

} // namespace rotbridge::rt21
