#pragma once

#include "rotbridge/core/Command.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rotbridge::k4 {

using core::Command;

/**
 * @brief Classify one K4-format request.
 *
 * Bytes outside 7-bit ASCII are dropped, surrounding whitespace
 * is trimmed, then the text is matched case-insensitively:
 * - `C...`            -> Query
 * - `M<digits>...`    -> MoveTo(digits), leading zeros allowed
 * - `S`, `STOP`, `;`  -> Stop
 * - anything else     -> Invalid
 *
 * Never throws; empty input is Invalid.
 */
Command parseCommand(std::string_view text);

Command parseCommand(const std::uint8_t* data, std::size_t size);

/// ASCII decode with invalid bytes dropped, then whitespace trimmed.
std::string normaliseRequest(std::string_view raw);

} // namespace rotbridge::k4
