#pragma once

#include "rotbridge/core/Expected.hpp"

#include <string_view>

namespace rotbridge::rt21 {

/**
 * @brief Extract the azimuth from a position reply such as `030;`.
 *
 * The first run of decimal digits wins; anything around it is ignored.
 * No digits at all is `std::errc::protocol_error` (never zero). A run too
 * long for `int` is `std::errc::result_out_of_range`.
 */
expected<int> decodeAzimuth(std::string_view response);

} // namespace rotbridge::rt21
