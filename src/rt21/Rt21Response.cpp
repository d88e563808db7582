#include "rotbridge/rt21/Rt21Response.hpp"

#include <limits>

namespace rotbridge::rt21 {

expected<int> decodeAzimuth(std::string_view response) {
    std::size_t pos = 0;
    while (pos < response.size() && (response[pos] < '0' || response[pos] > '9')) {
        ++pos;
    }
    if (pos == response.size()) {
        return unexpected(std::make_error_code(std::errc::protocol_error));
    }

    constexpr long long kMax = std::numeric_limits<int>::max();
    long long value = 0;
    for (; pos < response.size() && response[pos] >= '0' && response[pos] <= '9'; ++pos) {
        value = value * 10 + (response[pos] - '0');
        if (value > kMax) {
            return unexpected(std::make_error_code(std::errc::result_out_of_range));
        }
    }
    return static_cast<int>(value);
}

} // namespace rotbridge::rt21
