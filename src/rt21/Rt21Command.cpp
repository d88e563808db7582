#include "rotbridge/rt21/Rt21Command.hpp"
#include "rotbridge/rt21/Rt21Config.hpp"

#include <iomanip>
#include <sstream>

namespace rotbridge::rt21 {

std::string encodeMove(int azimuth) {
    std::ostringstream os;
    os << config::RT21_MOVE_PREFIX
       << std::setw(3) << std::setfill('0') << azimuth
       << config::RT21_MOVE_SUFFIX;
    return os.str();
}

expected<std::string> encodeCommand(const Command& command) {
    switch (command.kind) {
        case Command::Kind::Stop:
            return std::string(config::RT21_STOP);

        case Command::Kind::MoveTo:
            if (command.azimuth < 0 || command.azimuth > config::RT21_MAX_WIRE_AZIMUTH) {
                return unexpected(std::make_error_code(std::errc::result_out_of_range));
            }
            return encodeMove(command.azimuth);

        case Command::Kind::Query:
            return unexpected(std::make_error_code(std::errc::operation_not_supported));

        case Command::Kind::Invalid:
            break;
    }
    return unexpected(std::make_error_code(std::errc::invalid_argument));
}

} // namespace rotbridge::rt21
