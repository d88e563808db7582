#include "rotbridge/k4/ReplyFormatter.hpp"

#include <iomanip>
#include <sstream>

namespace rotbridge::k4 {

std::string formatPosition(int azimuth) {
    std::ostringstream os;
    os << "AZ=" << std::setw(3) << std::setfill('0') << azimuth << "\r\n";
    return os.str();
}

std::string formatReply(const Command& command,
                        const TranslationResult& result,
                        MoveStopFailurePolicy policy) {
    switch (command.kind) {
        case Command::Kind::Query:
            if (result.kind == TranslationResult::Kind::Position) {
                return formatPosition(result.azimuth);
            }
            return kReplyError;

        case Command::Kind::MoveTo:
        case Command::Kind::Stop:
            if (!result.ok() && policy == MoveStopFailurePolicy::ReportError) {
                return kReplyError;
            }
            return kReplyOk;

        case Command::Kind::Invalid:
            break;
    }
    return kReplyError;
}

} // namespace rotbridge::k4
