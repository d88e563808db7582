#include "rotbridge/core/Command.hpp"
#include "rotbridge/core/TranslationResult.hpp"

#include <sstream>

namespace rotbridge::core {

const char* Command::toString(Kind kind) {
    switch (kind) {
        case Kind::Query:   return "query";
        case Kind::MoveTo:  return "move";
        case Kind::Stop:    return "stop";
        case Kind::Invalid: return "invalid";
    }
    return "unknown";
}

std::string Command::describe() const {
    if (kind == Kind::MoveTo) {
        std::ostringstream os;
        os << "move to " << azimuth;
        return os.str();
    }
    return toString(kind);
}

std::string TranslationResult::describe() const {
    std::ostringstream os;
    switch (kind) {
        case Kind::Position:     os << "position " << azimuth; break;
        case Kind::Acknowledged: os << "acknowledged"; break;
        case Kind::Failed:       os << "failed: " << reason.message(); break;
    }
    return os.str();
}

} // namespace rotbridge::core
