#pragma once

#include <string>

namespace rotbridge::core {

/**
 * @brief Semantic rotator command, independent of either wire format.
 *
 * `azimuth` is only meaningful for `MoveTo`. The parser stores whatever digit
 * run the client sent; range checks happen at encode time.
 */
struct Command {
    enum class Kind {
        Query,
        MoveTo,
        Stop,
        Invalid
    };

    Kind kind = Kind::Invalid;
    int azimuth = 0;

    static Command query() { return Command{Kind::Query, 0}; }
    static Command moveTo(int azimuth) { return Command{Kind::MoveTo, azimuth}; }
    static Command stop() { return Command{Kind::Stop, 0}; }
    static Command invalid() { return Command{}; }

    bool isQuery() const { return kind == Kind::Query; }
    bool isMove() const { return kind == Kind::MoveTo; }
    bool isStop() const { return kind == Kind::Stop; }
    bool isValid() const { return kind != Kind::Invalid; }

    static const char* toString(Kind kind);
    std::string describe() const;
};

inline bool operator==(const Command& a, const Command& b) {
    if (a.kind != b.kind) return false;
    return a.kind != Command::Kind::MoveTo || a.azimuth == b.azimuth;
}

inline bool operator!=(const Command& a, const Command& b) {
    return !(a == b);
}

} // namespace rotbridge::core
