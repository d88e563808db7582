#pragma once

#include <string>
#include <system_error>

namespace rotbridge::core {

/**
 * @brief Outcome of forwarding one Command to the rotator.
 *
 * `Position` carries the decoded azimuth (queries), `Acknowledged` covers
 * move/stop writes that went out, `Failed` carries the transport or decode
 * error.
 */
struct TranslationResult {
    enum class Kind {
        Position,
        Acknowledged,
        Failed
    };

    Kind kind = Kind::Failed;
    int azimuth = 0;
    std::error_code reason{};

    static TranslationResult position(int azimuth) {
        return TranslationResult{Kind::Position, azimuth, {}};
    }
    static TranslationResult acknowledged() {
        return TranslationResult{Kind::Acknowledged, 0, {}};
    }
    static TranslationResult failed(std::error_code reason) {
        return TranslationResult{Kind::Failed, 0, reason};
    }

    bool ok() const { return kind != Kind::Failed; }

    std::string describe() const;
};

} // namespace rotbridge::core
