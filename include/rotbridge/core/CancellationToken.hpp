#pragma once

#include <atomic>
#include <memory>

namespace rotbridge::core {

/**
 * @brief Shared stop flag handed to the Listener and to every Session.
 *
 * Copies observe the same flag. `cancel()` only flips the flag; code blocked
 * inside a socket read does not see it until that read completes or the
 * socket is interrupted by its owner.
 */
class CancellationToken {
public:
    CancellationToken()
    : cancelled_(std::make_shared<std::atomic<bool>>(false))
    {}

    void cancel() { cancelled_->store(true, std::memory_order_relaxed); }

    bool isCancelled() const { return cancelled_->load(std::memory_order_relaxed); }

    explicit operator bool() const { return !isCancelled(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace rotbridge::core
