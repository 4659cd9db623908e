#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace Signet {

/**
 * @brief Cancellation and deadline signal passed down by the caller
 *
 * A default-constructed context never cancels. Copies share the same
 * cancellation flag, so a caller may hand a copy to an operation and cancel
 * it from another thread.
 */
class OperationContext {
public:
    using Clock = std::chrono::steady_clock;

    OperationContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    static OperationContext withTimeout(Clock::duration timeout) {
        OperationContext ctx;
        ctx.deadline_ = Clock::now() + timeout;
        return ctx;
    }

    void cancel() const { cancelled_->store(true); }

    bool isCancelled() const { return cancelled_->load(); }

    bool deadlineExceeded() const {
        return deadline_ && Clock::now() >= *deadline_;
    }

    /// True once the operation should stop for either reason
    bool done() const { return isCancelled() || deadlineExceeded(); }

    std::optional<Clock::time_point> deadline() const { return deadline_; }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace Signet
