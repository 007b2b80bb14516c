#pragma once

#include "core/types.hpp"

#include <QMutex>
#include <QWaitCondition>

#include <chrono>
#include <memory>
#include <optional>

namespace relayscout {

/**
 * CancelToken - shared cancellation signal with an optional deadline.
 *
 * Copies share state: cancelling one copy cancels all of them. A token
 * derived with `with_timeout()` is also cancelled when its parent is.
 *
 *   auto token = CancelToken::with_timeout(Millis{5000});
 *   while (!token.is_cancelled()) {
 *       ...
 *       token.wait_for(Millis{100});
 *   }
 */
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * A token that only ends when cancel() is called.
     */
    CancelToken();

    [[nodiscard]] static CancelToken with_timeout(Millis timeout);
    [[nodiscard]] static CancelToken with_deadline(Clock::time_point deadline);

    /**
     * Derive a child token that expires after `timeout` or when this one ends,
     * whichever comes first.
     */
    [[nodiscard]] CancelToken child_with_timeout(Millis timeout) const;

    void cancel() const;

    /**
     * True once cancel() was called on this token or an ancestor, or the
     * deadline has passed.
     */
    [[nodiscard]] bool is_cancelled() const;

    /**
     * True when the token ended by reaching its deadline rather than through
     * cancel().
     */
    [[nodiscard]] bool deadline_exceeded() const;

    [[nodiscard]] std::optional<Clock::time_point> deadline() const;

    /**
     * Time left until the deadline, clamped at zero. Without a deadline,
     * returns `fallback`.
     */
    [[nodiscard]] Millis remaining(Millis fallback) const;

    /**
     * Block for up to `duration`, waking early on cancellation.
     * @return true if the token is cancelled on return.
     */
    bool wait_for(Millis duration) const;

    /**
     * Block until `when`, waking early on cancellation. Returns at once
     * when `when` has already passed.
     * @return true if the token is cancelled on return.
     */
    bool wait_until(Clock::time_point when) const;

private:
    struct State {
        QMutex mu;
        QWaitCondition cv;
        bool cancelled = false;
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<State> parent;
    };

    explicit CancelToken(std::shared_ptr<State> state);

    static bool explicitly_cancelled(const std::shared_ptr<State>& state);
    static std::optional<Clock::time_point> effective_deadline(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
};

} // namespace relayscout
