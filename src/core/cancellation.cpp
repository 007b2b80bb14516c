#include "core/cancellation.hpp"

#include <algorithm>

namespace relayscout {
namespace {

// Upper bound on a single sleep so that cancellation of a parent token,
// which does not notify children, is still observed promptly.
constexpr Millis kMaxWaitSlice{50};

} // namespace

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken::CancelToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

CancelToken CancelToken::with_timeout(Millis timeout) {
    return with_deadline(Clock::now() + timeout);
}

CancelToken CancelToken::with_deadline(Clock::time_point deadline) {
    auto state = std::make_shared<State>();
    state->deadline = deadline;
    return CancelToken(std::move(state));
}

CancelToken CancelToken::child_with_timeout(Millis timeout) const {
    auto state = std::make_shared<State>();
    state->deadline = Clock::now() + timeout;
    state->parent = state_;
    return CancelToken(std::move(state));
}

void CancelToken::cancel() const {
    QMutexLocker lock(&state_->mu);
    state_->cancelled = true;
    state_->cv.wakeAll();
}

bool CancelToken::explicitly_cancelled(const std::shared_ptr<State>& state) {
    for (auto s = state; s; s = s->parent) {
        QMutexLocker lock(&s->mu);
        if (s->cancelled) return true;
    }
    return false;
}

std::optional<CancelToken::Clock::time_point>
CancelToken::effective_deadline(const std::shared_ptr<State>& state) {
    std::optional<Clock::time_point> result;
    for (auto s = state; s; s = s->parent) {
        QMutexLocker lock(&s->mu);
        if (s->deadline && (!result || *s->deadline < *result)) {
            result = s->deadline;
        }
    }
    return result;
}

bool CancelToken::is_cancelled() const {
    return explicitly_cancelled(state_) || deadline_exceeded();
}

bool CancelToken::deadline_exceeded() const {
    const auto d = effective_deadline(state_);
    return d && Clock::now() >= *d;
}

std::optional<CancelToken::Clock::time_point> CancelToken::deadline() const {
    return effective_deadline(state_);
}

Millis CancelToken::remaining(Millis fallback) const {
    const auto d = effective_deadline(state_);
    if (!d) return fallback;
    const auto left = std::chrono::duration_cast<Millis>(*d - Clock::now());
    return std::max(left, Millis{0});
}

bool CancelToken::wait_for(Millis duration) const {
    const auto until = Clock::now() + duration;
    while (!is_cancelled()) {
        auto now = Clock::now();
        if (now >= until) return false;

        auto slice_end = std::min(until, now + kMaxWaitSlice);
        if (const auto d = effective_deadline(state_)) {
            slice_end = std::min(slice_end, *d);
        }

        const auto slice = std::chrono::duration_cast<Millis>(slice_end - now);
        QMutexLocker lock(&state_->mu);
        if (!state_->cancelled) {
            state_->cv.wait(&state_->mu, static_cast<unsigned long>(std::max<Millis::rep>(slice.count(), 1)));
        }
    }
    return true;
}

bool CancelToken::wait_until(Clock::time_point when) const {
    const auto left = std::chrono::duration_cast<Millis>(when - Clock::now());
    return wait_for(std::max(left, Millis{0}));
}

} // namespace relayscout
