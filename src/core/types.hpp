#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <type_traits>

namespace relayscout {

using Millis = std::chrono::milliseconds;

/**
 * Timestamp - wall-clock instant with millisecond resolution.
 *
 * Used as the "last seen" stamp of a discovered device. Ordering is what
 * deduplication relies on: a strictly later stamp replaces an earlier one.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    /**
     * True for the default-constructed (epoch) value, i.e. "never seen".
     */
    [[nodiscard]] constexpr bool is_zero() const noexcept { return millis_ == 0; }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    int64_t millis_;
};

static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

} // namespace relayscout
