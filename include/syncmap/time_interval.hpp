#pragma once

#include "syncmap/expected.hpp"
#include "syncmap/time_value.hpp"

#include <algorithm>
#include <compare>
#include <optional>
#include <stdexcept>

#include <cstdint>

namespace syncmap {

/**
 * Errors from TimeInterval::create().
 */
enum class IntervalError : uint8_t {
    negative_begin, ///< begin < 0
    begin_after_end ///< begin > end
};

constexpr const char* interval_error_string(IntervalError err) noexcept {
    switch (err) {
        case IntervalError::negative_begin:
            return "Interval begin is negative";
        case IntervalError::begin_after_end:
            return "Interval begin is after its end";
        default:
            return "Unknown error";
    }
}

/**
 * Closed time interval [begin, end] with 0 <= begin <= end.
 *
 * Intervals order by begin, then by end. A zero-length interval is a point.
 *
 * The mutators are noexcept and saturate instead of failing, so none of
 * them can leave begin > end or a negative begin behind. Callers that need
 * a specific result (the fragment list does) check their preconditions
 * before calling.
 */
class TimeInterval {
public:
    constexpr TimeInterval() noexcept = default;

    /**
     * @throws std::invalid_argument if begin is negative or begin > end
     */
    TimeInterval(TimeValue begin, TimeValue end) : begin_(begin), end_(end) {
        if (auto err = validate(begin, end)) {
            throw std::invalid_argument(interval_error_string(*err));
        }
    }

    static expected<TimeInterval, IntervalError> create(TimeValue begin, TimeValue end) noexcept {
        if (auto err = validate(begin, end)) {
            return make_unexpected(*err);
        }
        TimeInterval interval;
        interval.begin_ = begin;
        interval.end_ = end;
        return interval;
    }

    constexpr TimeValue begin() const noexcept { return begin_; }
    constexpr TimeValue end() const noexcept { return end_; }
    constexpr TimeValue length() const noexcept { return end_ - begin_; }
    constexpr bool has_zero_length() const noexcept { return begin_ == end_; }

    /// True if begin <= point <= end
    constexpr bool contains(TimeValue point) const noexcept {
        return begin_ <= point && point <= end_;
    }

    /// True if this interval ends exactly where other begins
    constexpr bool is_adjacent_before(const TimeInterval& other) const noexcept {
        return end_ == other.begin_;
    }

    /// True if this interval begins exactly where other ends
    constexpr bool is_adjacent_after(const TimeInterval& other) const noexcept {
        return other.is_adjacent_before(*this);
    }

    /**
     * Set begin; returns false (and does nothing) if the result would be invalid.
     */
    constexpr bool set_begin(TimeValue value) noexcept {
        if (value.is_negative() || value > end_) {
            return false;
        }
        begin_ = value;
        return true;
    }

    /**
     * Set end; returns false (and does nothing) if the result would be invalid.
     */
    constexpr bool set_end(TimeValue value) noexcept {
        if (value < begin_) {
            return false;
        }
        end_ = value;
        return true;
    }

    /**
     * Shift both endpoints by delta, then clamp each endpoint.
     *
     * Clamping order: below at zero (unless allow_negative), below at
     * min_begin, above at max_end. Both endpoints go through the same
     * monotone clamp, so an interval pushed against a bound collapses
     * towards a point rather than inverting.
     */
    constexpr void offset(TimeValue delta, bool allow_negative = false,
                          std::optional<TimeValue> min_begin = std::nullopt,
                          std::optional<TimeValue> max_end = std::nullopt) noexcept {
        begin_ += delta;
        end_ += delta;
        auto clamp = [&](TimeValue v) {
            if (!allow_negative) {
                v = std::max(v, TimeValue::zero());
            }
            if (min_begin) {
                v = std::max(v, *min_begin);
            }
            if (max_end) {
                v = std::min(v, *max_end);
            }
            return v;
        };
        begin_ = clamp(begin_);
        end_ = clamp(end_);
    }

    /// Move begin forward by amount, stopping at end
    constexpr void shrink(TimeValue amount) noexcept {
        begin_ = std::clamp(begin_ + amount, TimeValue::zero(), end_);
    }

    /// Move begin backward by amount, stopping at zero
    constexpr void enlarge(TimeValue amount) noexcept {
        begin_ = std::clamp(begin_ - amount, TimeValue::zero(), end_);
    }

    /**
     * Translate the interval so that it ends at point, keeping its length.
     *
     * If point is shorter than the length, begin stops at zero.
     */
    constexpr void move_end_to(TimeValue point) noexcept {
        TimeValue len = length();
        end_ = std::max(point, TimeValue::zero());
        begin_ = std::max(end_ - len, TimeValue::zero());
    }

    constexpr auto operator<=>(const TimeInterval& other) const noexcept {
        if (begin_ != other.begin_) {
            return begin_ <=> other.begin_;
        }
        return end_ <=> other.end_;
    }

    constexpr bool operator==(const TimeInterval& other) const noexcept = default;

private:
    TimeValue begin_{};
    TimeValue end_{};

    static constexpr std::optional<IntervalError> validate(TimeValue begin,
                                                           TimeValue end) noexcept {
        if (begin.is_negative()) {
            return IntervalError::negative_begin;
        }
        if (begin > end) {
            return IntervalError::begin_after_end;
        }
        return std::nullopt;
    }
};

} // namespace syncmap
