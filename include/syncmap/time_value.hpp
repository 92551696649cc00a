#pragma once

#include "syncmap/detail/time_math.hpp"
#include "syncmap/expected.hpp"

#include <compare>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <cmath>
#include <cstdint>
#include <cstdio>

namespace syncmap {

/**
 * Errors from TimeValue::parse().
 */
enum class TimeParseError : uint8_t {
    no_digits,                ///< Input is empty or carries only a sign/decimal point
    invalid_character,        ///< Character other than sign, digits and one '.'
    too_many_fraction_digits, ///< Non-zero digit beyond picosecond precision
    out_of_range              ///< Whole seconds do not fit the storage range
};

/**
 * Convert TimeParseError to human-readable string.
 */
constexpr const char* time_parse_error_string(TimeParseError err) noexcept {
    switch (err) {
        case TimeParseError::no_digits:
            return "No digits in time value";
        case TimeParseError::invalid_character:
            return "Invalid character in time value";
        case TimeParseError::too_many_fraction_digits:
            return "Time value exceeds picosecond precision";
        case TimeParseError::out_of_range:
            return "Time value out of range";
        default:
            return "Unknown error";
    }
}

/**
 * Exact time value with picosecond resolution.
 *
 * ## Storage
 * int32_t seconds + uint64_t picoseconds, picoseconds always in [0, 10^12).
 * Negative values use floor representation:
 * `-1.5 seconds` = `{seconds: -2, picoseconds: 500,000,000,000}`.
 *
 * ## Exactness
 * Addition and subtraction are exact integer operations, so repeated
 * offsets of a timeline never drift. Decimal strings parse exactly via
 * parse(); only from_seconds(double) and to_seconds() involve rounding.
 *
 * ## Overflow Policy
 * Arithmetic saturates to min()/max() (about +/-68 years). No exceptions.
 *
 * Negative values are legal TimeValues (an offset can be negative); it is
 * TimeInterval and SyncMapFragmentList that reject negative bounds.
 */
class TimeValue {
public:
    static constexpr uint64_t PICOSECONDS_PER_SECOND = detail::PICOS_PER_SEC;
    static constexpr uint64_t PICOSECONDS_PER_MILLISECOND = 1'000'000'000ULL;
    static constexpr uint64_t PICOSECONDS_PER_MICROSECOND = 1'000'000ULL;
    static constexpr uint64_t PICOSECONDS_PER_NANOSECOND = 1'000ULL;

    static constexpr uint64_t MAX_PICOSECONDS = detail::MAX_PICOS;

    static constexpr TimeValue min() noexcept {
        return TimeValue(std::numeric_limits<int32_t>::min(), 0);
    }

    static constexpr TimeValue max() noexcept {
        return TimeValue(std::numeric_limits<int32_t>::max(), MAX_PICOSECONDS);
    }

    static constexpr TimeValue zero() noexcept { return TimeValue(0, 0); }

    constexpr TimeValue() noexcept = default;

    static constexpr TimeValue from_picoseconds(int64_t ps) noexcept {
        auto [sec, picos] = detail::normalize(0, ps);
        return TimeValue(detail::clamp_seconds(sec, picos), picos);
    }

    static constexpr TimeValue from_nanoseconds(int64_t ns) noexcept {
        return from_scaled(ns, PICOSECONDS_PER_NANOSECOND);
    }

    static constexpr TimeValue from_microseconds(int64_t us) noexcept {
        return from_scaled(us, PICOSECONDS_PER_MICROSECOND);
    }

    static constexpr TimeValue from_milliseconds(int64_t ms) noexcept {
        return from_scaled(ms, PICOSECONDS_PER_MILLISECOND);
    }

    static constexpr TimeValue from_seconds(int64_t s) noexcept {
        uint64_t picos = 0;
        int32_t sec = detail::clamp_seconds(s, picos);
        return TimeValue(sec, picos);
    }

    // Checked factory from double - nullopt on NaN, infinity or overflow
    static std::optional<TimeValue> from_seconds(double s) noexcept {
        if (!std::isfinite(s)) {
            return std::nullopt;
        }

        double int_part;
        double frac_part = std::modf(s, &int_part);

        constexpr double max_sec = static_cast<double>(std::numeric_limits<int32_t>::max());
        constexpr double min_sec = static_cast<double>(std::numeric_limits<int32_t>::min());
        if (int_part > max_sec || int_part < min_sec) {
            return std::nullopt;
        }

        auto sec = static_cast<int64_t>(int_part);
        auto picos = static_cast<int64_t>(
            std::llround(frac_part * static_cast<double>(PICOSECONDS_PER_SECOND)));
        auto [norm_sec, norm_picos] = detail::normalize(sec, picos);
        if (norm_sec > std::numeric_limits<int32_t>::max() ||
            norm_sec < std::numeric_limits<int32_t>::min()) {
            return std::nullopt;
        }
        return TimeValue(static_cast<int32_t>(norm_sec), norm_picos);
    }

    /**
     * Parse an exact decimal string such as "0.001", "-12.5" or "3".
     *
     * At most 12 significant fractional digits are accepted; trailing
     * zeros beyond that are ignored.
     */
    static expected<TimeValue, TimeParseError> parse(std::string_view text) noexcept {
        size_t pos = 0;
        bool negative = false;
        if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
            negative = text[0] == '-';
            ++pos;
        }

        // One past INT32_MAX whole seconds already overflows either sign
        constexpr uint64_t whole_limit = 1ULL << 31;

        bool any_digit = false;
        uint64_t whole = 0;
        for (; pos < text.size() && text[pos] != '.'; ++pos) {
            char c = text[pos];
            if (c < '0' || c > '9') {
                return make_unexpected(TimeParseError::invalid_character);
            }
            whole = whole * 10 + static_cast<uint64_t>(c - '0');
            if (whole > whole_limit) {
                return make_unexpected(TimeParseError::out_of_range);
            }
            any_digit = true;
        }

        uint64_t fraction = 0;
        int digits = 0;
        if (pos < text.size()) {
            ++pos; // skip '.'
            for (; pos < text.size(); ++pos) {
                char c = text[pos];
                if (c < '0' || c > '9') {
                    return make_unexpected(TimeParseError::invalid_character);
                }
                any_digit = true;
                auto digit = static_cast<uint64_t>(c - '0');
                if (digits < detail::FRACTION_DIGITS) {
                    fraction = fraction * 10 + digit;
                    ++digits;
                } else if (digit != 0) {
                    return make_unexpected(TimeParseError::too_many_fraction_digits);
                }
            }
        }

        if (!any_digit) {
            return make_unexpected(TimeParseError::no_digits);
        }
        for (; digits < detail::FRACTION_DIGITS; ++digits) {
            fraction *= 10;
        }

        if (!negative) {
            if (whole > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
                return make_unexpected(TimeParseError::out_of_range);
            }
            return TimeValue(static_cast<int32_t>(whole), fraction);
        }

        if (whole == whole_limit && fraction > 0) {
            return make_unexpected(TimeParseError::out_of_range);
        }
        auto [sec, picos] =
            detail::normalize(-static_cast<int64_t>(whole), -static_cast<int64_t>(fraction));
        return TimeValue(static_cast<int32_t>(sec), picos);
    }

    constexpr int32_t seconds() const noexcept { return seconds_; }
    constexpr uint64_t picoseconds() const noexcept { return picoseconds_; }

    // Total picoseconds; saturates beyond about +/-106 days
    constexpr int64_t total_picoseconds() const noexcept {
        constexpr int64_t max_safe_sec =
            std::numeric_limits<int64_t>::max() / static_cast<int64_t>(PICOSECONDS_PER_SECOND);
        constexpr int64_t min_safe_sec =
            std::numeric_limits<int64_t>::min() / static_cast<int64_t>(PICOSECONDS_PER_SECOND);

        if (seconds_ > max_safe_sec) {
            return std::numeric_limits<int64_t>::max();
        }
        if (seconds_ < min_safe_sec) {
            return std::numeric_limits<int64_t>::min();
        }

        return static_cast<int64_t>(seconds_) * static_cast<int64_t>(PICOSECONDS_PER_SECOND) +
               static_cast<int64_t>(picoseconds_);
    }

    constexpr double to_seconds() const noexcept {
        return static_cast<double>(seconds_) +
               static_cast<double>(picoseconds_) / static_cast<double>(PICOSECONDS_PER_SECOND);
    }

    /**
     * Exact decimal rendering with at least three fractional digits.
     *
     * "0.001", "2.000", "1.2345", "-0.500".
     */
    std::string to_string() const {
        TimeValue magnitude = abs();
        std::string out = is_negative() ? "-" : "";
        out += std::to_string(magnitude.seconds_);

        char frac[detail::FRACTION_DIGITS + 1];
        std::snprintf(frac, sizeof(frac), "%012llu",
                      static_cast<unsigned long long>(magnitude.picoseconds_));
        size_t keep = detail::FRACTION_DIGITS;
        while (keep > 3 && frac[keep - 1] == '0') {
            --keep;
        }
        out += '.';
        out.append(frac, keep);
        return out;
    }

    constexpr bool is_zero() const noexcept { return seconds_ == 0 && picoseconds_ == 0; }
    constexpr bool is_negative() const noexcept { return seconds_ < 0; }
    constexpr bool is_positive() const noexcept {
        return seconds_ > 0 || (seconds_ == 0 && picoseconds_ > 0);
    }

    // Saturates for min()
    constexpr TimeValue abs() const noexcept { return is_negative() ? -(*this) : *this; }

    constexpr TimeValue operator-() const noexcept {
        if (*this == min()) {
            return max();
        }
        if (picoseconds_ == 0) {
            return TimeValue(-seconds_, 0);
        }
        return TimeValue(-seconds_ - 1, PICOSECONDS_PER_SECOND - picoseconds_);
    }

    constexpr TimeValue& operator+=(TimeValue other) noexcept {
        auto [sec, picos] =
            detail::add_time(seconds_, picoseconds_, other.seconds_, other.picoseconds_);
        seconds_ = detail::clamp_seconds(sec, picos);
        picoseconds_ = picos;
        return *this;
    }

    constexpr TimeValue& operator-=(TimeValue other) noexcept {
        auto [sec, picos] =
            detail::sub_time(seconds_, picoseconds_, other.seconds_, other.picoseconds_);
        seconds_ = detail::clamp_seconds(sec, picos);
        picoseconds_ = picos;
        return *this;
    }

    friend constexpr TimeValue operator+(TimeValue lhs, TimeValue rhs) noexcept {
        lhs += rhs;
        return lhs;
    }

    friend constexpr TimeValue operator-(TimeValue lhs, TimeValue rhs) noexcept {
        lhs -= rhs;
        return lhs;
    }

    constexpr auto operator<=>(const TimeValue& other) const noexcept {
        if (seconds_ != other.seconds_) {
            return seconds_ <=> other.seconds_;
        }
        return picoseconds_ <=> other.picoseconds_;
    }

    constexpr bool operator==(const TimeValue& other) const noexcept {
        return seconds_ == other.seconds_ && picoseconds_ == other.picoseconds_;
    }

private:
    int32_t seconds_{0};
    uint64_t picoseconds_{0}; // Always in [0, PICOSECONDS_PER_SECOND)

    constexpr TimeValue(int32_t sec, uint64_t picos) noexcept : seconds_(sec), picoseconds_(picos) {}

    static constexpr TimeValue from_scaled(int64_t count, uint64_t picos_per_unit) noexcept {
        const auto unit = static_cast<int64_t>(picos_per_unit);
        if (count > std::numeric_limits<int64_t>::max() / unit) {
            return max();
        }
        if (count < std::numeric_limits<int64_t>::min() / unit) {
            return min();
        }
        return from_picoseconds(count * unit);
    }
};

/**
 * Check if a TimeValue has saturated to min() or max().
 */
constexpr bool saturated(const TimeValue& t) noexcept {
    return t == TimeValue::max() || t == TimeValue::min();
}

} // namespace syncmap
