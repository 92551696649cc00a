// include/syncmap/detail/time_math.hpp
#pragma once

#include <limits>
#include <utility>

#include <cstdint>

namespace syncmap::detail {

/**
 * Carry/borrow arithmetic shared by TimeValue and its parser.
 *
 * Values are (seconds, picoseconds) pairs with picoseconds in [0, 10^12).
 * Intermediates are int64_t; callers clamp to storage range afterward.
 * Overflow saturates, it never throws.
 */

/// Picoseconds per second (10^12)
inline constexpr uint64_t PICOS_PER_SEC = 1'000'000'000'000ULL;

/// Maximum valid picoseconds value (one less than a full second)
inline constexpr uint64_t MAX_PICOS = PICOS_PER_SEC - 1;

/// Number of decimal digits carried below the second
inline constexpr int FRACTION_DIGITS = 12;

/**
 * Normalize (seconds, picoseconds) to canonical form with floor semantics.
 *
 * -1.5s becomes {-2, 500e9}; picoseconds >= 10^12 carry into seconds.
 *
 * @param sec Seconds (may need adjustment)
 * @param picos Picoseconds (may be out of range, including INT64_MIN)
 * @return Pair of (normalized_sec, normalized_picos) where picos is in [0, 10^12)
 */
constexpr auto normalize(int64_t sec, int64_t picos) noexcept -> std::pair<int64_t, uint64_t> {
    if (picos >= static_cast<int64_t>(PICOS_PER_SEC)) {
        int64_t carry = picos / static_cast<int64_t>(PICOS_PER_SEC);
        sec += carry;
        picos %= static_cast<int64_t>(PICOS_PER_SEC);
        return {sec, static_cast<uint64_t>(picos)};
    }

    if (picos < 0) {
        // 0 - cast avoids UB on INT64_MIN
        uint64_t abs_picos = 0ULL - static_cast<uint64_t>(picos);
        uint64_t borrow = (abs_picos - 1) / PICOS_PER_SEC + 1;
        sec -= static_cast<int64_t>(borrow);
        uint64_t result_picos = borrow * PICOS_PER_SEC - abs_picos;
        return {sec, result_picos};
    }

    return {sec, static_cast<uint64_t>(picos)};
}

/**
 * Add two (seconds, picoseconds) values. Result is NOT clamped.
 */
constexpr auto add_time(int64_t sec_a, uint64_t picos_a, int64_t sec_b,
                        uint64_t picos_b) noexcept -> std::pair<int64_t, uint64_t> {
    return normalize(sec_a + sec_b, static_cast<int64_t>(picos_a) + static_cast<int64_t>(picos_b));
}

/**
 * Subtract (sec_b, picos_b) from (sec_a, picos_a). Result is NOT clamped.
 */
constexpr auto sub_time(int64_t sec_a, uint64_t picos_a, int64_t sec_b,
                        uint64_t picos_b) noexcept -> std::pair<int64_t, uint64_t> {
    return normalize(sec_a - sec_b, static_cast<int64_t>(picos_a) - static_cast<int64_t>(picos_b));
}

/**
 * Clamp seconds to the int32_t storage range of TimeValue.
 *
 * On saturation the picoseconds are pinned too, so that TimeValue::max()
 * and TimeValue::min() are exact sentinels.
 *
 * @param sec Seconds value (may exceed int32_t range)
 * @param picos Reference to picoseconds (modified on saturation)
 * @return Clamped seconds value
 */
constexpr int32_t clamp_seconds(int64_t sec, uint64_t& picos) noexcept {
    if (sec > std::numeric_limits<int32_t>::max()) {
        picos = MAX_PICOS;
        return std::numeric_limits<int32_t>::max();
    }
    if (sec < std::numeric_limits<int32_t>::min()) {
        picos = 0;
        return std::numeric_limits<int32_t>::min();
    }
    return static_cast<int32_t>(sec);
}

} // namespace syncmap::detail
