#pragma once

#include "syncmap/detail/zero_length_repair.hpp"
#include "syncmap/expected.hpp"
#include "syncmap/fragment.hpp"
#include "syncmap/log.hpp"
#include "syncmap/relative_position.hpp"
#include "syncmap/time_interval.hpp"
#include "syncmap/time_value.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace syncmap {

/**
 * Recoverable errors from SyncMapFragmentList operations.
 *
 * Bad list bounds throw std::invalid_argument from the constructor and bad
 * indices throw std::out_of_range instead.
 */
enum class FragmentListError : uint8_t {
    out_of_bounds, ///< Fragment interval lies outside the list [begin, end]
    overlap,       ///< Two fragments share more than one boundary point
    not_sorted     ///< Sorted insertion into a list not guaranteed sorted
};

constexpr const char* fragment_list_error_string(FragmentListError err) noexcept {
    switch (err) {
        case FragmentListError::out_of_bounds:
            return "Fragment interval outside list boundaries";
        case FragmentListError::overlap:
            return "Fragment interval overlaps another fragment";
        case FragmentListError::not_sorted:
            return "Sorted insertion requires a list guaranteed sorted";
        default:
            return "Unknown error";
    }
}

/**
 * Outcome of fix_zero_length_intervals(), counted in zero-length fragments.
 */
struct ZeroLengthRepair {
    size_t fixed{0};     ///< Fragments given a positive length
    size_t unfixable{0}; ///< Fragments left untouched for lack of room

    bool complete() const noexcept { return unfixable == 0; }
};

/**
 * Timeline partitioned into fragments that may touch but never overlap.
 *
 * ## Invariants (while is_guaranteed_sorted())
 * - every fragment lies within [begin_time(), end_time()] (unset = unbounded)
 * - fragments are in ascending interval order
 * - each adjacent pair shares at most one boundary point
 *   (is_allowed_position(relative_position(a, b)))
 *
 * add(f, false) skips ordering and overlap checks and clears the sorted flag;
 * only the boundary invariant holds until sort() succeeds again.
 *
 * ## Failure policy
 * Every operation validates before mutating. move_end() and
 * fix_zero_length_intervals() are best effort: when they cannot act they
 * change nothing and raise nothing; their return value reports what happened.
 *
 * Not thread-safe. The list owns its fragments; no references are shared.
 *
 * @tparam Payload Opaque value carried by each fragment
 */
template <typename Payload>
class SyncMapFragmentList {
public:
    using value_type = SyncMapFragment<Payload>;
    using container_type = std::vector<value_type>;
    using const_iterator = typename container_type::const_iterator;
    using size_type = typename container_type::size_type;

    /// Length given to each zero-length fragment by default (1 ms)
    static constexpr TimeValue default_zero_length_offset() noexcept {
        return TimeValue::from_milliseconds(1);
    }

    /**
     * Create an empty list spanning [begin, end]; nullopt leaves a side unbounded.
     *
     * @throws std::invalid_argument if begin is negative or begin > end
     */
    explicit SyncMapFragmentList(std::optional<TimeValue> begin = TimeValue::zero(),
                                 std::optional<TimeValue> end = std::nullopt)
        : begin_(begin),
          end_(end) {
        if (begin_ && begin_->is_negative()) {
            throw std::invalid_argument("List begin is negative");
        }
        if (begin_ && end_ && *begin_ > *end_) {
            throw std::invalid_argument("List begin is after list end");
        }
    }

    std::optional<TimeValue> begin_time() const noexcept { return begin_; }
    std::optional<TimeValue> end_time() const noexcept { return end_; }

    size_type size() const noexcept { return fragments_.size(); }
    bool empty() const noexcept { return fragments_.empty(); }

    const value_type& operator[](size_type index) const noexcept { return fragments_[index]; }

    /// @throws std::out_of_range if index >= size()
    const value_type& at(size_type index) const { return fragments_.at(index); }

    /// Fragments in stored order
    std::span<const value_type> fragments() const noexcept { return fragments_; }

    const_iterator begin() const noexcept { return fragments_.begin(); }
    const_iterator end() const noexcept { return fragments_.end(); }

    bool is_guaranteed_sorted() const noexcept { return sorted_; }

    /**
     * Add a fragment.
     *
     * With sort = true the fragment goes to its ordered position (after any
     * equal fragments) provided it overlaps no existing fragment. With
     * sort = false it is appended unchecked and the list stops being
     * guaranteed sorted.
     *
     * @return out_of_bounds, not_sorted (sort requested on an unsorted list)
     *         or overlap; the list is unchanged on error
     */
    [[nodiscard]] expected<void, FragmentListError> add(value_type fragment, bool sort = true) {
        if (auto bounded = check_boundaries(fragment.interval()); !bounded) {
            return bounded;
        }
        if (!sort) {
            fragments_.push_back(std::move(fragment));
            sorted_ = false;
            return {};
        }
        if (!sorted_) {
            return make_unexpected(FragmentListError::not_sorted);
        }
        if (auto clear = check_overlap(fragment.interval()); !clear) {
            return clear;
        }
        auto pos = std::upper_bound(fragments_.begin(), fragments_.end(), fragment);
        fragments_.insert(pos, std::move(fragment));
        return {};
    }

    /**
     * Restore ordering after unchecked appends.
     *
     * On an overlap the fragments stay in their new order but the list is
     * still not guaranteed sorted.
     */
    [[nodiscard]] expected<void, FragmentListError> sort() {
        if (sorted_) {
            return {};
        }
        std::stable_sort(fragments_.begin(), fragments_.end());
        for (size_type i = 0; i + 1 < fragments_.size(); ++i) {
            const auto& current = fragments_[i].interval();
            const auto& next = fragments_[i + 1].interval();
            if (!may_share_timeline(current, next)) {
                log::logger()->debug("sort: fragments {} and {} overlap ({})", i, i + 1,
                                     relative_position_string(relative_position(current, next)));
                return make_unexpected(FragmentListError::overlap);
            }
        }
        sorted_ = true;
        return {};
    }

    /**
     * Overwrite the fragment at index.
     *
     * On a sorted list the replacement must keep its place in the order and
     * stay clear of both neighbours.
     *
     * @throws std::out_of_range if index >= size()
     */
    [[nodiscard]] expected<void, FragmentListError> replace(size_type index, value_type fragment) {
        if (index >= fragments_.size()) {
            throw std::out_of_range("Fragment index out of range");
        }
        if (auto bounded = check_boundaries(fragment.interval()); !bounded) {
            return bounded;
        }
        if (sorted_) {
            const auto& interval = fragment.interval();
            if (index > 0) {
                const auto& prev = fragments_[index - 1].interval();
                if (interval < prev || !may_share_timeline(prev, interval)) {
                    return make_unexpected(FragmentListError::overlap);
                }
            }
            if (index + 1 < fragments_.size()) {
                const auto& next = fragments_[index + 1].interval();
                if (next < interval || !may_share_timeline(interval, next)) {
                    return make_unexpected(FragmentListError::overlap);
                }
            }
        }
        fragments_[index] = std::move(fragment);
        return {};
    }

    /**
     * Remove the fragments at the given indices (duplicates ignored).
     *
     * @throws std::out_of_range if any index >= size(); nothing is removed then
     */
    void remove(std::vector<size_type> indices) {
        std::sort(indices.begin(), indices.end());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
        if (!indices.empty() && indices.back() >= fragments_.size()) {
            throw std::out_of_range("Fragment index out of range");
        }
        for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
            fragments_.erase(fragments_.begin() + static_cast<std::ptrdiff_t>(*it));
        }
    }

    /**
     * Move the boundary shared by fragments index and index + 1 to value.
     *
     * Does nothing unless value lies within the list bounds and within
     * [fragments[index].begin, fragments[index + 1].end], index + 1 < size(),
     * and the two fragments already share that boundary.
     *
     * @return true if the boundary moved
     */
    bool move_end(size_type index, TimeValue value) {
        // index >= size() also catches a wrapped negative index, where index + 1 == 0
        if ((begin_ && value < *begin_) || (end_ && value > *end_) ||
            index >= fragments_.size() || index + 1 >= fragments_.size()) {
            trace_refused_move(index, value, "out of range");
            return false;
        }
        auto& current = fragments_[index].interval();
        auto& next = fragments_[index + 1].interval();
        if (value > next.end() || value < current.begin() || !current.is_adjacent_before(next)) {
            trace_refused_move(index, value, "fragments not adjacent or value outside pair");
            return false;
        }
        // Both setters succeed under the checks above
        return current.set_end(value) && next.set_begin(value);
    }

    /**
     * Shift every fragment by delta, clamping each endpoint into the list bounds.
     *
     * Fragments are clamped independently: fragments pushed against a bound
     * collapse there and may become zero-length.
     */
    void offset(TimeValue delta) noexcept {
        for (auto& fragment : fragments_) {
            fragment.interval().offset(delta, false, begin_, end_);
        }
    }

    /**
     * Give each zero-length fragment in [min_index, max_index) a length of
     * `amount`, taking the room from the fragments that follow it.
     *
     * For a zero-length fragment the fragments after it that are shorter
     * than the running slack are shifted (zero-length ones are also
     * enlarged, adding to the slack); the first fragment long enough
     * shrinks from its begin by the slack. If the range ends first, the
     * last fragment of the range is pushed right instead, as far as the
     * list end (or the begin of fragments[max_index]) allows. A fragment
     * for which neither works is left as it is.
     *
     * Assumes the fragments in the range are contiguous.
     *
     * @param amount Length to give each zero-length fragment; non-positive is a no-op
     * @param min_index First index examined
     * @param max_index One past the last index examined (default and cap: size());
     *                  an explicit 0 is an empty range, not the whole list
     */
    ZeroLengthRepair fix_zero_length_intervals(
        TimeValue amount = default_zero_length_offset(), size_type min_index = 0,
        std::optional<size_type> max_index = std::nullopt) {
        ZeroLengthRepair report;
        if (!amount.is_positive()) {
            return report;
        }
        const size_type stop = std::min(max_index.value_or(fragments_.size()), fragments_.size());
        const std::optional<TimeValue> right_limit =
            stop < fragments_.size() ? std::optional<TimeValue>(fragments_[stop].begin()) : end_;

        size_type i = min_index;
        while (i < stop) {
            if (!fragments_[i].has_zero_length()) {
                ++i;
                continue;
            }
            auto plan = detail::plan_zero_length_repair(std::span<const value_type>(fragments_), i,
                                                        stop, amount, right_limit);
            if (plan.feasible()) {
                detail::apply_zero_length_repair(std::span<value_type>(fragments_), plan);
                report.fixed += plan.enlarged_count();
            } else {
                report.unfixable += plan.enlarged_count();
                log::logger()->debug(
                    "fix_zero_length_intervals: no room to fix fragment {} (needs {})", i,
                    plan.slack.to_string());
            }
            i = plan.next_index;
        }
        return report;
    }

    /**
     * True if any fragment in [min_index, max_index) has zero length.
     *
     * @throws std::out_of_range if max_index > size() or min_index > max_index
     */
    bool has_zero_length_fragments(size_type min_index = 0,
                                   std::optional<size_type> max_index = std::nullopt) const {
        auto [first, last] = resolve_range(min_index, max_index);
        return std::any_of(fragments_.begin() + first, fragments_.begin() + last,
                           [](const value_type& f) { return f.has_zero_length(); });
    }

    /**
     * True if each fragment in [min_index, max_index) ends where the next begins.
     *
     * @throws std::out_of_range if max_index > size() or min_index > max_index
     */
    bool has_adjacent_fragments_only(size_type min_index = 0,
                                     std::optional<size_type> max_index = std::nullopt) const {
        auto [first, last] = resolve_range(min_index, max_index);
        for (size_type i = first; i + 1 < last; ++i) {
            if (!fragments_[i].interval().is_adjacent_before(fragments_[i + 1].interval())) {
                return false;
            }
        }
        return true;
    }

    /// Indices of the fragments of the given type, ascending
    std::vector<size_type> indices_of(FragmentType type) const {
        std::vector<size_type> out;
        for (size_type i = 0; i < fragments_.size(); ++i) {
            if (fragments_[i].fragment_type() == type) {
                out.push_back(i);
            }
        }
        return out;
    }

private:
    std::optional<TimeValue> begin_;
    std::optional<TimeValue> end_;
    container_type fragments_;
    bool sorted_{true};

    expected<void, FragmentListError> check_boundaries(const TimeInterval& interval) const {
        if ((begin_ && interval.begin() < *begin_) || (end_ && interval.end() > *end_)) {
            log::logger()->debug("rejected [{}, {}]: outside list boundaries",
                                 interval.begin().to_string(), interval.end().to_string());
            return make_unexpected(FragmentListError::out_of_bounds);
        }
        return {};
    }

    // Full scan: the allowed positions are not monotonic in either endpoint,
    // so bisecting on begin alone would miss an interval nested in a long one.
    expected<void, FragmentListError> check_overlap(const TimeInterval& interval) const {
        for (const auto& existing : fragments_) {
            auto pos = relative_position(existing.interval(), interval);
            if (!is_allowed_position(pos)) {
                log::logger()->debug("rejected [{}, {}]: {} against [{}, {}]",
                                     interval.begin().to_string(), interval.end().to_string(),
                                     relative_position_string(pos),
                                     existing.begin().to_string(), existing.end().to_string());
                return make_unexpected(FragmentListError::overlap);
            }
        }
        return {};
    }

    static void trace_refused_move(size_type index, TimeValue value, const char* reason) {
        auto logger = log::logger();
        if (logger->should_log(spdlog::level::trace)) {
            logger->trace("move_end({}, {}): {}", index, value.to_string(), reason);
        }
    }

    std::pair<size_type, size_type> resolve_range(size_type min_index,
                                                  std::optional<size_type> max_index) const {
        const size_type last = max_index.value_or(fragments_.size());
        if (last > fragments_.size() || min_index > last) {
            throw std::out_of_range("Invalid fragment index range");
        }
        return {min_index, last};
    }
};

using TextFragment = SyncMapFragment<std::string>;
using TextFragmentList = SyncMapFragmentList<std::string>;

} // namespace syncmap
