#pragma once

#include "syncmap/time_value.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace syncmap::detail {

/**
 * Two-pass repair of a zero-length fragment.
 *
 * plan_zero_length_repair() walks forward from the degenerate fragment and
 * records what every fragment of the chain must do, without touching
 * anything. apply_zero_length_repair() then rewrites the chain backward,
 * starting from the donor (or from the extended right edge).
 */

enum class MoveKind : uint8_t {
    enlarge, ///< Zero-length fragment: translate, then grow by amount
    move     ///< Short fragment: translate only
};

struct PendingMove {
    size_t index;
    MoveKind kind;
    TimeValue amount;
};

struct RepairPlan {
    std::vector<PendingMove> moves;
    TimeValue slack;                 ///< Total length the chain needs
    size_t next_index{0};            ///< First index past the examined chain
    std::optional<size_t> donor;     ///< Fragment that gives up `slack` of its length
    std::optional<TimeValue> anchor; ///< New end of the chain when there is no donor

    bool feasible() const noexcept { return donor.has_value() || anchor.has_value(); }

    size_t enlarged_count() const noexcept {
        return static_cast<size_t>(std::count_if(moves.begin(), moves.end(), [](const auto& m) {
            return m.kind == MoveKind::enlarge;
        }));
    }
};

/**
 * Measure the chain starting at the zero-length fragment `index`.
 *
 * Fragments after `index` shorter than the running slack join the chain;
 * the first one long enough becomes the donor. If the chain runs into
 * `max_index`, it may instead push its last end out to `right_limit`.
 *
 * @param fragments Fragments in timeline order
 * @param index Position of a zero-length fragment, index < max_index
 * @param max_index Exclusive end of the range being repaired
 * @param amount Length to manufacture per zero-length fragment (positive)
 * @param right_limit Furthest the chain may extend; nullopt for unbounded
 */
template <typename Fragment>
RepairPlan plan_zero_length_repair(std::span<const Fragment> fragments, size_t index,
                                   size_t max_index, TimeValue amount,
                                   std::optional<TimeValue> right_limit) {
    RepairPlan plan;
    plan.moves.push_back({index, MoveKind::enlarge, amount});
    plan.slack = amount;

    size_t j = index + 1;
    while (j < max_index && fragments[j].length() < plan.slack) {
        if (fragments[j].has_zero_length()) {
            plan.moves.push_back({j, MoveKind::enlarge, amount});
            plan.slack += amount;
        } else {
            plan.moves.push_back({j, MoveKind::move, TimeValue::zero()});
        }
        ++j;
    }
    plan.next_index = j;

    if (j == max_index) {
        TimeValue extended = fragments[j - 1].end() + plan.slack;
        if (!right_limit || extended <= *right_limit) {
            plan.anchor = extended;
        }
    } else {
        plan.donor = j;
    }
    return plan;
}

/**
 * Replay a feasible plan. Precondition: plan.feasible().
 */
template <typename Fragment>
void apply_zero_length_repair(std::span<Fragment> fragments, const RepairPlan& plan) {
    TimeValue current;
    if (plan.donor) {
        auto& donor = fragments[*plan.donor].interval();
        donor.shrink(plan.slack);
        current = donor.begin();
    } else {
        current = *plan.anchor;
    }

    for (auto it = plan.moves.rbegin(); it != plan.moves.rend(); ++it) {
        auto& interval = fragments[it->index].interval();
        interval.move_end_to(current);
        if (it->kind == MoveKind::enlarge) {
            interval.enlarge(it->amount);
        }
        current = interval.begin();
    }
}

} // namespace syncmap::detail
