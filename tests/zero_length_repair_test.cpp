#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <syncmap.hpp>

using namespace syncmap;

class ZeroLengthRepairTest : public ::testing::Test {
protected:
    static TimeValue t(std::string_view text) { return TimeValue::parse(text).value(); }

    // Build a list from "begin-end" bound pairs inserted in order
    static TextFragmentList make(std::string_view list_end,
                                 std::initializer_list<std::pair<const char*, const char*>> spans) {
        TextFragmentList list(t("0"), t(list_end));
        for (const auto& [b, e] : spans) {
            EXPECT_TRUE(list.add(TextFragment(TimeInterval(t(b), t(e)))));
        }
        return list;
    }

    static std::vector<std::pair<std::string, std::string>> bounds(const TextFragmentList& list) {
        std::vector<std::pair<std::string, std::string>> out;
        for (const auto& f : list) {
            out.emplace_back(f.begin().to_string(), f.end().to_string());
        }
        return out;
    }

    using Bounds = std::vector<std::pair<std::string, std::string>>;
};

// =============================================================================
// Donor shrinks
// =============================================================================

TEST_F(ZeroLengthRepairTest, SinglePointBorrowsFromNext) {
    auto list = make("2", {{"0", "0"}, {"0", "2"}});

    auto report = list.fix_zero_length_intervals(t("0.001"), 0, list.size());
    EXPECT_EQ(report.fixed, 1u);
    EXPECT_TRUE(report.complete());
    EXPECT_EQ(bounds(list), (Bounds{{"0.000", "0.001"}, {"0.001", "2.000"}}));
}

TEST_F(ZeroLengthRepairTest, ConsecutivePointsAccumulateSlack) {
    auto list = make("2", {{"0", "0"}, {"0", "0"}, {"0", "2"}});

    auto report = list.fix_zero_length_intervals(t("0.001"), 0, list.size());
    EXPECT_EQ(report.fixed, 2u);
    EXPECT_EQ(bounds(list),
              (Bounds{{"0.000", "0.001"}, {"0.001", "0.002"}, {"0.002", "2.000"}}));
}

TEST_F(ZeroLengthRepairTest, DefaultsUseOneMillisecondOverWholeList) {
    auto list = make("2", {{"0", "0"}, {"0", "2"}});
    list.fix_zero_length_intervals();
    EXPECT_EQ(bounds(list), (Bounds{{"0.000", "0.001"}, {"0.001", "2.000"}}));
}

TEST_F(ZeroLengthRepairTest, ShortFragmentsAreShiftedNotEnlarged) {
    // [1,1] needs 0.010; [1,1.004] is too short to give it, so it moves
    auto list = make("5", {{"0", "1"}, {"1", "1"}, {"1", "1.004"}, {"1.004", "5"}});

    auto report = list.fix_zero_length_intervals(t("0.01"));
    EXPECT_EQ(report.fixed, 1u);
    EXPECT_EQ(bounds(list), (Bounds{{"0.000", "1.000"},
                                    {"1.000", "1.010"},
                                    {"1.010", "1.014"},
                                    {"1.014", "5.000"}}));
    EXPECT_TRUE(list.has_adjacent_fragments_only());
    EXPECT_FALSE(list.has_zero_length_fragments());
}

TEST_F(ZeroLengthRepairTest, SeparatedPointsFixedIndependently) {
    auto list = make("10", {{"0", "0"}, {"0", "3"}, {"3", "3"}, {"3", "10"}});

    auto report = list.fix_zero_length_intervals(t("0.5"));
    EXPECT_EQ(report.fixed, 2u);
    EXPECT_EQ(bounds(list), (Bounds{{"0.000", "0.500"},
                                    {"0.500", "3.000"},
                                    {"3.000", "3.500"},
                                    {"3.500", "10.000"}}));
}

// =============================================================================
// Right edge extension
// =============================================================================

TEST_F(ZeroLengthRepairTest, TrailingPointExtendsIntoFreeRoom) {
    auto list = make("3", {{"0", "2"}, {"2", "2"}});

    auto report = list.fix_zero_length_intervals(t("0.001"));
    EXPECT_EQ(report.fixed, 1u);
    EXPECT_EQ(bounds(list), (Bounds{{"0.000", "2.000"}, {"2.000", "2.001"}}));
}

TEST_F(ZeroLengthRepairTest, TrailingPointWithoutRoomIsLeftAlone) {
    auto list = make("2", {{"0", "2"}, {"2", "2"}});
    auto before = bounds(list);

    auto report = list.fix_zero_length_intervals(t("0.001"));
    EXPECT_EQ(report.fixed, 0u);
    EXPECT_EQ(report.unfixable, 1u);
    EXPECT_FALSE(report.complete());
    EXPECT_EQ(bounds(list), before);
}

TEST_F(ZeroLengthRepairTest, UnboundedListAlwaysExtends) {
    TextFragmentList list(t("0"), std::nullopt);
    ASSERT_TRUE(list.add(TextFragment(TimeInterval(t("5"), t("5")))));

    auto report = list.fix_zero_length_intervals(t("1"));
    EXPECT_EQ(report.fixed, 1u);
    EXPECT_EQ(list[0].begin(), t("5"));
    EXPECT_EQ(list[0].end(), t("6"));
}

// =============================================================================
// Index range
// =============================================================================

TEST_F(ZeroLengthRepairTest, RangeLimitsScan) {
    auto list = make("10", {{"0", "0"}, {"0", "3"}, {"3", "3"}, {"3", "10"}});

    auto report = list.fix_zero_length_intervals(t("0.5"), 2, 4);
    EXPECT_EQ(report.fixed, 1u);
    EXPECT_TRUE(list[0].has_zero_length());
    EXPECT_EQ(list[2].end(), t("3.5"));
}

TEST_F(ZeroLengthRepairTest, RangeEndDoesNotExtendIntoNextFragment) {
    // Range [0, 2) ends on a point; growing it would overlap fragments[2]
    auto list = make("10", {{"0", "3"}, {"3", "3"}, {"3", "10"}});
    auto before = bounds(list);

    auto report = list.fix_zero_length_intervals(t("0.5"), 0, 2);
    EXPECT_EQ(report.unfixable, 1u);
    EXPECT_EQ(bounds(list), before);
}

TEST_F(ZeroLengthRepairTest, ExplicitZeroMaxIndexIsEmptyRange) {
    auto list = make("2", {{"0", "0"}, {"0", "2"}});
    auto before = bounds(list);

    auto report = list.fix_zero_length_intervals(t("0.001"), 0, 0);
    EXPECT_EQ(report.fixed, 0u);
    EXPECT_EQ(report.unfixable, 0u);
    EXPECT_EQ(bounds(list), before);
    EXPECT_FALSE(list.has_zero_length_fragments(0, 0));
}

TEST_F(ZeroLengthRepairTest, NonPositiveAmountIsNoOp) {
    auto list = make("2", {{"0", "0"}, {"0", "2"}});
    auto before = bounds(list);

    auto report = list.fix_zero_length_intervals(TimeValue::zero());
    EXPECT_EQ(report.fixed, 0u);
    EXPECT_EQ(report.unfixable, 0u);
    EXPECT_EQ(bounds(list), before);
}

TEST_F(ZeroLengthRepairTest, NothingToFix) {
    auto list = make("4", {{"0", "2"}, {"2", "4"}});
    auto report = list.fix_zero_length_intervals();
    EXPECT_EQ(report.fixed, 0u);
    EXPECT_TRUE(report.complete());
}

// =============================================================================
// Planning in isolation
// =============================================================================

TEST_F(ZeroLengthRepairTest, PlanRecordsChainWithoutMutating) {
    auto list = make("2", {{"0", "0"}, {"0", "0"}, {"0", "0.0015"}, {"0.0015", "2"}});
    auto before = bounds(list);

    auto plan = detail::plan_zero_length_repair(list.fragments(), 0, list.size(), t("0.001"),
                                                list.end_time());
    ASSERT_EQ(plan.moves.size(), 3u);
    EXPECT_EQ(plan.moves[0].kind, detail::MoveKind::enlarge);
    EXPECT_EQ(plan.moves[1].kind, detail::MoveKind::enlarge);
    EXPECT_EQ(plan.moves[2].kind, detail::MoveKind::move);
    EXPECT_EQ(plan.slack, t("0.002"));
    EXPECT_EQ(plan.donor, std::optional<size_t>(3));
    EXPECT_EQ(plan.next_index, 3u);
    EXPECT_EQ(plan.enlarged_count(), 2u);
    EXPECT_TRUE(plan.feasible());
    EXPECT_EQ(bounds(list), before);
}

TEST_F(ZeroLengthRepairTest, PlanInfeasibleAtFullList) {
    auto list = make("1", {{"0", "1"}, {"1", "1"}});
    auto plan = detail::plan_zero_length_repair(list.fragments(), 1, list.size(), t("0.001"),
                                                list.end_time());
    EXPECT_FALSE(plan.feasible());
    EXPECT_FALSE(plan.donor.has_value());
    EXPECT_FALSE(plan.anchor.has_value());
    EXPECT_EQ(plan.next_index, 2u);
}

TEST_F(ZeroLengthRepairTest, ApplyReplaysBackwardFromDonor) {
    auto list = make("2", {{"0", "0"}, {"0", "0"}, {"0", "0.0015"}, {"0.0015", "2"}});
    list.fix_zero_length_intervals(t("0.001"));
    EXPECT_EQ(bounds(list), (Bounds{{"0.000", "0.001"},
                                    {"0.001", "0.002"},
                                    {"0.002", "0.0035"},
                                    {"0.0035", "2.000"}}));
}
