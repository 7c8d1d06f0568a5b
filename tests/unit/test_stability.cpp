/**
 * @file test_stability.cpp
 * @brief Unit tests for assignment history and stability costs.
 */

#include "solver/stability.hpp"

#include <gtest/gtest.h>

using namespace squad_rotation;

namespace {

Assignment lineup_of(std::vector<std::pair<WorkerId, SlotId>> entries) {
    Assignment a;
    for (auto& [worker, slot] : entries) {
        SlotAssignment entry;
        entry.worker = worker;
        entry.slot = slot;
        a.lineup.push_back(entry);
    }
    return a;
}

}  // namespace

TEST(AssignmentHistoryTest, PreviousSlot) {
    AssignmentHistory history;
    EXPECT_TRUE(history.empty());
    EXPECT_FALSE(history.previous_slot("a").has_value());

    history.record(lineup_of({{"a", "RB"}, {"b", "GK"}}));
    history.record(lineup_of({{"a", "LB"}}));

    EXPECT_EQ(history.size(), 2u);
    EXPECT_EQ(history.previous_slot("a").value_or(""), "LB");
    // b did not start the most recent event
    EXPECT_FALSE(history.previous_slot("b").has_value());
}

TEST(AssignmentHistoryTest, ConsecutiveRun) {
    AssignmentHistory history;
    history.record(lineup_of({{"a", "RB"}}));
    history.record(lineup_of({{"a", "GK"}}));
    history.record(lineup_of({{"a", "GK"}}));
    history.record(lineup_of({{"a", "GK"}}));

    EXPECT_EQ(history.consecutive_in("a", "GK"), 3u);
    EXPECT_EQ(history.consecutive_in("a", "RB"), 0u);
    EXPECT_EQ(history.consecutive_in("z", "GK"), 0u);
}

TEST(AssignmentHistoryTest, KeepsBoundedWindow) {
    AssignmentHistory history(2);
    for (int i = 0; i < 5; ++i) {
        history.record(lineup_of({{"a", "GK"}}));
    }
    EXPECT_EQ(history.size(), 2u);
    EXPECT_EQ(history.consecutive_in("a", "GK"), 2u);
}

TEST(StabilityCostTest, NoHistoryIsNeutral) {
    AssignmentHistory history;
    EXPECT_DOUBLE_EQ(stability_cost(history, "a", "GK", StabilityConfig{}), 0.0);
}

TEST(StabilityCostTest, ContinuityAndSwitch) {
    StabilityConfig config;
    AssignmentHistory history;
    history.record(lineup_of({{"a", "RB"}}));

    EXPECT_DOUBLE_EQ(stability_cost(history, "a", "RB", config), -2.0);
    EXPECT_DOUBLE_EQ(stability_cost(history, "a", "LB", config), 5.0);
    EXPECT_DOUBLE_EQ(stability_cost(history, "b", "LB", config), 0.0);
}

TEST(StabilityCostTest, AnchoredWorkerCostsMoreToMove) {
    StabilityConfig config;
    AssignmentHistory history;
    for (int i = 0; i < 3; ++i) {
        history.record(lineup_of({{"a", "RCB"}}));
    }
    // inertia * switch + anchor_multiplier * switch
    EXPECT_DOUBLE_EQ(stability_cost(history, "a", "LCB", config), 15.0);
    EXPECT_DOUBLE_EQ(stability_cost(history, "a", "RCB", config), -2.0);

    config.anchor_threshold = 4;
    EXPECT_DOUBLE_EQ(stability_cost(history, "a", "LCB", config), 5.0);
}
