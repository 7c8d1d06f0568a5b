/**
 * @file test_roster_generator.cpp
 * @brief Unit tests for RosterGenerator.
 */

#include "roster/roster_generator.hpp"
#include "roster/validation.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <random>

using namespace squad_rotation;

static const Date START{std::chrono::days{20000}};

// ─── Specialist ──────────────────────────────

TEST(GeneratorTest, SpecialistRatedAtOneKind) {
    auto w = RosterGenerator::specialist("cb", "CB", 135.0, 0.8);
    EXPECT_EQ(w.id, "cb");
    ASSERT_TRUE(w.rating_at("CB").has_value());
    EXPECT_DOUBLE_EQ(w.rating_at("CB")->in_possession, 135.0);
    EXPECT_DOUBLE_EQ(w.familiarity_at("CB").out_of_possession, 0.8);
    EXPECT_FALSE(w.rating_at("ST").has_value());
    EXPECT_DOUBLE_EQ(w.familiarity_at("ST").in_possession, 0.0);
}

// ─── Layered squad ───────────────────────────

TEST(GeneratorTest, LayeredSquadShape) {
    auto formation = Formation::four_four_two();
    auto roster = RosterGenerator::layered_squad(formation, 3, 150.0, 10.0);

    ASSERT_EQ(roster.size(), 33u);
    EXPECT_EQ(roster[0].id, "GK_0");
    EXPECT_EQ(roster[11].id, "GK_1");
    EXPECT_EQ(roster[32].id, "LST_2");
    EXPECT_DOUBLE_EQ(roster[0].rating_at("GK")->in_possession, 150.0);
    EXPECT_DOUBLE_EQ(roster[22].rating_at("GK")->out_of_possession, 130.0);
    EXPECT_TRUE(validate_roster(roster).has_value());
}

// ─── Random squad ────────────────────────────

TEST(GeneratorTest, RandomSquadIsValidAndCoversKinds) {
    auto formation = Formation::four_three_three();
    std::mt19937 rng(7);
    auto roster = RosterGenerator::random_squad(40, formation, rng);

    ASSERT_EQ(roster.size(), 40u);
    EXPECT_EQ(roster.front().id, "w000");
    EXPECT_EQ(roster.back().id, "w039");
    EXPECT_TRUE(validate_roster(roster).has_value());

    for (const auto& slot : formation.slots) {
        bool covered = std::any_of(roster.begin(), roster.end(),
            [&](const Worker& w) { return w.rating_at(slot.kind).has_value(); });
        EXPECT_TRUE(covered) << slot.kind;
    }
}

TEST(GeneratorTest, RandomSquadIsSeedDeterministic) {
    auto formation = Formation::four_four_two();
    std::mt19937 a(42), b(42);
    auto first = RosterGenerator::random_squad(25, formation, a);
    auto second = RosterGenerator::random_squad(25, formation, b);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].ratings, second[i].ratings);
        EXPECT_EQ(first[i].state, second[i].state);
        EXPECT_EQ(first[i].profile, second[i].profile);
    }
}

// ─── Fixtures ────────────────────────────────

TEST(GeneratorTest, FixturesUseOffsetsAndImportances) {
    auto events = RosterGenerator::fixtures(START, {0, 3, 7},
                                            {Importance::High, Importance::Low},
                                            Formation::four_four_two());
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].id, "event_0");
    EXPECT_EQ(events[2].date, START + std::chrono::days{7});
    EXPECT_EQ(events[1].importance, Importance::Low);
    // Missing importances default to Medium
    EXPECT_EQ(events[2].importance, Importance::Medium);
    EXPECT_TRUE(validate_events(events).has_value());
}

TEST(GeneratorTest, FixtureRunIsEvenlySpaced) {
    auto events = RosterGenerator::fixture_run(START, 4, 3, Importance::Low, Formation::three_five_two());
    ASSERT_EQ(events.size(), 4u);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_EQ((events[i].date - events[i - 1].date).count(), 3);
        EXPECT_EQ(events[i].importance, Importance::Low);
        EXPECT_EQ(events[i].formation.name, events[0].formation.name);
    }
}
