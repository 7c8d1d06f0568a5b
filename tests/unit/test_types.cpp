/**
 * @file test_types.cpp
 * @brief Unit tests for core vocabulary types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace squad_rotation;

TEST(ImportanceTest, IndexIsDense) {
    EXPECT_EQ(index_of(Importance::High), 0u);
    EXPECT_EQ(index_of(Importance::Medium), 1u);
    EXPECT_EQ(index_of(Importance::Low), 2u);
    EXPECT_EQ(index_of(Importance::SharpnessBuilding), 3u);
    EXPECT_EQ(kAllImportances.size(), kImportanceLevels);
}

TEST(ImportanceTest, ToString) {
    EXPECT_EQ(to_string(Importance::High), "high");
    EXPECT_EQ(to_string(Importance::SharpnessBuilding), "sharpness");
}

TEST(ByImportanceTest, IndexedAccess) {
    ByImportance<double> table{{{3.0, 1.5, 0.5, 0.3}}};
    EXPECT_DOUBLE_EQ(table[Importance::High], 3.0);
    EXPECT_DOUBLE_EQ(table[Importance::Low], 0.5);

    table[Importance::Medium] = 2.0;
    EXPECT_DOUBLE_EQ(table.values[1], 2.0);
}

TEST(FamiliarityTierTest, Boundaries) {
    EXPECT_EQ(familiarity_tier(1.0), FamiliarityTier::Natural);
    EXPECT_EQ(familiarity_tier(0.90), FamiliarityTier::Natural);
    EXPECT_EQ(familiarity_tier(0.89), FamiliarityTier::Accomplished);
    EXPECT_EQ(familiarity_tier(0.65), FamiliarityTier::Accomplished);
    EXPECT_EQ(familiarity_tier(0.45), FamiliarityTier::Competent);
    EXPECT_EQ(familiarity_tier(0.44), FamiliarityTier::Unconvincing);
    EXPECT_EQ(familiarity_tier(0.25), FamiliarityTier::Unconvincing);
    EXPECT_EQ(familiarity_tier(0.1), FamiliarityTier::Awkward);
    EXPECT_EQ(familiarity_tier(0.0), FamiliarityTier::Awkward);
}

TEST(LoadCategoryTest, ToString) {
    EXPECT_EQ(to_string(LoadCategory::Fresh), "fresh");
    EXPECT_EQ(to_string(LoadCategory::Jaded), "jaded");
    EXPECT_EQ(to_string(TrainingIntensity::High), "high");
    EXPECT_EQ(to_string(FamiliarityTier::Competent), "competent");
}
