/**
 * @file test_formation_evaluator.cpp
 * @brief Unit tests for parallel formation comparison.
 */

#include "planning/formation_evaluator.hpp"
#include "roster/roster_generator.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace squad_rotation;

namespace {

const Date START{std::chrono::days{20000}};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<std::vector<std::string>> lines) : lines_(std::move(lines)) {}
    void write(std::string_view json_line) override { lines_->emplace_back(json_line); }
    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> lines_;
};

std::vector<ConstraintSet> rest_every_event(const WorkerId& worker, size_t events) {
    std::vector<ConstraintSet> sets(events);
    for (auto& set : sets) set.forced_rest.push_back(worker);
    return sets;
}

}  // namespace

class FormationEvaluatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.executor.thread_count = 2;
    }

    Config config_ = default_config();
    Roster roster_ = RosterGenerator::layered_squad(Formation::four_four_two(), 2, 150.0, 10.0);
    std::vector<Event> events_ = RosterGenerator::fixture_run(
        START, 3, 4, Importance::Medium, Formation::four_four_two());
};

TEST_F(FormationEvaluatorTest, WithFormationReplacesEveryEvent) {
    auto replaced = with_formation(events_, Formation::four_three_three());
    ASSERT_EQ(replaced.size(), events_.size());
    for (size_t i = 0; i < replaced.size(); ++i) {
        EXPECT_EQ(replaced[i].formation.name, "4-3-3");
        EXPECT_EQ(replaced[i].id, events_[i].id);
        EXPECT_EQ(replaced[i].date, events_[i].date);
    }
    EXPECT_EQ(events_[0].formation.name, "4-4-2");
}

TEST_F(FormationEvaluatorTest, InfeasibleFormationIsReportedNotChosen) {
    std::vector<FormationCandidate> candidates{
        {.formation = Formation::four_four_two()},
        {.formation = Formation::four_three_three()},
    };
    FormationEvaluator evaluator(config_);
    auto evaluation = evaluator.evaluate(roster_, events_, candidates);

    ASSERT_EQ(evaluation.plans.size(), 2u);
    EXPECT_EQ(evaluation.successes(), 1u);
    ASSERT_TRUE(evaluation.best.has_value());
    EXPECT_EQ(*evaluation.best, 0u);
    ASSERT_FALSE(evaluation.plans[1].has_value());
    EXPECT_EQ(evaluation.plans[1].error().code, ErrorCode::InfeasibleAssignment);
}

TEST_F(FormationEvaluatorTest, TiesGoToEarlierCandidate) {
    std::vector<FormationCandidate> candidates{
        {.formation = Formation::four_four_two()},
        {.formation = Formation::four_four_two()},
    };
    FormationEvaluator evaluator(config_);
    auto evaluation = evaluator.evaluate(roster_, events_, candidates);

    EXPECT_EQ(evaluation.successes(), 2u);
    EXPECT_EQ(evaluation.best.value_or(99), 0u);
    EXPECT_DOUBLE_EQ(evaluation.plans[0]->total_gss, evaluation.plans[1]->total_gss);
}

TEST_F(FormationEvaluatorTest, CandidateConstraintsApply) {
    std::vector<FormationCandidate> candidates{
        {.formation = Formation::four_four_two(), .constraints = rest_every_event("GK_0", 3)},
        {.formation = Formation::four_four_two()},
    };
    FormationEvaluator evaluator(config_);
    auto evaluation = evaluator.evaluate(roster_, events_, candidates);

    ASSERT_EQ(evaluation.successes(), 2u);
    EXPECT_EQ(evaluation.best.value_or(99), 1u);
    EXPECT_EQ(evaluation.plans[0]->starts("GK_0"), 0u);
    EXPECT_LT(evaluation.plans[0]->total_gss, evaluation.plans[1]->total_gss);
}

TEST_F(FormationEvaluatorTest, NothingFeasible) {
    std::vector<FormationCandidate> candidates{
        {.formation = Formation::four_three_three()},
        {.formation = Formation::three_five_two()},
    };
    FormationEvaluator evaluator(config_);
    auto evaluation = evaluator.evaluate(roster_, events_, candidates);

    EXPECT_EQ(evaluation.successes(), 0u);
    EXPECT_FALSE(evaluation.best.has_value());
}

TEST_F(FormationEvaluatorTest, LogsRejectionAndSelection) {
    auto lines = std::make_shared<std::vector<std::string>>();
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    std::vector<FormationCandidate> candidates{
        {.formation = Formation::four_three_three()},
        {.formation = Formation::four_four_two()},
    };
    FormationEvaluator evaluator(config_, &logger);
    EXPECT_EQ(evaluator.thread_count(), 2u);
    auto evaluation = evaluator.evaluate(roster_, events_, candidates);
    EXPECT_EQ(evaluation.best.value_or(99), 1u);

    size_t rejected = 0;
    for (const auto& line : *lines) {
        if (line.find("formation '4-3-3' rejected") != std::string::npos) ++rejected;
    }
    EXPECT_EQ(rejected, 1u);
}
