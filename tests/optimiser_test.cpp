#include "optimiser.hpp"

#include <algorithm>
#include <vector>

#include "config.hpp"
#include "gtest/gtest.h"
#include "placer.hpp"

namespace retreat_placer {
namespace {

RawPersonRecord PersonRow(const std::string& first, const std::string& last,
                          const std::string& org = "", const std::string& group = "",
                          const std::string& attach = "") {
    return {first, last, org, group, attach, "Any", "Any"};
}

PlacerConfig TestConfig() {
    PlacerConfig config = DefaultPlacerConfig();
    config.mutable_solver()->set_max_time_in_seconds(10.0);
    config.mutable_solver()->set_num_workers(1);
    return config;
}

class OptimiserTest : public ::testing::Test {
protected:
    PlacementProblem Build(const std::vector<RawRoomRecord>& rooms,
                           const std::vector<RawPersonRecord>& people) {
        absl::StatusOr<Roster> normalized = NormalizeInput(rooms, people);
        EXPECT_TRUE(normalized.ok()) << normalized.status();
        roster = *normalized;
        IdentityResolver resolver(roster.people, roster.labels, config.identity());
        return BuildPlacementProblem(roster, resolver.Resolve());
    }

    PlacerConfig config = TestConfig();
    Roster roster;
};

int CountPlaced(const std::vector<int>& assignment) {
    return static_cast<int>(std::count_if(assignment.begin(), assignment.end(),
                                          [](int r) { return r != kUnassigned; }));
}

TEST_F(OptimiserTest, CheckHardConstraintsFlagsViolations) {
    std::vector<RawPersonRecord> people = {PersonRow("Ann", "Lee"), PersonRow("Bo", "Park"),
                                           PersonRow("Cy", "Diaz")};
    people[0].floor_pref = "1";
    people[1].bunk_pref = "Bottom";
    people[2].bunk_pref = "Bottom";
    PlacementProblem problem = Build({{"Lodge", "101", "1", "1", "1"},
                                      {"Lodge", "201", "2", "1", "0"}},
                                     people);

    EXPECT_TRUE(CheckHardConstraints(problem, {kUnassigned, kUnassigned, kUnassigned}).ok());
    EXPECT_TRUE(CheckHardConstraints(problem, {0, 0, 1}).ok());
    // Floor rule.
    EXPECT_EQ(CheckHardConstraints(problem, {1, kUnassigned, kUnassigned}).code(),
              absl::StatusCode::kInternal);
    // Bottom bunks.
    EXPECT_FALSE(CheckHardConstraints(problem, {kUnassigned, 0, 0}).ok());
    // Total capacity.
    EXPECT_TRUE(CheckHardConstraints(problem, {kUnassigned, kUnassigned, 1}).ok());
    EXPECT_FALSE(CheckHardConstraints(problem, {kUnassigned, 1, 1}).ok());
    // Size mismatch.
    EXPECT_FALSE(CheckHardConstraints(problem, {0}).ok());
}

TEST_F(OptimiserTest, EffectiveWeightsDominateSoftSwing) {
    PlacementProblem problem = Build(
        {{"Lodge", "101", "1", "2", "2"}, {"Cabin", "A", "1", "2", "2"}},
        {
            PersonRow("Ann", "Lee", "North", "Choir"),
            PersonRow("Bo", "Park", "North", "Choir"),
            PersonRow("Cy", "Diaz", "North", "Choir", "Ann Lee"),
        });
    ObjectiveWeights configured = config.weights();
    configured.set_placement(1);

    EffectiveWeights w = ComputeEffectiveWeights(problem, configured);
    EXPECT_GT(w.placement, MaxSoftSwing(problem, w));
    EXPECT_EQ(w.group, configured.group());
    EXPECT_EQ(w.org, configured.org());
    // 2 group pairs, 1 attach pair, 2 org pairs, 3 people with an affinity target.
    EXPECT_EQ(MaxSoftSwing(problem, w), 2 * 1000 * 2 + 2 * 800 + 2 * 100 * 2 + 3 * 200);

    EffectiveWeights large = ComputeEffectiveWeights(problem, config.weights());
    EXPECT_EQ(large.placement, 10000);
}

TEST_F(OptimiserTest, ScoreAssignmentCountsPairTerms) {
    PlacementProblem problem = Build(
        {{"Lodge", "101", "1", "2", "0"}, {"Cabin", "A", "1", "2", "0"}},
        {
            PersonRow("Ann", "Lee", "", "Choir"),
            PersonRow("Bo", "Park", "", "Choir"),
            PersonRow("Cy", "Diaz", "", "Choir"),
        });
    EffectiveWeights w{10000, 1000, 800, 200, 100};

    ObjectiveBreakdown b = ScoreAssignment(problem, w, {0, 0, 1});
    EXPECT_EQ(b.placed, 3);
    EXPECT_EQ(b.group_matched, 1);
    EXPECT_EQ(b.group_mismatched, 1);
    EXPECT_EQ(b.Total(), 30000);

    ObjectiveBreakdown partial = ScoreAssignment(problem, w, {0, kUnassigned, 1});
    EXPECT_EQ(partial.placed, 2);
    EXPECT_EQ(partial.group_matched + partial.group_mismatched, 0);
    EXPECT_EQ(partial.Total(), 20000);
}

TEST_F(OptimiserTest, GreedySeedHonoursHardConstraints) {
    std::vector<RawPersonRecord> people = {
        PersonRow("Ann", "Lee", "North", "", "Bo Park"),
        PersonRow("Bo", "Park", "North", "", "Ann Lee"),
        PersonRow("Cy", "Diaz", "South"),
        PersonRow("Di", "Fox", "South"),
        PersonRow("Ed", "Gray"),
    };
    people[2].floor_pref = "1";
    people[2].bunk_pref = "Bottom";
    people[3].bunk_pref = "Bottom";
    PlacementProblem problem = Build({{"Lodge", "101", "1", "1", "2"},
                                      {"Lodge", "201", "2", "1", "2"},
                                      {"Cabin", "A", "1", "0", "1"}},
                                     people);

    std::vector<int> seed = GreedySeed(problem);
    ASSERT_EQ(seed.size(), people.size());
    EXPECT_TRUE(CheckHardConstraints(problem, seed).ok());
    EXPECT_EQ(seed[2], 0);
    ASSERT_NE(seed[0], kUnassigned);
    EXPECT_EQ(seed[0], seed[1]);
    EXPECT_EQ(CountPlaced(seed), 5);
}

TEST_F(OptimiserTest, MutualPairSharesRoom) {
    PlacementProblem problem = Build(
        {{"Lodge", "101", "1", "1", "1"}, {"Cabin", "A", "1", "1", "1"}},
        {
            PersonRow("Ann", "Lee", "North", "Choir", "Bo Park"),
            PersonRow("Bo", "Park", "South", "", "Ann Lee"),
            PersonRow("Cy", "Diaz", "North", "Choir"),
            PersonRow("Di", "Fox", "South"),
        });
    ASSERT_EQ(problem.mutual_pairs.size(), 1u);

    absl::StatusOr<SolverResult> result = SolvePlacement(problem, config);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(CountPlaced(result->assignment), 4);
    EXPECT_EQ(result->assignment[0], result->assignment[1]);
    EXPECT_TRUE(CheckHardConstraints(problem, result->assignment).ok());
}

TEST_F(OptimiserTest, PlacementOutweighsCohesionEvenWithTinyWeight) {
    // Splitting the group costs one group penalty and one org penalty; leaving
    // someone out would avoid both.
    PlacementProblem problem = Build(
        {{"Lodge", "101", "1", "1", "0"}, {"Cabin", "A", "1", "1", "0"}},
        {
            PersonRow("Ann", "Lee", "North", "Choir"),
            PersonRow("Bo", "Park", "North", "Choir"),
        });
    config.mutable_weights()->set_placement(1);

    absl::StatusOr<SolverResult> result = SolvePlacement(problem, config);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->status, SolveStatus::kOptimal);
    EXPECT_EQ(CountPlaced(result->assignment), 2);
    EXPECT_EQ(result->breakdown.group_mismatched, 1);
    EXPECT_GT(result->weights.placement, 1);
}

TEST_F(OptimiserTest, ObjectiveMatchesIndependentScore) {
    PlacementProblem problem = Build(
        {{"Lodge", "101", "1", "2", "1"}, {"Lodge", "102", "2", "1", "1"},
         {"Cabin", "A", "1", "1", "2"}},
        {
            PersonRow("Ann", "Lee", "North", "Choir"),
            PersonRow("Bo", "Park", "North", "Choir", "Ann Lee"),
            PersonRow("Cy", "Diaz", "South", "Youth"),
            PersonRow("Di", "Fox", "South", "Youth", "Ann Lee"),
            PersonRow("Ed", "Gray", "North"),
        });

    absl::StatusOr<SolverResult> result = SolvePlacement(problem, config);
    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(CountPlaced(result->assignment), 5);
    EXPECT_DOUBLE_EQ(result->objective, static_cast<double>(result->breakdown.Total()));
    EXPECT_TRUE(result->used_greedy_hint);
}

TEST(RunPlacement, FloorAndBottomScarcityLeavesOnePersonOut) {
    std::vector<RawRoomRecord> rooms = {{"Lodge", "201", "2", "2", "0"},
                                        {"Lodge", "202", "2", "2", "0"}};
    std::vector<RawPersonRecord> people = {
        PersonRow("Ann", "Lee"), PersonRow("Bo", "Park"), PersonRow("Cy", "Diaz"),
        PersonRow("Di", "Fox"), PersonRow("Ed", "Gray"),
    };
    people[2].floor_pref = "1";
    people[2].bunk_pref = "Bottom";

    absl::StatusOr<PlacementReport> report = RunPlacement(rooms, people, TestConfig());
    ASSERT_TRUE(report.ok()) << report.status();
    EXPECT_EQ(report->status, SolveStatus::kOptimal);
    EXPECT_EQ(report->outcome.summary.placed, 4);
    ASSERT_EQ(report->outcome.unplaced.size(), 1u);
    const UnplacedRecord& left_out = report->outcome.unplaced[0];
    EXPECT_EQ(left_out.person, 2);
    ASSERT_FALSE(left_out.reasons.empty());
    EXPECT_EQ(left_out.reasons[0], "Needs bottom bunk on floor 1 (no such bunks exist)");
}

TEST(RunPlacement, RejectsInvalidInputBeforeSolving) {
    absl::StatusOr<PlacementReport> report =
        RunPlacement({{"Lodge", "201", "three", "2", "0"}}, {PersonRow("Ann", "Lee")}, TestConfig());
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.status().code(), absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace retreat_placer
