#pragma once

#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "placer_config.pb.h"
#include "problem_builder.hpp"

namespace retreat_placer {

enum class SolveStatus {
    kOptimal,   // proven optimal
    kFeasible,  // time budget reached with a feasible, unproven solution
};

const char* SolveStatusName(SolveStatus status);

// Weights actually used in the model. `placement` is raised above the
// configured value whenever the soft terms could outweigh one placement.
struct EffectiveWeights {
    int64_t placement;
    int64_t group;
    int64_t attach;
    int64_t affinity;
    int64_t org;
};

EffectiveWeights ComputeEffectiveWeights(const PlacementProblem& problem,
                                         const ObjectiveWeights& configured);

// Largest possible difference in the soft part of the objective between any
// two assignments of `problem`.
int64_t MaxSoftSwing(const PlacementProblem& problem, const EffectiveWeights& weights);

struct ObjectiveBreakdown {
    int placed = 0;
    int group_matched = 0;
    int group_mismatched = 0;
    int attach_matched = 0;
    int attach_mismatched = 0;
    int org_matched = 0;
    int org_mismatched = 0;
    int affinity_satisfied = 0;

    int64_t placement_term = 0;
    int64_t group_term = 0;
    int64_t attach_term = 0;
    int64_t affinity_term = 0;
    int64_t org_term = 0;

    int64_t Total() const {
        return placement_term + group_term + attach_term + affinity_term + org_term;
    }
};

// Objective value of `assignment` (room per person, kUnassigned allowed),
// computed outside the solver. Must match the CP-SAT objective.
ObjectiveBreakdown ScoreAssignment(const PlacementProblem& problem,
                                   const EffectiveWeights& weights,
                                   const std::vector<int>& assignment);

// OK if `assignment` satisfies capacity, bottom-tier capacity, floor and
// mutual-attach rules; otherwise a description of the first violation.
absl::Status CheckHardConstraints(const PlacementProblem& problem,
                                  const std::vector<int>& assignment);

// Constructive placement honouring every hard constraint, used to hint the
// solver. Mutual pairs go first as units, then the most constrained people.
std::vector<int> GreedySeed(const PlacementProblem& problem);

struct SolverResult {
    SolveStatus status = SolveStatus::kFeasible;
    double objective = 0.0;
    double best_bound = 0.0;
    double solve_time_secs = 0.0;
    bool used_greedy_hint = false;
    int hint_placed = 0;
    EffectiveWeights weights{};
    ObjectiveBreakdown breakdown;
    std::vector<int> assignment;  // room per person, kUnassigned if left out
};

// Builds a fresh CP-SAT model for `problem` and solves it within the configured
// budget. INFEASIBLE or MODEL_INVALID from the backend is a modelling defect
// and yields InternalError; no solution at all within the budget yields
// DeadlineExceeded.
absl::StatusOr<SolverResult> SolvePlacement(const PlacementProblem& problem,
                                            const PlacerConfig& config);

}  // namespace retreat_placer
