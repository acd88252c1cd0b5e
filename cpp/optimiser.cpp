// Core headers from the OR-Tools Constraint Programming (CP-SAT) solver
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/cp_model_solver.h"
#include "ortools/sat/sat_parameters.pb.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "absl/strings/str_format.h"
#include "optimiser.hpp"
#include "ortools/base/logging.h"

using namespace operations_research;
namespace sat = operations_research::sat;

using namespace std;

namespace retreat_placer {

const char* SolveStatusName(SolveStatus status) {
    return status == SolveStatus::kOptimal ? "OPTIMAL" : "FEASIBLE";
}

int64_t MaxSoftSwing(const PlacementProblem& problem, const EffectiveWeights& weights) {
    // Each pair term ranges over [-w, +w]; each affinity term over [0, w].
    int64_t swing = 0;
    swing += 2 * weights.group * static_cast<int64_t>(problem.group_pairs.size());
    swing += 2 * weights.attach * static_cast<int64_t>(problem.one_way_pairs.size());
    swing += 2 * weights.org * static_cast<int64_t>(problem.org_pairs.size());
    for (int p = 0; p < problem.NumPeople(); ++p) {
        if (problem.org_buildings.count(problem.people[p].org) > 0) swing += weights.affinity;
    }
    return swing;
}

EffectiveWeights ComputeEffectiveWeights(const PlacementProblem& problem,
                                         const ObjectiveWeights& configured) {
    EffectiveWeights w{configured.placement(), configured.group(), configured.attach(),
                       configured.affinity(), configured.org()};
    w.placement = max(w.placement, MaxSoftSwing(problem, w) + 1);
    return w;
}

ObjectiveBreakdown ScoreAssignment(const PlacementProblem& problem,
                                   const EffectiveWeights& weights,
                                   const vector<int>& assignment) {
    ObjectiveBreakdown b;
    auto both_placed = [&](const pair<int, int>& pr) {
        return assignment[pr.first] != kUnassigned && assignment[pr.second] != kUnassigned;
    };

    for (int p = 0; p < problem.NumPeople(); ++p) {
        if (assignment[p] == kUnassigned) continue;
        ++b.placed;
        if (problem.PrefersBuilding(p, problem.room_building[assignment[p]])) ++b.affinity_satisfied;
    }
    for (const auto& pr : problem.group_pairs) {
        if (!both_placed(pr)) continue;
        if (assignment[pr.first] == assignment[pr.second]) ++b.group_matched; else ++b.group_mismatched;
    }
    for (const auto& pr : problem.one_way_pairs) {
        if (!both_placed(pr)) continue;
        if (assignment[pr.first] == assignment[pr.second]) ++b.attach_matched; else ++b.attach_mismatched;
    }
    for (const auto& pr : problem.org_pairs) {
        if (!both_placed(pr)) continue;
        if (problem.room_building[assignment[pr.first]] == problem.room_building[assignment[pr.second]]) {
            ++b.org_matched;
        } else {
            ++b.org_mismatched;
        }
    }

    b.placement_term = weights.placement * b.placed;
    b.group_term = weights.group * (b.group_matched - b.group_mismatched);
    b.attach_term = weights.attach * (b.attach_matched - b.attach_mismatched);
    b.org_term = weights.org * (b.org_matched - b.org_mismatched);
    b.affinity_term = weights.affinity * b.affinity_satisfied;
    return b;
}

absl::Status CheckHardConstraints(const PlacementProblem& problem, const vector<int>& assignment) {
    if (static_cast<int>(assignment.size()) != problem.NumPeople()) {
        return absl::InternalError("Assignment size does not match the roster");
    }
    vector<int> occupants(problem.NumRooms(), 0), bottom_needers(problem.NumRooms(), 0);
    for (int p = 0; p < problem.NumPeople(); ++p) {
        const int r = assignment[p];
        if (r == kUnassigned) continue;
        if (r < 0 || r >= problem.NumRooms()) {
            return absl::InternalError(absl::StrFormat("%s assigned to unknown room %d",
                                                       problem.people[p].FullName(), r));
        }
        if (problem.people[p].needs_floor_one && problem.rooms[r].floor != 1) {
            return absl::InternalError(absl::StrFormat("%s needs floor 1 but is in %s/%s",
                                                       problem.people[p].FullName(),
                                                       problem.rooms[r].building, problem.rooms[r].name));
        }
        ++occupants[r];
        if (problem.people[p].needs_bottom_bunk) ++bottom_needers[r];
    }
    for (int r = 0; r < problem.NumRooms(); ++r) {
        const Room& room = problem.rooms[r];
        if (occupants[r] > room.TotalCapacity()) {
            return absl::InternalError(absl::StrFormat("Room %s/%s holds %d people but has %d bunks",
                                                       room.building, room.name, occupants[r],
                                                       room.TotalCapacity()));
        }
        if (bottom_needers[r] > room.bottom_capacity) {
            return absl::InternalError(absl::StrFormat(
                "Room %s/%s holds %d bottom-bunk people but has %d bottom bunks",
                room.building, room.name, bottom_needers[r], room.bottom_capacity));
        }
    }
    for (const auto& pr : problem.mutual_pairs) {
        const int a = assignment[pr.first], b = assignment[pr.second];
        if (a != kUnassigned && b != kUnassigned && a != b) {
            return absl::InternalError(absl::StrFormat("Mutual attach pair %s / %s split across rooms",
                                                       problem.people[pr.first].FullName(),
                                                       problem.people[pr.second].FullName()));
        }
    }
    return absl::OkStatus();
}

// ============================================================================
// GREEDY SEED
// ============================================================================

// Tracks room usage while the seed is built
struct RoomState {
    int occupants = 0;
    int bottom_needers = 0;
};

// Helper: Check if every member of a unit can join room r together
bool UnitFits(const PlacementProblem& problem, const vector<int>& unit, int r,
              const vector<RoomState>& rooms) {
    int bottom = 0;
    for (int p : unit) {
        if (!problem.Allowed(p, r)) return false;
        if (problem.people[p].needs_bottom_bunk) ++bottom;
    }
    const Room& room = problem.rooms[r];
    return rooms[r].occupants + static_cast<int>(unit.size()) <= room.TotalCapacity() &&
           rooms[r].bottom_needers + bottom <= room.bottom_capacity;
}

// Helper: Score room r for a unit. Org target buildings dominate, then cohort
// mates already in the room, then fuller rooms.
double ScoreRoomForUnit(const PlacementProblem& problem, const vector<int>& unit, int r,
                        const vector<int>& seed, const vector<RoomState>& rooms) {
    double score = 0.0;
    const int building = problem.room_building[r];
    for (int p : unit) {
        if (problem.PrefersBuilding(p, building)) score += 1000.0;
        const Person& person = problem.people[p];
        for (int q = 0; q < problem.NumPeople(); ++q) {
            if (seed[q] != r) continue;
            if (!person.group.empty() && problem.people[q].group == person.group) score += 100.0;
            if (problem.attach_targets[p] == q || problem.attach_targets[q] == p) score += 100.0;
        }
    }
    const int capacity = problem.rooms[r].TotalCapacity();
    if (capacity > 0) score += 10.0 * rooms[r].occupants / capacity;
    return score;
}

// Helper: Place a unit into its best-scoring room
bool TryPlaceUnit(const PlacementProblem& problem, const vector<int>& unit,
                  vector<int>& seed, vector<RoomState>& rooms) {
    int best_room = kUnassigned;
    double best_score = -1.0;
    for (int r = 0; r < problem.NumRooms(); ++r) {
        if (!UnitFits(problem, unit, r, rooms)) continue;
        double score = ScoreRoomForUnit(problem, unit, r, seed, rooms);
        if (score > best_score) {
            best_score = score;
            best_room = r;
        }
    }
    if (best_room == kUnassigned) return false;

    for (int p : unit) {
        seed[p] = best_room;
        ++rooms[best_room].occupants;
        if (problem.people[p].needs_bottom_bunk) ++rooms[best_room].bottom_needers;
    }
    return true;
}

// Helper: Units sorted most-constrained first (floor 1 + bottom, then either)
int UnitDifficulty(const PlacementProblem& problem, const vector<int>& unit) {
    int difficulty = 0;
    for (int p : unit) {
        difficulty += problem.people[p].needs_floor_one ? 2 : 0;
        difficulty += problem.people[p].needs_bottom_bunk ? 2 : 0;
    }
    return difficulty / static_cast<int>(unit.size());
}

vector<int> GreedySeed(const PlacementProblem& problem) {
    vector<int> seed(problem.NumPeople(), kUnassigned);
    vector<RoomState> rooms(problem.NumRooms());

    vector<bool> in_pair(problem.NumPeople(), false);
    vector<vector<int>> pair_units, single_units;
    for (const auto& pr : problem.mutual_pairs) {
        pair_units.push_back({pr.first, pr.second});
        in_pair[pr.first] = in_pair[pr.second] = true;
    }
    for (int p = 0; p < problem.NumPeople(); ++p) {
        if (!in_pair[p]) single_units.push_back({p});
    }

    auto by_difficulty = [&](const vector<int>& a, const vector<int>& b) {
        return UnitDifficulty(problem, a) > UnitDifficulty(problem, b);
    };
    stable_sort(pair_units.begin(), pair_units.end(), by_difficulty);
    stable_sort(single_units.begin(), single_units.end(), by_difficulty);

    // A mutual pair that cannot share a room stays out of the seed entirely;
    // placing one partner alone would still be valid but the solver decides.
    for (const auto& unit : pair_units) TryPlaceUnit(problem, unit, seed, rooms);
    for (const auto& unit : single_units) TryPlaceUnit(problem, unit, seed, rooms);
    return seed;
}

// ============================================================================
// CP-SAT MODEL
// ============================================================================

class Optimiser {
private:
    const PlacementProblem& problem;
    EffectiveWeights weights;
    sat::CpModelBuilder* model;
    int num_people;
    int num_rooms;
    int num_buildings;

    // room_assignment[p][r] exists only where problem.Allowed(p, r).
    vector<vector<sat::BoolVar>> room_assignment;
    vector<sat::BoolVar> assigned;
    vector<vector<sat::BoolVar>> in_building;

    // Soft-term bookkeeping, used for logging only
    int num_group_terms = 0;
    int num_attach_terms = 0;
    int num_org_terms = 0;
    int num_affinity_terms = 0;

    // Room membership of p as an expression (constant 0 where not allowed)
    sat::LinearExpr InRoom(int p, int r) const {
        if (!problem.Allowed(p, r)) return sat::LinearExpr(0);
        return sat::LinearExpr(room_assignment[p][r]);
    }

    // Reified "both a and b are assigned"
    sat::BoolVar BothAssigned(int a, int b) {
        sat::BoolVar both = model->NewBoolVar();
        model->AddBoolAnd({assigned[a], assigned[b]}).OnlyEnforceIf(both);
        model->AddBoolOr({assigned[a].Not(), assigned[b].Not()}).OnlyEnforceIf(both.Not());
        return both;
    }

    // Reified conjunction of two membership literals
    sat::BoolVar Together(sat::BoolVar x, sat::BoolVar y) {
        sat::BoolVar co = model->NewBoolVar();
        model->AddBoolAnd({x, y}).OnlyEnforceIf(co);
        model->AddBoolOr({x.Not(), y.Not()}).OnlyEnforceIf(co.Not());
        return co;
    }

    // Net pair score w * (matched - mismatched). `same` is 1 only when both are
    // placed together, so mismatched = both - same.
    sat::LinearExpr PairScore(const sat::LinearExpr& same, sat::BoolVar both, int64_t w) {
        return same * (2 * w) - sat::LinearExpr(both) * w;
    }

public:
    explicit Optimiser(const PlacementProblem& problem, const EffectiveWeights& weights,
                       sat::CpModelBuilder* model)
        : problem(problem), weights(weights), model(model),
          num_people(problem.NumPeople()), num_rooms(problem.NumRooms()),
          num_buildings(problem.NumBuildings()),
          room_assignment(num_people), assigned(num_people), in_building(num_people)
    {}

    const vector<vector<sat::BoolVar>>& GetRoomAssignment() const { return room_assignment; }

    // Creates the person x room matrix and ties assigned[p] to its row sum,
    // so every person takes at most one room. Floor-restricted rooms get no
    // variable at all.
    void InitRoomAssignment() {
        for (int p = 0; p < num_people; ++p) {
            room_assignment[p].resize(num_rooms);
            vector<sat::BoolVar> choices;
            for (int r = 0; r < num_rooms; ++r) {
                if (!problem.Allowed(p, r)) continue;
                room_assignment[p][r] = model->NewBoolVar();
                choices.push_back(room_assignment[p][r]);
            }
            assigned[p] = model->NewBoolVar();
            model->AddEquality(sat::LinearExpr::Sum(choices), assigned[p]);
        }
    }

    // Derived building choice: in_building[p][b] = sum of p's rooms in b.
    void InitBuildingMembership() {
        for (int p = 0; p < num_people; ++p) {
            in_building[p].resize(num_buildings);
            vector<sat::LinearExpr> per_building(num_buildings);
            for (int r = 0; r < num_rooms; ++r) {
                per_building[problem.room_building[r]] += InRoom(p, r);
            }
            for (int b = 0; b < num_buildings; ++b) {
                in_building[p][b] = model->NewBoolVar();
                model->AddEquality(in_building[p][b], per_building[b]);
            }
        }
    }

    void AddCapacityConstraints() {
        for (int r = 0; r < num_rooms; ++r) {
            sat::LinearExpr occupants, bottom_needers;
            for (int p = 0; p < num_people; ++p) {
                if (!problem.Allowed(p, r)) continue;
                occupants += room_assignment[p][r];
                if (problem.people[p].needs_bottom_bunk) bottom_needers += room_assignment[p][r];
            }
            model->AddLessOrEqual(occupants, problem.rooms[r].TotalCapacity());
            model->AddLessOrEqual(bottom_needers, problem.rooms[r].bottom_capacity);
        }
    }

    // Mutual attach pairs share a room whenever both are placed.
    void AddMutualAttachConstraints() {
        for (const auto& pr : problem.mutual_pairs) {
            sat::BoolVar both = BothAssigned(pr.first, pr.second);
            for (int r = 0; r < num_rooms; ++r) {
                if (!problem.Allowed(pr.first, r) && !problem.Allowed(pr.second, r)) continue;
                model->AddEquality(InRoom(pr.first, r), InRoom(pr.second, r)).OnlyEnforceIf(both);
            }
        }
    }

    void AddHint(const vector<int>& seed) {
        for (int p = 0; p < num_people; ++p) {
            for (int r = 0; r < num_rooms; ++r) {
                if (!problem.Allowed(p, r)) continue;
                model->AddHint(room_assignment[p][r], seed[p] == r);
            }
        }
    }

    sat::LinearExpr SameRoomPairScore(int a, int b, int64_t w) {
        sat::BoolVar both = BothAssigned(a, b);
        sat::LinearExpr same;
        for (int r = 0; r < num_rooms; ++r) {
            if (!problem.Allowed(a, r) || !problem.Allowed(b, r)) continue;
            same += Together(room_assignment[a][r], room_assignment[b][r]);
        }
        return PairScore(same, both, w);
    }

    sat::LinearExpr SameBuildingPairScore(int a, int b, int64_t w) {
        sat::BoolVar both = BothAssigned(a, b);
        sat::LinearExpr same;
        for (int bl = 0; bl < num_buildings; ++bl) {
            same += Together(in_building[a][bl], in_building[b][bl]);
        }
        return PairScore(same, both, w);
    }

    // Group, one-directional attach, org and org-affinity terms.
    sat::LinearExpr BuildSoftObjective() {
        sat::LinearExpr soft;
        for (const auto& pr : problem.group_pairs) {
            soft += SameRoomPairScore(pr.first, pr.second, weights.group);
            ++num_group_terms;
        }
        for (const auto& pr : problem.one_way_pairs) {
            soft += SameRoomPairScore(pr.first, pr.second, weights.attach);
            ++num_attach_terms;
        }
        for (const auto& pr : problem.org_pairs) {
            soft += SameBuildingPairScore(pr.first, pr.second, weights.org);
            ++num_org_terms;
        }
        for (int p = 0; p < num_people; ++p) {
            auto it = problem.org_buildings.find(problem.people[p].org);
            if (problem.people[p].org.empty() || it == problem.org_buildings.end()) continue;
            for (int b : it->second) soft += sat::LinearExpr(in_building[p][b]) * weights.affinity;
            ++num_affinity_terms;
        }
        return soft;
    }

    // Placement dominates: weights.placement exceeds the largest soft swing.
    sat::LinearExpr BuildCombinedObjective(const sat::LinearExpr& soft) {
        sat::LinearExpr objective = sat::LinearExpr::Sum(assigned) * weights.placement;
        objective += soft;
        return objective;
    }

    void LogModelSize() const {
        LOG(INFO) << "Model: " << num_people << " people x " << num_rooms << " rooms ("
                  << num_buildings << " buildings); soft terms: " << num_group_terms
                  << " group, " << num_attach_terms << " attach, " << num_org_terms << " org, "
                  << num_affinity_terms << " affinity; placement weight " << weights.placement;
    }
};

absl::StatusOr<SolverResult> SolvePlacement(const PlacementProblem& problem,
                                            const PlacerConfig& config) {
    SolverResult result;
    result.weights = ComputeEffectiveWeights(problem, config.weights());

    sat::CpModelBuilder model;
    Optimiser optimiser = Optimiser(problem, result.weights, &model);

    optimiser.InitRoomAssignment();
    optimiser.InitBuildingMembership();
    optimiser.AddCapacityConstraints();
    optimiser.AddMutualAttachConstraints();

    if (config.solver().use_greedy_hint()) {
        vector<int> seed = GreedySeed(problem);
        absl::Status seed_ok = CheckHardConstraints(problem, seed);
        if (seed_ok.ok()) {
            optimiser.AddHint(seed);
            result.used_greedy_hint = true;
            result.hint_placed = static_cast<int>(count_if(seed.begin(), seed.end(),
                                                           [](int r) { return r != kUnassigned; }));
        } else {
            LOG(WARNING) << "Greedy seed rejected: " << seed_ok.message();
        }
    }

    sat::LinearExpr soft = optimiser.BuildSoftObjective();
    model.Maximize(optimiser.BuildCombinedObjective(soft));
    optimiser.LogModelSize();

    // Solve
    sat::Model cp_model;
    sat::SatParameters parameters;
    parameters.set_max_time_in_seconds(config.solver().max_time_in_seconds());
    parameters.set_num_workers(config.solver().num_workers());
    parameters.set_random_seed(config.solver().random_seed());
    parameters.set_randomize_search(false);
    parameters.set_log_search_progress(config.solver().log_search_progress());
    cp_model.Add(sat::NewSatParameters(parameters));

    const sat::CpSolverResponse response = sat::SolveCpModel(model.Build(), &cp_model);

    switch (response.status()) {
        case sat::CpSolverStatus::OPTIMAL:
            result.status = SolveStatus::kOptimal;
            break;
        case sat::CpSolverStatus::FEASIBLE:
            result.status = SolveStatus::kFeasible;
            break;
        case sat::CpSolverStatus::INFEASIBLE:
        case sat::CpSolverStatus::MODEL_INVALID:
            // Leaving everyone unassigned always satisfies the hard constraints.
            return absl::InternalError(absl::StrFormat(
                "CP-SAT reported %s; the placement model is defective",
                sat::CpSolverStatus_Name(response.status())));
        default:
            return absl::DeadlineExceededError(absl::StrFormat(
                "CP-SAT found no solution within %.1f s (status %s)",
                config.solver().max_time_in_seconds(),
                sat::CpSolverStatus_Name(response.status())));
    }

    result.objective = response.objective_value();
    result.best_bound = response.best_objective_bound();
    result.solve_time_secs = response.wall_time();

    const auto& room_assignment = optimiser.GetRoomAssignment();
    result.assignment.assign(problem.NumPeople(), kUnassigned);
    for (int p = 0; p < problem.NumPeople(); ++p) {
        for (int r = 0; r < problem.NumRooms(); ++r) {
            if (problem.Allowed(p, r) && sat::SolutionBooleanValue(response, room_assignment[p][r])) {
                result.assignment[p] = r;
                break;
            }
        }
    }

    absl::Status valid = CheckHardConstraints(problem, result.assignment);
    if (!valid.ok()) {
        return absl::InternalError(absl::StrFormat("Solver returned an invalid assignment: %s",
                                                   valid.message()));
    }

    result.breakdown = ScoreAssignment(problem, result.weights, result.assignment);
    const ObjectiveBreakdown& b = result.breakdown;
    LOG(INFO) << "Solution: " << SolveStatusName(result.status) << " in " << result.solve_time_secs
              << " s, objective " << result.objective << " (bound " << result.best_bound << ")";
    LOG(INFO) << "  Placed:                " << b.placed << "/" << problem.NumPeople();
    LOG(INFO) << "  Group-same-room:       " << b.group_matched << "/" << problem.group_pairs.size()
              << " matched, " << b.group_mismatched << " mismatched";
    LOG(INFO) << "  Attach-same-room:      " << b.attach_matched << "/" << problem.one_way_pairs.size()
              << " matched, " << b.attach_mismatched << " mismatched";
    LOG(INFO) << "  Mutual attach pairs:   " << problem.mutual_pairs.size() << " (hard)";
    LOG(INFO) << "  Org-same-building:     " << b.org_matched << "/" << problem.org_pairs.size()
              << " matched, " << b.org_mismatched << " mismatched";
    LOG(INFO) << "  Org-building affinity: " << b.affinity_satisfied << " in preferred building";
    return result;
}

}  // namespace retreat_placer
