#pragma once

#include <map>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "identity_resolver.hpp"
#include "optimiser.hpp"
#include "outcome.hpp"
#include "placer_config.pb.h"
#include "placer_types.hpp"
#include "problem_builder.hpp"

namespace retreat_placer {

struct PlacementReport {
    std::vector<Person> people;
    std::vector<Room> rooms;
    IdentityResolution resolution;
    std::map<std::string, std::vector<std::string>> org_buildings;
    SolveStatus status = SolveStatus::kFeasible;
    ObjectiveBreakdown breakdown;
    Outcome outcome;
};

// One run: normalize input, resolve attach references, build the model once,
// solve once, extract once. Input errors and solver defects abort with no
// partial report.
absl::StatusOr<PlacementReport> RunPlacement(const std::vector<RawRoomRecord>& rooms,
                                             const std::vector<RawPersonRecord>& people,
                                             const PlacerConfig& config);

}  // namespace retreat_placer
