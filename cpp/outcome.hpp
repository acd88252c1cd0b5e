#pragma once

#include <string>
#include <utility>
#include <vector>

#include "identity_resolver.hpp"
#include "placer_types.hpp"
#include "problem_builder.hpp"

namespace retreat_placer {

// Bunk tiers for the occupants of one room, given in their original order.
// Bottom-bunk people first (stable), bottom bunks filled in that order, the
// rest get top bunks. Returns (person, tier) in fill order.
std::vector<std::pair<int, BunkTier>> AssignBunkTiers(const std::vector<Person>& people,
                                                      const std::vector<int>& occupants,
                                                      int bottom_capacity);

// Ordered, heuristic reasons why `person` was left out.
std::vector<std::string> DiagnoseUnplaced(const PlacementProblem& problem,
                                          const IdentityResolution& resolution,
                                          const std::vector<int>& assignment, int person);

struct Outcome {
    std::vector<PlacementRecord> placements;
    std::vector<UnplacedRecord> unplaced;
    PlacementSummary summary;
};

Outcome ExtractOutcome(const PlacementProblem& problem, const IdentityResolution& resolution,
                       const std::vector<int>& assignment);

}  // namespace retreat_placer
