#include "placer.hpp"

#include <utility>

#include "config.hpp"
#include "ortools/base/logging.h"
#include "roster.hpp"

using namespace std;

namespace retreat_placer {

absl::StatusOr<PlacementReport> RunPlacement(const vector<RawRoomRecord>& rooms,
                                             const vector<RawPersonRecord>& people,
                                             const PlacerConfig& config) {
    absl::Status config_ok = ValidatePlacerConfig(config);
    if (!config_ok.ok()) return config_ok;

    absl::StatusOr<Roster> roster = NormalizeInput(rooms, people);
    if (!roster.ok()) return roster.status();

    IdentityResolver resolver(roster->people, roster->labels, config.identity());
    IdentityResolution resolution = resolver.Resolve();

    const PlacementProblem problem = BuildPlacementProblem(*roster, resolution);

    absl::StatusOr<SolverResult> solved = SolvePlacement(problem, config);
    if (!solved.ok()) return solved.status();

    PlacementReport report;
    report.status = solved->status;
    report.breakdown = solved->breakdown;
    report.outcome = ExtractOutcome(problem, resolution, solved->assignment);
    for (const auto& entry : problem.org_buildings) {
        vector<string>& names = report.org_buildings[entry.first];
        for (int b : entry.second) names.push_back(problem.buildings[b]);
    }
    report.people = problem.people;
    report.rooms = problem.rooms;
    report.resolution = std::move(resolution);

    const PlacementSummary& summary = report.outcome.summary;
    LOG(INFO) << "Placed " << summary.placed << " of " << summary.total_people << " into "
              << summary.total_slots << " slots (bottom " << summary.bottom_slots << ", top "
              << summary.top_slots << "), " << summary.unplaced << " unplaced ("
              << SolveStatusName(report.status) << ")";
    return report;
}

}  // namespace retreat_placer
