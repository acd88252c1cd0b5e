#include "outcome.hpp"

#include <algorithm>

#include "absl/strings/str_format.h"

using namespace std;

namespace retreat_placer {

namespace {

string ResolvedName(const PlacementProblem& problem, const IdentityResolution& resolution, int p) {
    const int target = resolution.targets[p];
    return target == kUnassigned ? "" : problem.people[target].FullName();
}

// Why a placed partner's room could not also take `person`, if it is clear.
string PartnerRoomConflict(const PlacementProblem& problem, const vector<int>& assignment,
                           int person, int room) {
    const Person& p = problem.people[person];
    const Room& r = problem.rooms[room];
    if (p.needs_floor_one && r.floor != 1) {
        return absl::StrFormat("on floor %d, incompatible with the floor-1 requirement", r.floor);
    }
    int occupants = 0, bottom_needers = 0;
    for (int q = 0; q < problem.NumPeople(); ++q) {
        if (assignment[q] != room) continue;
        ++occupants;
        if (problem.people[q].needs_bottom_bunk) ++bottom_needers;
    }
    if (p.needs_bottom_bunk && bottom_needers >= r.bottom_capacity) {
        return "with no bottom bunk left for a bottom-bunk requirement";
    }
    if (occupants >= r.TotalCapacity()) return "which is full";
    return "";
}

}  // namespace

vector<pair<int, BunkTier>> AssignBunkTiers(const vector<Person>& people,
                                            const vector<int>& occupants, int bottom_capacity) {
    vector<int> order = occupants;
    stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return people[a].needs_bottom_bunk && !people[b].needs_bottom_bunk;
    });

    vector<pair<int, BunkTier>> tiers;
    tiers.reserve(order.size());
    int bottom_used = 0;
    for (int p : order) {
        if (bottom_used < bottom_capacity) {
            tiers.emplace_back(p, BunkTier::kBottom);
            ++bottom_used;
        } else {
            tiers.emplace_back(p, BunkTier::kTop);
        }
    }
    return tiers;
}

vector<string> DiagnoseUnplaced(const PlacementProblem& problem, const IdentityResolution& resolution,
                                const vector<int>& assignment, int person) {
    vector<string> reasons;
    const Person& p = problem.people[person];

    int floor1_rooms = 0, floor1_bunks = 0, floor1_bottom = 0, bottom_total = 0;
    for (const Room& room : problem.rooms) {
        bottom_total += room.bottom_capacity;
        if (room.floor != 1) continue;
        ++floor1_rooms;
        floor1_bunks += room.TotalCapacity();
        floor1_bottom += room.bottom_capacity;
    }

    if (p.needs_bottom_bunk && p.needs_floor_one) {
        reasons.push_back(floor1_bottom == 0
            ? string("Needs bottom bunk on floor 1 (no such bunks exist)")
            : absl::StrFormat("Needs bottom bunk on floor 1 (%d such bunks exist, likely full)",
                              floor1_bottom));
    } else if (p.needs_bottom_bunk) {
        reasons.push_back(absl::StrFormat("Needs bottom bunk (%d exist total, high demand)",
                                          bottom_total));
    } else if (p.needs_floor_one) {
        reasons.push_back(absl::StrFormat("Needs floor 1 (%d rooms with %d bunks exist)",
                                          floor1_rooms, floor1_bunks));
    }

    const int partner = resolution.targets[person];
    if (partner != kUnassigned) {
        const string name = problem.people[partner].FullName();
        const int room = assignment[partner];
        if (room == kUnassigned) {
            reasons.push_back(absl::StrFormat("Attached to '%s' who is also unplaced", name));
        } else {
            const Room& r = problem.rooms[room];
            string conflict = PartnerRoomConflict(problem, assignment, person, room);
            if (conflict.empty()) {
                reasons.push_back(absl::StrFormat("Attached to '%s' (placed in %s/%s); room may have been full",
                                                  name, r.building, r.name));
            } else {
                reasons.push_back(absl::StrFormat("Attached to '%s' (placed in %s/%s %s)",
                                                  name, r.building, r.name, conflict));
            }
        }
    } else if (!p.attach_text.empty()) {
        for (const AttachAuditEntry& entry : resolution.audit) {
            if (entry.person == person && entry.stage == ResolutionStage::kUnresolved) {
                reasons.push_back(absl::StrFormat(
                    "AttachName '%s' could not be resolved to a person in the list", p.attach_text));
                break;
            }
        }
    }

    if (!p.group.empty()) {
        reasons.push_back(absl::StrFormat("Group '%s' cohesion constraints may have limited options",
                                          p.group));
    }
    if (!p.org.empty()) {
        reasons.push_back(absl::StrFormat("Org '%s' building affinity may have limited available slots",
                                          p.org));
    }

    if (reasons.empty()) reasons.push_back("Capacity exhausted or competing constraints");
    return reasons;
}

Outcome ExtractOutcome(const PlacementProblem& problem, const IdentityResolution& resolution,
                       const vector<int>& assignment) {
    Outcome outcome;
    PlacementSummary& summary = outcome.summary;
    summary.total_people = problem.NumPeople();
    for (const Room& room : problem.rooms) {
        summary.bottom_slots += room.bottom_capacity;
        summary.top_slots += room.top_capacity;
    }
    summary.total_slots = summary.bottom_slots + summary.top_slots;

    vector<vector<int>> occupants(problem.NumRooms());
    for (int p = 0; p < problem.NumPeople(); ++p) {
        if (assignment[p] != kUnassigned) occupants[assignment[p]].push_back(p);
    }

    for (int r = 0; r < problem.NumRooms(); ++r) {
        const Room& room = problem.rooms[r];
        for (const auto& entry : AssignBunkTiers(problem.people, occupants[r], room.bottom_capacity)) {
            const Person& person = problem.people[entry.first];
            PlacementRecord record;
            record.person = entry.first;
            record.room = r;
            record.building = room.building;
            record.room_name = room.name;
            record.floor = room.floor;
            record.tier = entry.second;
            record.attach_resolved = ResolvedName(problem, resolution, entry.first);
            outcome.placements.push_back(record);

            ++summary.placed_by_building[room.building];
            ++summary.placed_by_org_building[person.org][room.building];
        }
    }

    for (int p = 0; p < problem.NumPeople(); ++p) {
        if (assignment[p] != kUnassigned) continue;
        UnplacedRecord record;
        record.person = p;
        record.attach_resolved = ResolvedName(problem, resolution, p);
        record.reasons = DiagnoseUnplaced(problem, resolution, assignment, p);
        outcome.unplaced.push_back(std::move(record));
    }

    summary.placed = static_cast<int>(outcome.placements.size());
    summary.unplaced = static_cast<int>(outcome.unplaced.size());
    return outcome;
}

}  // namespace retreat_placer
