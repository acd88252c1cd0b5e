#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "identity_resolver.hpp"
#include "placer_types.hpp"
#include "roster.hpp"

namespace retreat_placer {

// Everything the optimiser needs, reduced to indices and counts. Bunks are not
// modelled individually; each room contributes a bottom and a total capacity.
struct PlacementProblem {
    std::vector<Person> people;
    std::vector<Room> rooms;

    std::vector<std::string> buildings;   // first-seen order
    std::vector<int> room_building;       // room -> building index
    std::vector<int> building_capacity;   // total bunks per building

    // allowed_matrix[p * num_rooms + r] is 1 unless the floor rule excludes r.
    std::vector<int> allowed_matrix;

    // Resolved attach target per person (kUnassigned if none).
    std::vector<int> attach_targets;

    // Preferred building indices per org, from the greedy bin-packing pass.
    std::map<std::string, std::vector<int>> org_buildings;

    std::vector<std::pair<int, int>> mutual_pairs;    // hard: same room
    std::vector<std::pair<int, int>> one_way_pairs;   // soft: same room
    std::vector<std::pair<int, int>> group_pairs;     // soft: same room
    std::vector<std::pair<int, int>> org_pairs;       // soft: same building

    int NumPeople() const { return static_cast<int>(people.size()); }
    int NumRooms() const { return static_cast<int>(rooms.size()); }
    int NumBuildings() const { return static_cast<int>(buildings.size()); }
    bool Allowed(int person, int room) const {
        return allowed_matrix[person * NumRooms() + room] != 0;
    }
    bool PrefersBuilding(int person, int building) const;
};

// Greedy org -> building targets: orgs by descending size, each consuming
// capacity from the buildings with the most remaining capacity until covered.
// Ties keep first-seen order. A soft bias only.
std::map<std::string, std::vector<int>> ComputeOrgBuildingAffinity(
    const std::vector<Person>& people, const LabelTable& orgs,
    const std::vector<std::string>& buildings, const std::vector<int>& building_capacity);

PlacementProblem BuildPlacementProblem(const Roster& roster,
                                       const IdentityResolution& resolution);

}  // namespace retreat_placer
