#include "problem_builder.hpp"

#include <algorithm>
#include <numeric>
#include <set>
#include <unordered_map>

#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"

using namespace std;

namespace retreat_placer {

namespace {

// Consecutive members of each cohort, cohorts in first-seen label order and
// members in roster order.
vector<pair<int, int>> ConsecutiveCohortPairs(const vector<Person>& people,
                                              const LabelTable& labels,
                                              string Person::*field) {
    unordered_map<string, vector<int>> members;
    for (int p = 0; p < static_cast<int>(people.size()); ++p) {
        const string& label = people[p].*field;
        if (!label.empty()) members[label].push_back(p);
    }
    vector<pair<int, int>> pairs;
    for (const string& label : labels.Labels()) {
        auto it = members.find(label);
        if (it == members.end()) continue;
        const vector<int>& m = it->second;
        for (size_t i = 0; i + 1 < m.size(); ++i) {
            pairs.emplace_back(m[i], m[i + 1]);
        }
    }
    return pairs;
}

}  // namespace

bool PlacementProblem::PrefersBuilding(int person, int building) const {
    const string& org = people[person].org;
    if (org.empty()) return false;
    auto it = org_buildings.find(org);
    if (it == org_buildings.end()) return false;
    return find(it->second.begin(), it->second.end(), building) != it->second.end();
}

map<string, vector<int>> ComputeOrgBuildingAffinity(const vector<Person>& people,
                                                    const LabelTable& orgs,
                                                    const vector<string>& buildings,
                                                    const vector<int>& building_capacity) {
    unordered_map<string, int> org_size;
    for (const Person& p : people) {
        if (!p.org.empty()) ++org_size[p.org];
    }

    vector<string> org_order;
    for (const string& org : orgs.Labels()) {
        if (org_size.count(org) > 0) org_order.push_back(org);
    }
    stable_sort(org_order.begin(), org_order.end(),
                [&](const string& a, const string& b) { return org_size[a] > org_size[b]; });

    vector<int> remaining = building_capacity;
    map<string, vector<int>> org_buildings;

    for (const string& org : org_order) {
        vector<int> order(buildings.size());
        iota(order.begin(), order.end(), 0);
        stable_sort(order.begin(), order.end(),
                    [&](int a, int b) { return remaining[a] > remaining[b]; });

        int needed = org_size[org];
        vector<int> chosen;
        for (int b : order) {
            if (needed <= 0) break;
            if (remaining[b] <= 0) continue;
            int take = min(remaining[b], needed);
            remaining[b] -= take;
            needed -= take;
            chosen.push_back(b);
        }
        sort(chosen.begin(), chosen.end());
        org_buildings[org] = chosen;
    }
    return org_buildings;
}

PlacementProblem BuildPlacementProblem(const Roster& roster, const IdentityResolution& resolution) {
    PlacementProblem problem;
    problem.people = roster.people;
    problem.rooms = roster.rooms;
    problem.attach_targets = resolution.targets;

    unordered_map<string, int> building_index;
    for (const Room& room : problem.rooms) {
        auto it = building_index.find(room.building);
        if (it == building_index.end()) {
            it = building_index.emplace(room.building, problem.NumBuildings()).first;
            problem.buildings.push_back(room.building);
            problem.building_capacity.push_back(0);
        }
        problem.room_building.push_back(it->second);
        problem.building_capacity[it->second] += room.TotalCapacity();
    }

    const int num_people = problem.NumPeople();
    const int num_rooms = problem.NumRooms();
    problem.allowed_matrix.assign(static_cast<size_t>(num_people) * num_rooms, 1);
    for (int p = 0; p < num_people; ++p) {
        if (!problem.people[p].needs_floor_one) continue;
        for (int r = 0; r < num_rooms; ++r) {
            if (problem.rooms[r].floor != 1) problem.allowed_matrix[p * num_rooms + r] = 0;
        }
    }

    problem.org_buildings = ComputeOrgBuildingAffinity(
        problem.people, roster.labels.orgs, problem.buildings, problem.building_capacity);

    set<pair<int, int>> mutual, one_way;
    for (int p = 0; p < num_people; ++p) {
        int target = resolution.targets[p];
        if (target == kUnassigned) continue;
        auto key = minmax(p, target);
        if (resolution.targets[target] == p) {
            mutual.insert(key);
        } else {
            one_way.insert(key);
        }
    }
    problem.mutual_pairs.assign(mutual.begin(), mutual.end());
    problem.one_way_pairs.assign(one_way.begin(), one_way.end());

    problem.group_pairs = ConsecutiveCohortPairs(problem.people, roster.labels.groups, &Person::group);
    problem.org_pairs = ConsecutiveCohortPairs(problem.people, roster.labels.orgs, &Person::org);

    for (const auto& entry : problem.org_buildings) {
        vector<string> names;
        for (int b : entry.second) names.push_back(problem.buildings[b]);
        LOG(INFO) << "Org '" << entry.first << "' -> {" << absl::StrJoin(names, ", ") << "}";
    }
    LOG(INFO) << "Attach pairs: " << problem.mutual_pairs.size() << " mutual (hard), "
              << problem.one_way_pairs.size() << " one-directional (soft); "
              << problem.group_pairs.size() << " group pairs, "
              << problem.org_pairs.size() << " org pairs";
    return problem;
}

}  // namespace retreat_placer
