#pragma once

#include <map>
#include <string>
#include <vector>

namespace retreat_placer {

// Room row as supplied by the tabular reader. Every field is still text.
struct RawRoomRecord {
    std::string building;
    std::string room;
    std::string floor;
    std::string bottom_bunks;
    std::string top_bunks;
};

// Roster row as supplied by the tabular reader.
struct RawPersonRecord {
    std::string first_name;
    std::string last_name;
    std::string org;
    std::string group;
    std::string attach;
    std::string floor_pref;  // "1" | "Any"
    std::string bunk_pref;   // "Bottom" | "Any"
};

struct Person {
    std::string first_name;
    std::string last_name;
    std::string org;
    std::string group;
    std::string attach_text;
    bool needs_floor_one = false;
    bool needs_bottom_bunk = false;

    std::string FullName() const {
        if (first_name.empty()) return last_name;
        if (last_name.empty()) return first_name;
        return first_name + " " + last_name;
    }
};

struct Room {
    std::string building;
    std::string name;
    int floor = 1;
    int bottom_capacity = 0;
    int top_capacity = 0;

    int TotalCapacity() const { return bottom_capacity + top_capacity; }
};

enum class BunkTier { kBottom, kTop };

inline const char* BunkTierName(BunkTier tier) {
    return tier == BunkTier::kBottom ? "Bottom" : "Top";
}

// Room index used for people the solver leaves out.
constexpr int kUnassigned = -1;

struct PlacementRecord {
    int person = 0;
    int room = 0;
    std::string building;
    std::string room_name;
    int floor = 1;
    BunkTier tier = BunkTier::kBottom;
    std::string attach_resolved;  // "first last" of the resolved target, or empty
};

struct UnplacedRecord {
    int person = 0;
    std::string attach_resolved;
    std::vector<std::string> reasons;
};

struct PlacementSummary {
    int total_people = 0;
    int placed = 0;
    int unplaced = 0;
    int total_slots = 0;
    int bottom_slots = 0;
    int top_slots = 0;
    std::map<std::string, int> placed_by_building;
    std::map<std::string, std::map<std::string, int>> placed_by_org_building;
};

}  // namespace retreat_placer
