#include "roster.hpp"

#include <cctype>
#include <cmath>
#include <set>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"

using namespace std;

namespace retreat_placer {

namespace {

// Integer cell, tolerating spreadsheet exports that write "2.0".
bool ParseWholeNumber(const string& text, int* out) {
    if (absl::SimpleAtoi(text, out)) return true;
    double d = 0.0;
    if (!absl::SimpleAtod(text, &d) || !std::isfinite(d) || std::floor(d) != d) {
        return false;
    }
    if (d < -1e9 || d > 1e9) return false;
    *out = static_cast<int>(d);
    return true;
}

absl::Status RoomError(int row, const RawRoomRecord& r, const string& what) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Room row %d (building '%s', room '%s'): %s", row, r.building, r.room, what));
}

absl::Status PersonError(int row, const Person& p, const string& what) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Person row %d ('%s'): %s", row, p.FullName(), what));
}

}  // namespace

string CleanField(const string& value) {
    string s(absl::StripAsciiWhitespace(value));
    if (s == "nan" || s == "NaN" || s == "None" || s == "none") return "";
    return s;
}

string CompactKey(const string& value) {
    string out;
    out.reserve(value.size());
    for (char c : value) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        out.push_back(absl::ascii_tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

LabelTable::LabelTable(const vector<string>& labels_in_order) {
    for (const string& label : labels_in_order) {
        if (label.empty()) continue;
        string key = absl::AsciiStrToLower(label);
        if (by_lower.emplace(key, label).second) {
            labels.push_back(label);
        }
    }
}

string LabelTable::Canonical(const string& label) const {
    if (label.empty()) return label;
    auto it = by_lower.find(absl::AsciiStrToLower(label));
    return it == by_lower.end() ? label : it->second;
}

bool LabelTable::Contains(const string& label) const {
    return !label.empty() && by_lower.count(absl::AsciiStrToLower(label)) > 0;
}

CanonicalLabels BuildCanonicalLabels(const vector<RawPersonRecord>& records) {
    vector<string> orgs, groups;
    orgs.reserve(records.size());
    groups.reserve(records.size());
    for (const RawPersonRecord& r : records) {
        orgs.push_back(CleanField(r.org));
        groups.push_back(CleanField(r.group));
    }
    return CanonicalLabels{LabelTable(orgs), LabelTable(groups)};
}

absl::StatusOr<vector<Room>> ParseRooms(const vector<RawRoomRecord>& records) {
    vector<Room> rooms;
    rooms.reserve(records.size());
    set<pair<string, string>> seen;

    for (size_t i = 0; i < records.size(); ++i) {
        const int row = static_cast<int>(i) + 1;
        RawRoomRecord r{CleanField(records[i].building), CleanField(records[i].room),
                        CleanField(records[i].floor), CleanField(records[i].bottom_bunks),
                        CleanField(records[i].top_bunks)};
        if (r.building.empty()) return RoomError(row, r, "missing building name");
        if (r.room.empty()) return RoomError(row, r, "missing room name");

        Room room;
        room.building = r.building;
        room.name = r.room;
        if (!ParseWholeNumber(r.floor, &room.floor) || (room.floor != 1 && room.floor != 2)) {
            return RoomError(row, r, absl::StrFormat("invalid floor '%s' (expected 1 or 2)", r.floor));
        }
        if (!ParseWholeNumber(r.bottom_bunks, &room.bottom_capacity) || room.bottom_capacity < 0) {
            return RoomError(row, r, absl::StrFormat("invalid bottom bunk count '%s'", r.bottom_bunks));
        }
        if (!ParseWholeNumber(r.top_bunks, &room.top_capacity) || room.top_capacity < 0) {
            return RoomError(row, r, absl::StrFormat("invalid top bunk count '%s'", r.top_bunks));
        }
        if (!seen.emplace(room.building, room.name).second) {
            return RoomError(row, r, "duplicate building/room pair");
        }
        rooms.push_back(room);
    }
    return rooms;
}

absl::StatusOr<Roster> NormalizeInput(const vector<RawRoomRecord>& room_records,
                                      const vector<RawPersonRecord>& person_records) {
    Roster roster;
    absl::StatusOr<vector<Room>> rooms = ParseRooms(room_records);
    if (!rooms.ok()) return rooms.status();
    roster.rooms = std::move(rooms).value();
    roster.labels = BuildCanonicalLabels(person_records);

    // Compact group key -> canonical group, for attach references that name a group.
    unordered_map<string, string> group_by_compact;
    for (const string& g : roster.labels.groups.Labels()) {
        group_by_compact.emplace(CompactKey(g), g);
    }

    roster.people.reserve(person_records.size());
    for (size_t i = 0; i < person_records.size(); ++i) {
        const RawPersonRecord& r = person_records[i];
        const int row = static_cast<int>(i) + 1;

        Person p;
        p.first_name = CleanField(r.first_name);
        p.last_name = CleanField(r.last_name);
        p.org = roster.labels.orgs.Canonical(CleanField(r.org));
        p.group = roster.labels.groups.Canonical(CleanField(r.group));
        p.attach_text = CleanField(r.attach);

        if (p.first_name.empty() && p.last_name.empty()) {
            return PersonError(row, p, "missing first and last name");
        }

        const string floor_pref = CleanField(r.floor_pref);
        if (floor_pref == "1") {
            p.needs_floor_one = true;
        } else if (!floor_pref.empty() && !absl::EqualsIgnoreCase(floor_pref, "any")) {
            return PersonError(row, p, absl::StrFormat(
                "invalid RoomLocationPref '%s' (expected 1 or Any)", floor_pref));
        }

        const string bunk_pref = CleanField(r.bunk_pref);
        if (absl::EqualsIgnoreCase(bunk_pref, "bottom")) {
            p.needs_bottom_bunk = true;
        } else if (!bunk_pref.empty() && !absl::EqualsIgnoreCase(bunk_pref, "any")) {
            return PersonError(row, p, absl::StrFormat(
                "invalid BunkPref '%s' (expected Bottom or Any)", bunk_pref));
        }

        if (p.group.empty() && !p.attach_text.empty()) {
            auto it = group_by_compact.find(CompactKey(p.attach_text));
            if (it != group_by_compact.end()) {
                p.group = it->second;
                LOG(WARNING) << "Auto-assigned group '" << p.group << "' for " << p.FullName()
                             << " (attach reference was '" << p.attach_text << "')";
            }
        }
        roster.people.push_back(std::move(p));
    }

    LOG(INFO) << "Roster: " << roster.people.size() << " people, " << roster.rooms.size()
              << " rooms, " << roster.labels.orgs.Labels().size() << " orgs, "
              << roster.labels.groups.Labels().size() << " groups";
    return roster;
}

}  // namespace retreat_placer
