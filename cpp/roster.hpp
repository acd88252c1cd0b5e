#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "absl/status/statusor.h"
#include "placer_types.hpp"

namespace retreat_placer {

// Case-insensitive label table mapping every spelling to the first spelling
// seen. Immutable once built.
class LabelTable {
public:
    LabelTable() = default;
    explicit LabelTable(const std::vector<std::string>& labels_in_order);

    // Canonical spelling of `label`, or `label` unchanged if it is unknown or
    // empty. Canonical(Canonical(x)) == Canonical(x).
    std::string Canonical(const std::string& label) const;

    bool Contains(const std::string& label) const;

    // Canonical labels in first-seen order.
    const std::vector<std::string>& Labels() const { return labels; }

private:
    std::vector<std::string> labels;
    std::unordered_map<std::string, std::string> by_lower;
};

// Per-run org and group canonicalization, built once and passed by const
// reference to everything that matches or groups on labels.
struct CanonicalLabels {
    LabelTable orgs;
    LabelTable groups;
};

CanonicalLabels BuildCanonicalLabels(const std::vector<RawPersonRecord>& records);

struct Roster {
    std::vector<Person> people;
    std::vector<Room> rooms;
    CanonicalLabels labels;
};

// Trims and validates raw records, canonicalizes org/group labels and fills in
// a missing group from an attach reference that names a known group. Returns
// InvalidArgument naming the first malformed record.
absl::StatusOr<Roster> NormalizeInput(const std::vector<RawRoomRecord>& room_records,
                                      const std::vector<RawPersonRecord>& person_records);

absl::StatusOr<std::vector<Room>> ParseRooms(const std::vector<RawRoomRecord>& records);

// Trimmed text with spreadsheet null placeholders ("nan", "None", ...) mapped
// to the empty string.
std::string CleanField(const std::string& value);

// Lowercase with all whitespace removed; the key used for cohort-label lookups.
std::string CompactKey(const std::string& value);

}  // namespace retreat_placer
