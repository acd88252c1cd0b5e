#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "placer.hpp"
#include "placer_types.hpp"

namespace retreat_placer {

// Splits one CSV line. Double-quoted fields may contain commas and "" escapes.
std::vector<std::string> SplitCsvLine(const std::string& line);

// RoomMap columns: BuildingName, RoomName, RoomFloor, #BottomBunk, #TopBunk.
absl::StatusOr<std::vector<RawRoomRecord>> ReadRoomCsv(const std::string& path);

// PeopleToPlace columns: FirstName, LastName, OrgName, GroupName, AttachName,
// RoomLocationPref, BunkPref.
absl::StatusOr<std::vector<RawPersonRecord>> ReadPeopleCsv(const std::string& path);

// Writes FilledRoomMap.csv, Unplaced.csv and AttachWarnings.csv into `dir`.
absl::Status WriteReport(const std::string& dir, const PlacementReport& report);

void PrintSummary(std::ostream& out, const PlacementReport& report);

}  // namespace retreat_placer
