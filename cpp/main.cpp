#include <cstdlib>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "config.hpp"
#include "ortools/base/init_google.h"
#include "ortools/base/logging.h"
#include "placer.hpp"
#include "report_io.hpp"

ABSL_FLAG(std::string, rooms, "RoomMap.csv", "Room inventory CSV.");
ABSL_FLAG(std::string, people, "PeopleToPlace.csv", "People roster CSV.");
ABSL_FLAG(std::string, output_dir, ".", "Directory for the CSV reports.");
ABSL_FLAG(std::string, config, "", "Optional text-format PlacerConfig overrides.");
ABSL_FLAG(double, max_time_in_seconds, 0.0,
          "Solver time budget; 0 keeps the configured value.");

using namespace std;

namespace {

absl::Status Run() {
    using namespace retreat_placer;

    absl::StatusOr<PlacerConfig> config = absl::GetFlag(FLAGS_config).empty()
        ? absl::StatusOr<PlacerConfig>(DefaultPlacerConfig())
        : LoadPlacerConfig(absl::GetFlag(FLAGS_config));
    if (!config.ok()) return config.status();
    if (absl::GetFlag(FLAGS_max_time_in_seconds) > 0) {
        config->mutable_solver()->set_max_time_in_seconds(absl::GetFlag(FLAGS_max_time_in_seconds));
    }

    absl::StatusOr<vector<RawRoomRecord>> rooms = ReadRoomCsv(absl::GetFlag(FLAGS_rooms));
    if (!rooms.ok()) return rooms.status();
    absl::StatusOr<vector<RawPersonRecord>> people = ReadPeopleCsv(absl::GetFlag(FLAGS_people));
    if (!people.ok()) return people.status();
    LOG(INFO) << "Loaded " << rooms->size() << " rooms and " << people->size() << " people";

    absl::StatusOr<PlacementReport> report = RunPlacement(*rooms, *people, *config);
    if (!report.ok()) return report.status();

    absl::Status written = WriteReport(absl::GetFlag(FLAGS_output_dir), *report);
    if (!written.ok()) return written;
    PrintSummary(cout, *report);
    return absl::OkStatus();
}

}  // namespace

int main(int argc, char* argv[]) {
    InitGoogle(argv[0], &argc, &argv, true);
    absl::Status status = Run();
    if (!status.ok()) {
        LOG(ERROR) << status;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
