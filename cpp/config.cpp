#include "config.hpp"

#include <fstream>
#include <sstream>

#include "absl/strings/str_format.h"
#include "google/protobuf/text_format.h"

namespace retreat_placer {

namespace {

const char* const kNicknames[][2] = {
    {"jess", "jessica"}, {"jen", "jennifer"},   {"mike", "michael"},
    {"chris", "christina"}, {"liz", "elizabeth"}, {"bob", "robert"},
    {"bill", "william"},  {"sam", "samantha"},  {"dan", "daniel"},
    {"nick", "nicholas"}, {"nicki", "nicole"},  {"hanna", "hannah"},
    {"stacey", "stacey"}, {"stacy", "stacey"},  {"sherri", "sheri"},
    {"nikki", "nicole"},  {"cathy", "catherine"}, {"kami", "kameron"},
};

const char* const kNonPersonExact[] = {
    "30/40s", "30s 40s", "young ladies", "rock point people",
};

const char* const kNonPersonPrefix[] = {"cr - "};

const char* const kNonPersonSeparator[] = {",", " and ", " & "};

bool InUnitInterval(double v) { return v >= 0.0 && v <= 1.0; }

}  // namespace

PlacerConfig DefaultPlacerConfig() {
    PlacerConfig config;
    // Touch the sub-messages so has_*() holds and defaults are visible in dumps.
    config.mutable_solver();
    config.mutable_weights();
    IdentityOptions* identity = config.mutable_identity();

    auto* nicknames = identity->mutable_nicknames();
    for (const auto& entry : kNicknames) {
        (*nicknames)[entry[0]] = entry[1];
    }
    for (const char* phrase : kNonPersonExact) identity->add_non_person_exact(phrase);
    for (const char* prefix : kNonPersonPrefix) identity->add_non_person_prefix(prefix);
    for (const char* sep : kNonPersonSeparator) identity->add_non_person_separator(sep);
    return config;
}

absl::StatusOr<PlacerConfig> ParsePlacerConfig(const std::string& text_proto) {
    PlacerConfig overrides;
    if (!google::protobuf::TextFormat::ParseFromString(text_proto, &overrides)) {
        return absl::InvalidArgumentError("Could not parse PlacerConfig text proto");
    }
    PlacerConfig config = DefaultPlacerConfig();
    if (overrides.identity().replace_curated_lists()) {
        IdentityOptions* identity = config.mutable_identity();
        identity->clear_nicknames();
        identity->clear_non_person_exact();
        identity->clear_non_person_prefix();
        identity->clear_non_person_separator();
    }
    config.MergeFrom(overrides);

    absl::Status status = ValidatePlacerConfig(config);
    if (!status.ok()) return status;
    return config;
}

absl::StatusOr<PlacerConfig> LoadPlacerConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Cannot open config file '%s'", path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    absl::StatusOr<PlacerConfig> config = ParsePlacerConfig(buffer.str());
    if (!config.ok()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "%s: %s", path, config.status().message()));
    }
    return config;
}

absl::Status ValidatePlacerConfig(const PlacerConfig& config) {
    const ObjectiveWeights& w = config.weights();
    if (w.placement() <= 0 || w.group() <= 0 || w.attach() <= 0 ||
        w.affinity() <= 0 || w.org() <= 0) {
        return absl::InvalidArgumentError("All objective weights must be positive");
    }
    if (w.group() <= w.affinity() || w.attach() <= w.affinity()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Group (%d) and attach (%d) weights must exceed the affinity weight (%d)",
            w.group(), w.attach(), w.affinity()));
    }
    if (w.affinity() <= w.org()) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Affinity weight (%d) must exceed the org weight (%d)",
            w.affinity(), w.org()));
    }

    const SolverOptions& s = config.solver();
    if (s.max_time_in_seconds() <= 0.0) {
        return absl::InvalidArgumentError("max_time_in_seconds must be positive");
    }
    if (s.num_workers() < 0) {
        return absl::InvalidArgumentError("num_workers must not be negative");
    }

    const IdentityOptions& id = config.identity();
    if (!InUnitInterval(id.fuzzy_threshold_with_affinity()) ||
        !InUnitInterval(id.fuzzy_threshold_without_affinity()) ||
        !InUnitInterval(id.fuzzy_caveat_threshold()) ||
        !InUnitInterval(id.last_name_first_similarity())) {
        return absl::InvalidArgumentError("Identity thresholds must lie in [0, 1]");
    }
    if (id.affinity_boost() < 0.0) {
        return absl::InvalidArgumentError("affinity_boost must not be negative");
    }
    if (id.short_prefix_max_length() < 0) {
        return absl::InvalidArgumentError("short_prefix_max_length must not be negative");
    }
    return absl::OkStatus();
}

}  // namespace retreat_placer
