#pragma once

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "placer_config.pb.h"

namespace retreat_placer {

// Built-in configuration, including the curated nickname table and the
// non-person phrase lists.
PlacerConfig DefaultPlacerConfig();

// Parses a text-format PlacerConfig and merges it over DefaultPlacerConfig().
// Nickname entries replace the default for the same key; list entries are
// appended to the curated lists, unless identity.replace_curated_lists is set,
// in which case the override's tables replace the built-in ones.
absl::StatusOr<PlacerConfig> ParsePlacerConfig(const std::string& text_proto);
absl::StatusOr<PlacerConfig> LoadPlacerConfig(const std::string& path);

absl::Status ValidatePlacerConfig(const PlacerConfig& config);

}  // namespace retreat_placer
