#include "config.hpp"

#include <fstream>

#include "gtest/gtest.h"

namespace retreat_placer {
namespace {

TEST(PlacerConfig, DefaultsAreValid) {
    PlacerConfig config = DefaultPlacerConfig();
    EXPECT_TRUE(ValidatePlacerConfig(config).ok());
    EXPECT_EQ(config.weights().placement(), 10000);
    EXPECT_EQ(config.weights().group(), 1000);
    EXPECT_EQ(config.weights().attach(), 800);
    EXPECT_EQ(config.weights().affinity(), 200);
    EXPECT_EQ(config.weights().org(), 100);
    EXPECT_DOUBLE_EQ(config.solver().max_time_in_seconds(), 300.0);
    EXPECT_DOUBLE_EQ(config.identity().affinity_boost(), 0.15);
    EXPECT_EQ(config.identity().nicknames().at("jess"), "jessica");
    EXPECT_GT(config.identity().non_person_exact_size(), 0);
}

TEST(PlacerConfig, TextOverridesMergeOverDefaults) {
    absl::StatusOr<PlacerConfig> config = ParsePlacerConfig(R"pb(
        solver { max_time_in_seconds: 5 num_workers: 2 }
        identity {
          nicknames { key: "kate" value: "katherine" }
          non_person_exact: "worship team"
        }
    )pb");
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_DOUBLE_EQ(config->solver().max_time_in_seconds(), 5.0);
    EXPECT_EQ(config->solver().num_workers(), 2);
    EXPECT_EQ(config->solver().random_seed(), 42);
    EXPECT_EQ(config->identity().nicknames().at("kate"), "katherine");
    EXPECT_EQ(config->identity().nicknames().at("jess"), "jessica");
    EXPECT_EQ(config->identity().non_person_exact(config->identity().non_person_exact_size() - 1),
              "worship team");
}

TEST(PlacerConfig, ReplaceCuratedListsDropsBuiltInEntries) {
    absl::StatusOr<PlacerConfig> config = ParsePlacerConfig(R"pb(
        identity {
          replace_curated_lists: true
          nicknames { key: "kate" value: "katherine" }
          non_person_exact: "worship team"
          non_person_separator: " & "
        }
    )pb");
    ASSERT_TRUE(config.ok()) << config.status();
    const IdentityOptions& identity = config->identity();
    EXPECT_EQ(identity.nicknames().size(), 1u);
    EXPECT_EQ(identity.nicknames().count("jess"), 0u);
    ASSERT_EQ(identity.non_person_exact_size(), 1);
    EXPECT_EQ(identity.non_person_exact(0), "worship team");
    EXPECT_EQ(identity.non_person_prefix_size(), 0);
    ASSERT_EQ(identity.non_person_separator_size(), 1);
    EXPECT_EQ(identity.non_person_separator(0), " & ");
    // Non-list settings still come from the defaults.
    EXPECT_DOUBLE_EQ(identity.affinity_boost(), 0.15);
}

TEST(PlacerConfig, RejectsBrokenWeightOrder) {
    absl::StatusOr<PlacerConfig> config = ParsePlacerConfig("weights { affinity: 50 org: 100 }");
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.status().code(), absl::StatusCode::kInvalidArgument);

    EXPECT_FALSE(ParsePlacerConfig("weights { group: 100 }").ok());
    EXPECT_FALSE(ParsePlacerConfig("weights { placement: 0 }").ok());
}

TEST(PlacerConfig, RejectsBadSolverAndThresholds) {
    EXPECT_FALSE(ParsePlacerConfig("solver { max_time_in_seconds: 0 }").ok());
    EXPECT_FALSE(ParsePlacerConfig("solver { num_workers: -1 }").ok());
    EXPECT_FALSE(ParsePlacerConfig("identity { fuzzy_threshold_with_affinity: 1.5 }").ok());
}

TEST(PlacerConfig, RejectsMalformedText) {
    EXPECT_FALSE(ParsePlacerConfig("solver { no_such_field: 1 }").ok());
    EXPECT_FALSE(ParsePlacerConfig("solver {").ok());
}

TEST(PlacerConfig, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "/placer_config.textproto";
    {
        std::ofstream out(path);
        out << "weights { placement: 20000 }\n";
    }
    absl::StatusOr<PlacerConfig> config = LoadPlacerConfig(path);
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->weights().placement(), 20000);

    EXPECT_FALSE(LoadPlacerConfig(::testing::TempDir() + "/missing.textproto").ok());
}

}  // namespace
}  // namespace retreat_placer
