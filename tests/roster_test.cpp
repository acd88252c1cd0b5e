#include "roster.hpp"

#include <vector>

#include "gtest/gtest.h"

namespace retreat_placer {
namespace {

RawPersonRecord PersonRow(const std::string& first, const std::string& last,
                       const std::string& org = "", const std::string& group = "",
                       const std::string& attach = "") {
    return {first, last, org, group, attach, "Any", "Any"};
}

std::vector<RawRoomRecord> OneRoom() {
    return {{"Lodge", "101", "1", "2", "2"}};
}

TEST(CleanField, TrimsAndDropsNullPlaceholders) {
    EXPECT_EQ(CleanField("  Bob "), "Bob");
    EXPECT_EQ(CleanField("nan"), "");
    EXPECT_EQ(CleanField(" None "), "");
    EXPECT_EQ(CleanField(""), "");
}

TEST(LabelTable, FirstSpellingWinsAndIsIdempotent) {
    LabelTable table({"Grace Church", "grace church", "", "Hope"});
    EXPECT_EQ(table.Labels(), (std::vector<std::string>{"Grace Church", "Hope"}));
    EXPECT_EQ(table.Canonical("GRACE CHURCH"), "Grace Church");
    EXPECT_EQ(table.Canonical(table.Canonical("grace church")), table.Canonical("grace church"));
    EXPECT_EQ(table.Canonical("Unknown"), "Unknown");
    EXPECT_TRUE(table.Contains("hope"));
    EXPECT_FALSE(table.Contains(""));
}

TEST(NormalizeInput, CanonicalizesLabelsAndPreferences) {
    std::vector<RawPersonRecord> people = {
        PersonRow(" Ann ", "Lee", "Grace Church", "MomLife"),
        PersonRow("Bo", "Park", "grace church ", "momlife"),
    };
    people[1].floor_pref = "1";
    people[1].bunk_pref = "bottom";

    absl::StatusOr<Roster> roster = NormalizeInput(OneRoom(), people);
    ASSERT_TRUE(roster.ok()) << roster.status();
    ASSERT_EQ(roster->people.size(), 2u);
    EXPECT_EQ(roster->people[0].first_name, "Ann");
    EXPECT_EQ(roster->people[1].org, "Grace Church");
    EXPECT_EQ(roster->people[1].group, "MomLife");
    EXPECT_FALSE(roster->people[0].needs_floor_one);
    EXPECT_TRUE(roster->people[1].needs_floor_one);
    EXPECT_TRUE(roster->people[1].needs_bottom_bunk);
    EXPECT_EQ(roster->rooms[0].TotalCapacity(), 4);
}

TEST(NormalizeInput, AutoAssignsGroupFromAttachReference) {
    std::vector<RawPersonRecord> people = {
        PersonRow("Ann", "Lee", "", "MomLife"),
        PersonRow("Bo", "Park", "", "", "Mom Life"),
    };
    absl::StatusOr<Roster> roster = NormalizeInput(OneRoom(), people);
    ASSERT_TRUE(roster.ok()) << roster.status();
    EXPECT_EQ(roster->people[1].group, "MomLife");
    EXPECT_EQ(roster->people[1].attach_text, "Mom Life");
}

TEST(ParseRooms, AcceptsSpreadsheetNumbers) {
    absl::StatusOr<std::vector<Room>> rooms = ParseRooms({{"Lodge", "101", "2.0", "3", "0.0"}});
    ASSERT_TRUE(rooms.ok()) << rooms.status();
    EXPECT_EQ((*rooms)[0].floor, 2);
    EXPECT_EQ((*rooms)[0].bottom_capacity, 3);
    EXPECT_EQ((*rooms)[0].top_capacity, 0);
}

TEST(ParseRooms, RejectsMalformedRows) {
    absl::StatusOr<std::vector<Room>> bad_floor = ParseRooms({{"Lodge", "101", "3", "1", "1"}});
    ASSERT_FALSE(bad_floor.ok());
    EXPECT_EQ(bad_floor.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(bad_floor.status().message().find("Room row 1"), absl::string_view::npos);

    EXPECT_FALSE(ParseRooms({{"Lodge", "101", "1", "two", "1"}}).ok());
    EXPECT_FALSE(ParseRooms({{"Lodge", "101", "1", "1", "-1"}}).ok());
    EXPECT_FALSE(ParseRooms({{"Lodge", "101", "1", "1.5", "1"}}).ok());
    EXPECT_FALSE(ParseRooms({{"", "101", "1", "1", "1"}}).ok());
    EXPECT_FALSE(ParseRooms({{"Lodge", "101", "1", "1", "1"},
                             {"Lodge", "101", "2", "1", "1"}}).ok());
}

TEST(NormalizeInput, RejectsMalformedPeople) {
    std::vector<RawPersonRecord> nameless = {PersonRow("", " nan ")};
    EXPECT_FALSE(NormalizeInput(OneRoom(), nameless).ok());

    std::vector<RawPersonRecord> bad_bunk = {PersonRow("Ann", "Lee")};
    bad_bunk[0].bunk_pref = "Sideways";
    absl::StatusOr<Roster> roster = NormalizeInput(OneRoom(), bad_bunk);
    ASSERT_FALSE(roster.ok());
    EXPECT_NE(roster.status().message().find("Ann Lee"), absl::string_view::npos);

    std::vector<RawPersonRecord> bad_floor = {PersonRow("Ann", "Lee")};
    bad_floor[0].floor_pref = "2";
    EXPECT_FALSE(NormalizeInput(OneRoom(), bad_floor).ok());
}

}  // namespace
}  // namespace retreat_placer
