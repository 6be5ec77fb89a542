#include <gtest/gtest.h>
#include "core/duplicate_group.hpp"
#include "core/id_generator.hpp"

namespace
{
    DuplicateGroup groupOf(std::initializer_list<const char *> ids)
    {
        DuplicateGroup group = DuplicateGroup::create("movies");
        for (const char *id : ids)
        {
            VersionRecord version;
            version.item_id = id;
            group.versions.push_back(version);
        }
        if (ids.size() > 0)
            group.primary_version_id = *ids.begin();
        return group;
    }
}

TEST(DuplicateGroupTest, CreateStampsIdentityAndTime)
{
    DuplicateGroup group = DuplicateGroup::create("movies");

    EXPECT_TRUE(IdGenerator::isUuid(group.group_id));
    EXPECT_EQ(group.library_id, "movies");
    EXPECT_EQ(group.status, "Pending");
    EXPECT_NE(group.detection_timestamp, Timestamp{});
    EXPECT_FALSE(group.last_reviewed_timestamp.has_value());
    EXPECT_NE(DuplicateGroup::create("movies").group_id, group.group_id);
}

TEST(DuplicateGroupTest, ValidityRequiresTwoDistinctMembersAndMemberPrimary)
{
    EXPECT_TRUE(groupOf({"a", "b"}).isValid());
    EXPECT_FALSE(groupOf({"a"}).isValid());
    EXPECT_FALSE(groupOf({"a", "a"}).isValid());

    DuplicateGroup no_primary = groupOf({"a", "b"});
    no_primary.primary_version_id.clear();
    EXPECT_FALSE(no_primary.isValid());

    DuplicateGroup foreign_primary = groupOf({"a", "b"});
    foreign_primary.primary_version_id = "c";
    EXPECT_FALSE(foreign_primary.isValid());
}

TEST(DuplicateGroupTest, PrimaryMustBeAMember)
{
    DuplicateGroup group = groupOf({"a", "b"});

    EXPECT_TRUE(group.setPrimaryVersion("b"));
    EXPECT_EQ(group.primary_version_id, "b");
    EXPECT_FALSE(group.setPrimaryVersion("c"));
    EXPECT_EQ(group.primary_version_id, "b");
    EXPECT_TRUE(group.containsItem("a"));
    EXPECT_FALSE(group.containsItem("c"));
}

TEST(DuplicateGroupTest, JsonKeepsOptionalTimestamps)
{
    DuplicateGroup group = groupOf({"a", "b"});
    group.detection_timestamp = *TimeUtils::fromIso8601("2024-03-01T12:00:00Z");
    group.versions[0].metadata_contribution = {"title"};

    nlohmann::json j = group;
    EXPECT_EQ(j.at("detection_timestamp"), "2024-03-01T12:00:00Z");
    EXPECT_TRUE(j.at("last_reviewed_timestamp").is_null());
    EXPECT_TRUE(j.at("merged_metadata").at("release_date").is_null());

    DuplicateGroup parsed = j.get<DuplicateGroup>();
    EXPECT_EQ(parsed.group_id, group.group_id);
    EXPECT_EQ(parsed.detection_timestamp, group.detection_timestamp);
    EXPECT_FALSE(parsed.last_reviewed_timestamp.has_value());
    EXPECT_EQ(parsed.versions[0].metadata_contribution, (std::vector<std::string>{"title"}));
}
