#include "database/database_manager.hpp"
#include <gtest/gtest.h>
#include "test_base.hpp"
#include <fstream>
#include <memory>
#include <sqlite3.h>

class DatabaseManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        db_path_ = pathInTestDir("media_dedup.db");
        db_ = std::make_unique<DatabaseManager>(db_path_);
        ASSERT_TRUE(db_->isValid());
    }

    void TearDown() override
    {
        db_.reset();
        TestBase::TearDown();
    }

    static DuplicateGroup makeGroup(const std::string &collection_id, const std::vector<std::string> &item_ids)
    {
        DuplicateGroup group = DuplicateGroup::create(collection_id);
        for (const auto &id : item_ids)
        {
            VersionRecord version;
            version.item_id = id;
            version.file_path = "/media/" + id + ".mkv";
            version.quality_score = 50;
            group.versions.push_back(version);
        }
        if (!item_ids.empty())
            group.primary_version_id = item_ids.front();
        return group;
    }

    static DeletionAuditRecord makeRecord(const std::string &item_id, const std::string &when)
    {
        DeletionAuditRecord record = DeletionAuditRecord::create();
        record.group_id = "group-1";
        record.item_id = item_id;
        record.file_path = "/media/" + item_id + ".mkv";
        record.quality_score = 40;
        record.deletion_reason = "Lower quality duplicate";
        record.success = true;
        record.timestamp = *TimeUtils::fromIso8601(when);
        return record;
    }

    std::string db_path_;
    std::unique_ptr<DatabaseManager> db_;
};

TEST_F(DatabaseManagerTest, SaveAndLoadRoundTrip)
{
    DuplicateGroup group = makeGroup("movies", {"a", "b"});
    group.merged_metadata.title = "Heat";
    group.merged_metadata.genres = {"Crime"};
    group.merged_metadata.external_ids["Imdb"] = "tt0113277";
    group.merged_metadata.release_date = TimeUtils::fromIso8601("1995-12-15");

    ASSERT_TRUE(db_->saveDuplicateGroups("movies", {group}).success);

    auto loaded = db_->loadDuplicateGroups("movies");
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].group_id, group.group_id);
    EXPECT_EQ(loaded[0].primary_version_id, "a");
    ASSERT_EQ(loaded[0].versions.size(), 2u);
    EXPECT_EQ(loaded[0].versions[1].file_path, "/media/b.mkv");
    EXPECT_EQ(loaded[0].merged_metadata.title, "Heat");
    EXPECT_EQ(loaded[0].merged_metadata.external_ids.at("Imdb"), "tt0113277");
    ASSERT_TRUE(loaded[0].merged_metadata.release_date.has_value());
    EXPECT_EQ(TimeUtils::toIso8601(*loaded[0].merged_metadata.release_date), "1995-12-15T00:00:00Z");
    EXPECT_FALSE(loaded[0].last_reviewed_timestamp.has_value());
    EXPECT_EQ(loaded[0].status, "Pending");
}

TEST_F(DatabaseManagerTest, SaveReplacesPreviousDocument)
{
    ASSERT_TRUE(db_->saveDuplicateGroups("movies", {makeGroup("movies", {"a", "b"}),
                                                    makeGroup("movies", {"c", "d"})})
                    .success);
    ASSERT_TRUE(db_->saveDuplicateGroups("movies", {makeGroup("movies", {"e", "f"})}).success);

    auto loaded = db_->loadDuplicateGroups("movies");
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].versions[0].item_id, "e");
}

TEST_F(DatabaseManagerTest, InvalidGroupsAreNotStored)
{
    DuplicateGroup single = makeGroup("movies", {"a"});
    DuplicateGroup orphan_primary = makeGroup("movies", {"b", "c"});
    orphan_primary.primary_version_id = "zzz";
    DuplicateGroup valid = makeGroup("movies", {"d", "e"});

    ASSERT_TRUE(db_->saveDuplicateGroups("movies", {single, orphan_primary, valid}).success);

    auto loaded = db_->loadDuplicateGroups("movies");
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].group_id, valid.group_id);
}

TEST_F(DatabaseManagerTest, UnknownCollectionLoadsEmpty)
{
    EXPECT_TRUE(db_->loadDuplicateGroups("nothing-here").empty());
}

TEST_F(DatabaseManagerTest, CollectionsWithGroupsAreListed)
{
    db_->saveDuplicateGroups("tv", {makeGroup("tv", {"a", "b"})});
    db_->saveDuplicateGroups("movies", {makeGroup("movies", {"c", "d"})});

    EXPECT_EQ(db_->getCollectionsWithGroups(), (std::vector<std::string>{"movies", "tv"}));
}

TEST_F(DatabaseManagerTest, CorruptDocumentLoadsEmpty)
{
    db_->saveDuplicateGroups("movies", {makeGroup("movies", {"a", "b"})});

    sqlite3 *raw = nullptr;
    ASSERT_EQ(sqlite3_open(db_path_.c_str(), &raw), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(raw, "UPDATE duplicate_groups SET groups_json = '{not json' WHERE collection_id = 'movies'",
                           nullptr, nullptr, nullptr),
              SQLITE_OK);
    sqlite3_close(raw);

    EXPECT_TRUE(db_->loadDuplicateGroups("movies").empty());
}

TEST_F(DatabaseManagerTest, ReviewUpdateIsPersisted)
{
    DuplicateGroup group = makeGroup("movies", {"a", "b"});
    db_->saveDuplicateGroups("movies", {group});

    Timestamp reviewed = *TimeUtils::fromIso8601("2024-03-01T12:00:00Z");
    ASSERT_TRUE(db_->updateGroupReview("movies", group.group_id, "Reviewed", reviewed).success);

    auto loaded = db_->loadDuplicateGroups("movies");
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].status, "Reviewed");
    ASSERT_TRUE(loaded[0].last_reviewed_timestamp.has_value());
    EXPECT_EQ(TimeUtils::toIso8601(*loaded[0].last_reviewed_timestamp), "2024-03-01T12:00:00Z");

    EXPECT_FALSE(db_->updateGroupReview("movies", "missing-group", "Reviewed", reviewed).success);
}

TEST_F(DatabaseManagerTest, PrimaryVersionMustBeAMember)
{
    DuplicateGroup group = makeGroup("movies", {"a", "b"});
    db_->saveDuplicateGroups("movies", {group});

    EXPECT_TRUE(db_->setPrimaryVersion("movies", group.group_id, "b").success);
    EXPECT_EQ(db_->loadDuplicateGroups("movies")[0].primary_version_id, "b");

    DBOpResult rejected = db_->setPrimaryVersion("movies", group.group_id, "stranger");
    EXPECT_FALSE(rejected.success);
    EXPECT_FALSE(rejected.error_message.empty());
    EXPECT_EQ(db_->loadDuplicateGroups("movies")[0].primary_version_id, "b");
}

TEST_F(DatabaseManagerTest, AuditRecordsAreReturnedNewestFirst)
{
    db_->logDeletion(makeRecord("old", "2024-01-10T08:00:00Z"));
    db_->logDeletion(makeRecord("new", "2024-03-05T08:00:00Z"));
    db_->logDeletion(makeRecord("mid", "2024-02-20T08:00:00Z"));

    auto records = db_->getAuditRecords();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].item_id, "new");
    EXPECT_EQ(records[1].item_id, "mid");
    EXPECT_EQ(records[2].item_id, "old");
    EXPECT_EQ(records[0].deletion_reason, "Lower quality duplicate");
    EXPECT_TRUE(records[0].success);
}

TEST_F(DatabaseManagerTest, AuditRangeIsInclusive)
{
    db_->logDeletion(makeRecord("jan", "2024-01-10T08:00:00Z"));
    db_->logDeletion(makeRecord("feb", "2024-02-20T08:00:00Z"));
    db_->logDeletion(makeRecord("mar", "2024-03-05T08:00:00Z"));

    auto records = db_->getAuditRecords(TimeUtils::fromIso8601("2024-02-20T08:00:00Z"),
                                        TimeUtils::fromIso8601("2024-03-05T08:00:00Z"));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].item_id, "mar");
    EXPECT_EQ(records[1].item_id, "feb");

    auto until_feb = db_->getAuditRecords(std::nullopt, TimeUtils::fromIso8601("2024-02-28"));
    ASSERT_EQ(until_feb.size(), 2u);
    EXPECT_EQ(until_feb[1].item_id, "jan");
}

TEST_F(DatabaseManagerTest, ExportWritesOneLinePerRecordOfTheMonth)
{
    db_->logDeletion(makeRecord("second", "2024-03-20T08:00:00Z"));
    db_->logDeletion(makeRecord("first", "2024-03-01T08:00:00Z"));
    db_->logDeletion(makeRecord("other", "2024-04-01T08:00:00Z"));

    std::string out = pathInTestDir("deletion_audit_2024_03.jsonl");
    ASSERT_TRUE(db_->exportAuditMonth("2024_03", out).success);

    std::ifstream in(out);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);)
    {
        if (!line.empty())
            lines.push_back(line);
    }

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(lines[0]).at("item_id"), "first");
    EXPECT_EQ(nlohmann::json::parse(lines[1]).at("item_id"), "second");
}

TEST_F(DatabaseManagerTest, PurgeRemovesRecordsOutsideRetention)
{
    DeletionAuditRecord recent = DeletionAuditRecord::create();
    recent.item_id = "recent";
    db_->logDeletion(recent);
    db_->logDeletion(makeRecord("ancient", "2001-01-01T00:00:00Z"));

    auto result = db_->purgeAuditRecordsOlderThan(30);
    ASSERT_TRUE(result.first.success);
    EXPECT_EQ(result.second, 1u);

    auto remaining = db_->getAuditRecords();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].item_id, "recent");

    EXPECT_FALSE(db_->purgeAuditRecordsOlderThan(-1).first.success);
}

TEST(DatabaseManagerMemoryTest, InMemoryDatabaseWorks)
{
    Logger::init("WARN");
    DatabaseManager db(":memory:");
    ASSERT_TRUE(db.isValid());
    EXPECT_EQ(db.getPath(), ":memory:");
    EXPECT_TRUE(db.getCollectionsWithGroups().empty());
}
