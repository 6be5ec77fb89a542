#include <gtest/gtest.h>
#include "core/cancellation_token.hpp"
#include "core/duplicate_scan_orchestrator.hpp"
#include "core/poco_config_manager.hpp"
#include "core/scan_lock.hpp"
#include "database/database_manager.hpp"
#include "core/json_media_catalog.hpp"
#include "fake_media_catalog.hpp"
#include "test_base.hpp"
#include <future>
#include <memory>
#include <thread>

class DuplicateScanOrchestratorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        store_ = std::make_unique<DatabaseManager>(pathInTestDir("scan.db"));
        ASSERT_TRUE(store_->isValid());

        MediaItem web = makeItem("matrix-web", "The Matrix", 1999, "tt0133093");
        web.path = "/media/The.Matrix.1999.1080p.WEB-DL.mkv";
        setStreams(web, 1080, "h264", "SDR", "aac", 2);

        MediaItem remux = makeItem("matrix-remux", "The Matrix", 1999, "tt0133093");
        remux.path = "/media/The.Matrix.1999.2160p.REMUX.mkv";
        setStreams(remux, 2160, "hevc", "HDR10", "truehd", 8);

        MediaItem heat = makeItem("heat", "Heat", 1995, "tt0113277");

        catalog_.addItem("movies", web);
        catalog_.addItem("movies", remux);
        catalog_.addItem("movies", heat);
    }

    void TearDown() override
    {
        store_.reset();
        TestBase::TearDown();
    }

    DuplicateScanOrchestrator makeOrchestrator(bool dry_run = false) const
    {
        DuplicateScanOrchestrator::Options options;
        options.worker_count = 2;
        options.dry_run = dry_run;
        return DuplicateScanOrchestrator(catalog_, *store_, options);
    }

    FakeMediaCatalog catalog_;
    std::unique_ptr<DatabaseManager> store_;
    PocoConfigManager config_;
    CancellationToken token_;
};

TEST_F(DuplicateScanOrchestratorTest, ScanFindsRanksAndStoresDuplicates)
{
    ScanJob job = makeOrchestrator().runScan(config_, token_);

    EXPECT_EQ(job.status, "Completed");
    EXPECT_EQ(job.duplicates_found, 1);
    EXPECT_EQ(job.items_processed, 3);
    EXPECT_EQ(job.collections_failed, 0);
    EXPECT_EQ(job.progress_percentage, 100);
    EXPECT_TRUE(job.end_time.has_value());
    EXPECT_TRUE(IdGenerator::isUuid(job.job_id));

    auto stored = store_->loadDuplicateGroups("movies");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].primary_version_id, "matrix-remux");
    ASSERT_EQ(stored[0].versions.size(), 2u);
    EXPECT_EQ(stored[0].versions[0].item_id, "matrix-remux");
    EXPECT_GT(stored[0].versions[0].quality_score, stored[0].versions[1].quality_score);
    EXPECT_EQ(stored[0].merged_metadata.title, "The Matrix");
    EXPECT_EQ(stored[0].merged_metadata.external_ids.at("Imdb"), "tt0133093");
}

TEST_F(DuplicateScanOrchestratorTest, ScanCollectionDoesNotPersist)
{
    auto result = makeOrchestrator().scanCollection("movies", LibraryPreferences(), token_);

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.items_scanned, 3u);
    EXPECT_EQ(result.groups.size(), 1u);
    EXPECT_TRUE(store_->loadDuplicateGroups("movies").empty());
}

TEST_F(DuplicateScanOrchestratorTest, DryRunStoresNothing)
{
    ScanJob job = makeOrchestrator(true).runScan(config_, token_);

    EXPECT_EQ(job.status, "Completed");
    EXPECT_EQ(job.duplicates_found, 1);
    EXPECT_TRUE(store_->loadDuplicateGroups("movies").empty());
}

TEST_F(DuplicateScanOrchestratorTest, DryRunModeFromConfig)
{
    config_.update({{"dry_run_mode", true}});

    ScanJob job = makeOrchestrator().runScan(config_, token_);

    EXPECT_EQ(job.status, "Completed");
    EXPECT_TRUE(store_->getCollectionsWithGroups().empty());
}

TEST_F(DuplicateScanOrchestratorTest, FailedCollectionDoesNotStopOthers)
{
    catalog_.addItem("tv", makeItem("ep1", "Pilot", 2005, "tt1"));
    catalog_.addItem("tv", makeItem("ep2", "Pilot", 2005, "tt1"));
    catalog_.addCollection("broken");
    catalog_.failCollection("broken");

    ScanJob job = makeOrchestrator().runScan(config_, token_);

    EXPECT_EQ(job.status, "Completed");
    EXPECT_EQ(job.collections_failed, 1);
    EXPECT_EQ(job.duplicates_found, 2);
    EXPECT_EQ(store_->getCollectionsWithGroups(), (std::vector<std::string>{"movies", "tv"}));
}

TEST_F(DuplicateScanOrchestratorTest, EveryCollectionFailingFailsTheJob)
{
    catalog_.failCollection("movies");

    ScanJob job = makeOrchestrator().runScan(config_, token_);

    EXPECT_EQ(job.status, "Failed");
    EXPECT_EQ(job.collections_failed, 1);
}

TEST_F(DuplicateScanOrchestratorTest, CancellationPersistsNothing)
{
    catalog_.on_list_items = [this](const std::string &)
    { token_.cancel("user request"); };

    ScanJob job = makeOrchestrator().runScan(config_, token_);

    EXPECT_EQ(job.status, "Cancelled");
    EXPECT_EQ(job.status_message, "Cancelled: user request");
    EXPECT_TRUE(store_->getCollectionsWithGroups().empty());
}

TEST_F(DuplicateScanOrchestratorTest, ScanIsSkippedWhileAnotherHoldsTheLock)
{
    std::promise<void> held;
    std::promise<void> done;
    std::thread holder([&]()
                       {
        auto guard = ScanLock::getInstance().tryAcquire();
        held.set_value();
        done.get_future().wait(); });

    held.get_future().wait();
    ScanJob job = makeOrchestrator().runScan(config_, token_);
    done.set_value();
    holder.join();

    EXPECT_EQ(job.status, "Skipped");
    EXPECT_TRUE(store_->getCollectionsWithGroups().empty());
    EXPECT_FALSE(ScanLock::getInstance().isHeld());
}

TEST_F(DuplicateScanOrchestratorTest, DisabledScanningIsSkipped)
{
    config_.update({{"enable_plugin", false}});

    ScanJob job = makeOrchestrator().runScan(config_, token_);

    EXPECT_EQ(job.status, "Skipped");
    EXPECT_TRUE(store_->getCollectionsWithGroups().empty());
}

TEST_F(DuplicateScanOrchestratorTest, CollectionThresholdIsApplied)
{
    config_.update({{"library_preferences", {{"movies", {{"similarity_threshold", 141}}}}}});

    ScanJob job = makeOrchestrator().runScan(config_, token_);

    EXPECT_EQ(job.status, "Completed");
    EXPECT_EQ(job.duplicates_found, 0);
    EXPECT_TRUE(store_->loadDuplicateGroups("movies").empty());
}

TEST_F(DuplicateScanOrchestratorTest, SingleCollectionScan)
{
    catalog_.addItem("tv", makeItem("ep1", "Pilot", 2005, "tt1"));
    catalog_.addItem("tv", makeItem("ep2", "Pilot", 2005, "tt1"));

    ScanJob job = makeOrchestrator().runScan(config_, token_, "tv");

    EXPECT_EQ(job.status, "Completed");
    EXPECT_EQ(job.library_id, "tv");
    EXPECT_EQ(store_->getCollectionsWithGroups(), (std::vector<std::string>{"tv"}));
}

TEST_F(DuplicateScanOrchestratorTest, ProgressReachesOneHundred)
{
    catalog_.addItem("tv", makeItem("ep1", "Pilot", 2005));

    std::vector<int> reported;
    ScanJob job = makeOrchestrator().runScan(config_, token_, "",
                                             [&reported](int percent, const std::string &)
                                             { reported.push_back(percent); });

    EXPECT_EQ(job.status, "Completed");
    EXPECT_EQ(reported, (std::vector<int>{50, 100}));
}

TEST_F(DuplicateScanOrchestratorTest, GroupsWithTooFewResolvableMembersAreDropped)
{
    catalog_.hideItem("matrix-web");

    auto result = makeOrchestrator().scanCollection("movies", LibraryPreferences(), token_);

    EXPECT_TRUE(result.success());
    EXPECT_TRUE(result.groups.empty());
}

TEST_F(DuplicateScanOrchestratorTest, OptionsComeFromConfig)
{
    config_.update({{"scan_threads", 5}, {"grouping_mode", "COMPONENT"}, {"dry_run_mode", true}});

    auto options = DuplicateScanOrchestrator::optionsFromConfig(config_);

    EXPECT_EQ(options.worker_count, 5);
    EXPECT_EQ(options.grouping_mode, GroupingMode::COMPONENT);
    EXPECT_TRUE(options.dry_run);
}

TEST_F(DuplicateScanOrchestratorTest, EndToEndWithJsonCatalog)
{
    std::string path = writeFile("catalog.json", R"({
        "collections": [{
            "id": "films",
            "name": "Films",
            "items": [
                {"id": "h1", "name": "Heat", "production_year": 1995, "provider_ids": {"Imdb": "tt0113277"},
                 "path": "/media/Heat.1995.DVDRip.avi", "community_rating": 8.0,
                 "video": {"height": 480, "codec": "mpeg4"}, "audio": {"codec": "ac3", "channels": 6}},
                {"id": "h2", "name": "Heat", "production_year": 1995, "provider_ids": {"Imdb": "tt0113277", "Tmdb": "949"},
                 "path": "/media/Heat.1995.1080p.BluRay.mkv", "community_rating": 9.0,
                 "video": {"height": 1080, "codec": "h264", "range_type": "SDR"}, "audio": {"codec": "dts", "channels": 6}},
                {"id": "x", "name": "Ronin", "production_year": 1998}
            ]
        }]
    })");
    JsonMediaCatalog catalog = JsonMediaCatalog::fromFile(path);

    DuplicateScanOrchestrator orchestrator(catalog, *store_, DuplicateScanOrchestrator::optionsFromConfig(config_));
    ScanJob job = orchestrator.runScan(config_, token_);

    EXPECT_EQ(job.status, "Completed");
    EXPECT_EQ(job.items_processed, 3);
    EXPECT_EQ(job.duplicates_found, 1);

    auto stored = store_->loadDuplicateGroups("films");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].primary_version_id, "h2");
    EXPECT_DOUBLE_EQ(stored[0].merged_metadata.average_rating, 8.5);
    EXPECT_EQ(stored[0].merged_metadata.external_ids.size(), 2u);
}
