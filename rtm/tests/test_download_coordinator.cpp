#include <gtest/gtest.h>
#include "../src/cache_store.hpp"
#include "../src/download_coordinator.hpp"
#include "../src/localization.hpp"
#include "../src/utils.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class DownloadCoordinatorTest : public ::testing::Test {
protected:
    fs::path work_dir;
    std::unique_ptr<CacheStore> store;
    std::unique_ptr<ScriptedFetcher> fetcher;
    std::unique_ptr<DownloadCoordinator> coordinator;
    ReleaseAsset asset;

    void SetUp() override {
        init_localization();
        set_quiet_mode(true);
        work_dir = fs::absolute("tmp_download_coordinator_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        fs::create_directories(work_dir);

        store = std::make_unique<CacheStore>(work_dir / "cache");
        fetcher = std::make_unique<ScriptedFetcher>();
        coordinator = std::make_unique<DownloadCoordinator>(*store, *fetcher);
        asset = asset_for("ge-8.26", make_runtime_tarball(work_dir, "ge-8.26"));
    }

    void TearDown() override {
        fetcher->release();
        coordinator.reset();
        fetcher.reset();
        store.reset();
        set_quiet_mode(false);
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }

    static bool ready(const Subscription& s, std::chrono::milliseconds timeout = 10s) {
        return s.result().wait_for(timeout) == std::future_status::ready;
    }
};

TEST_F(DownloadCoordinatorTest, InstallsAndReportsProgress) {
    auto sub = coordinator->request(asset);
    ASSERT_TRUE(ready(sub));
    EXPECT_EQ(sub.result().get(), work_dir / "cache" / "versions" / "ge-8.26");
    EXPECT_EQ(fetcher->transfers, 1);

    auto progress = coordinator->progress("ge-8.26");
    EXPECT_EQ(progress.state, InstallState::Installed);
    EXPECT_EQ(progress.bytes_done, *asset.integrity.size);
    EXPECT_EQ(progress.bytes_total, *asset.integrity.size);
}

TEST_F(DownloadCoordinatorTest, ConcurrentRequestsShareOneFetch) {
    fetcher->hold();
    const int n = 8;
    std::vector<Subscription> subs;
    for (int i = 0; i < n; ++i) {
        subs.push_back(coordinator->request(asset));
    }
    ASSERT_TRUE(fetcher->wait_until_waiting(1));
    EXPECT_EQ(coordinator->subscriber_count("ge-8.26"), static_cast<size_t>(n));

    auto progress = coordinator->progress("ge-8.26");
    EXPECT_EQ(progress.state, InstallState::Staging);
    EXPECT_EQ(progress.bytes_done, *asset.integrity.size / 2);

    fetcher->release();
    for (auto& s : subs) {
        ASSERT_TRUE(ready(s));
        EXPECT_EQ(s.result().get(), subs[0].result().get());
    }
    EXPECT_EQ(fetcher->transfers, 1);
    EXPECT_EQ(coordinator->subscriber_count("ge-8.26"), 0u);
}

TEST_F(DownloadCoordinatorTest, ConcurrentRequestsFromThreads) {
    fetcher->hold();
    std::vector<std::future<fs::path>> results;
    for (int i = 0; i < 6; ++i) {
        results.push_back(std::async(std::launch::async, [this]() {
            auto s = coordinator->request(asset);
            return s.result().get();
        }));
    }
    ASSERT_TRUE(fetcher->wait_until_waiting(1));
    std::this_thread::sleep_for(50ms);
    fetcher->release();
    for (auto& r : results) {
        EXPECT_EQ(r.get(), work_dir / "cache" / "versions" / "ge-8.26");
    }
    EXPECT_EQ(fetcher->transfers, 1);
}

TEST_F(DownloadCoordinatorTest, InstalledVersionDoesNotFetch) {
    auto first = coordinator->request(asset);
    ASSERT_TRUE(ready(first));
    EXPECT_EQ(fetcher->transfers, 1);

    auto again = coordinator->request(asset);
    ASSERT_TRUE(ready(again, 0ms));
    EXPECT_EQ(again.result().get(), first.result().get());
    EXPECT_EQ(fetcher->transfers, 1);
}

TEST_F(DownloadCoordinatorTest, CancellingOneSubscriberKeepsDownload) {
    fetcher->hold();
    auto a = coordinator->request(asset);
    auto b = coordinator->request(asset);
    ASSERT_TRUE(fetcher->wait_until_waiting(1));

    coordinator->cancel(a);
    EXPECT_EQ(coordinator->subscriber_count("ge-8.26"), 1u);

    fetcher->release();
    ASSERT_TRUE(ready(b));
    EXPECT_NO_THROW(b.result().get());
    EXPECT_EQ(store->state("ge-8.26"), InstallState::Installed);
}

TEST_F(DownloadCoordinatorTest, CancelAtHalfwayThenFreshRetry) {
    fetcher->hold();
    auto sub = coordinator->request(asset);
    ASSERT_TRUE(fetcher->wait_until_waiting(1));
    EXPECT_EQ(coordinator->progress("ge-8.26").bytes_done, *asset.integrity.size / 2);

    coordinator->cancel(sub);
    ASSERT_TRUE(ready(sub));
    try {
        sub.result().get();
        FAIL() << "expected Cancelled";
    } catch (const RtmException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    EXPECT_EQ(store->state("ge-8.26"), InstallState::Missing);
    EXPECT_FALSE(fs::exists(work_dir / "cache" / "staging" / "ge-8.26"));
    EXPECT_FALSE(fs::exists(work_dir / "cache" / "versions" / "ge-8.26"));

    fetcher->release();
    auto retry = coordinator->request(asset);
    ASSERT_TRUE(ready(retry));
    EXPECT_NO_THROW(retry.result().get());
    EXPECT_EQ(fetcher->transfers, 2);
    EXPECT_EQ(store->state("ge-8.26"), InstallState::Installed);
}

TEST_F(DownloadCoordinatorTest, RequestDuringDrainStartsNewTask) {
    fetcher->hold();
    auto first = coordinator->request(asset);
    ASSERT_TRUE(fetcher->wait_until_waiting(1));
    coordinator->cancel(first);

    // The cancelled task may still be unwinding; the new request must not join it.
    auto second = coordinator->request(asset);
    fetcher->release();
    ASSERT_TRUE(ready(second));
    EXPECT_NO_THROW(second.result().get());
    EXPECT_EQ(store->state("ge-8.26"), InstallState::Installed);
}

TEST_F(DownloadCoordinatorTest, IntegrityFailureIsSharedAndLeavesNothing) {
    asset.integrity.sha256 = std::string(64, 'f');
    fetcher->hold();
    auto a = coordinator->request(asset);
    auto b = coordinator->request(asset);
    fetcher->release();

    for (auto* s : {&a, &b}) {
        ASSERT_TRUE(ready(*s));
        try {
            s->result().get();
            FAIL() << "expected Integrity";
        } catch (const RtmException& e) {
            EXPECT_EQ(e.kind(), ErrorKind::Integrity);
        }
    }
    EXPECT_EQ(fetcher->transfers, 1);
    EXPECT_EQ(coordinator->progress("ge-8.26").state, InstallState::Failed);
    EXPECT_FALSE(fs::exists(work_dir / "cache" / "versions" / "ge-8.26"));
}

TEST_F(DownloadCoordinatorTest, TransientFailuresAreAbsorbed) {
    fetcher->transient_failures = 2;
    auto sub = coordinator->request(asset);
    ASSERT_TRUE(ready(sub));
    EXPECT_NO_THROW(sub.result().get());
    EXPECT_EQ(fetcher->transfers, 3);
}

TEST_F(DownloadCoordinatorTest, DifferentVersionsDownloadIndependently) {
    auto other = asset_for("ge-9.1", make_runtime_tarball(work_dir, "ge-9.1"));
    fetcher->hold();
    auto a = coordinator->request(asset);
    auto b = coordinator->request(other);
    ASSERT_TRUE(fetcher->wait_until_waiting(2));
    EXPECT_EQ(coordinator->subscriber_count("ge-8.26"), 1u);
    EXPECT_EQ(coordinator->subscriber_count("ge-9.1"), 1u);
    fetcher->release();
    ASSERT_TRUE(ready(a));
    ASSERT_TRUE(ready(b));
    EXPECT_EQ(fetcher->transfers, 2);
    EXPECT_EQ(store->list().size(), 2u);
}

TEST_F(DownloadCoordinatorTest, ShutdownCancelsOutstandingWork) {
    fetcher->hold();
    auto sub = coordinator->request(asset);
    ASSERT_TRUE(fetcher->wait_until_waiting(1));
    coordinator.reset();

    ASSERT_TRUE(ready(sub, 0ms));
    EXPECT_THROW(sub.result().get(), RtmException);
    EXPECT_FALSE(fs::exists(work_dir / "cache" / "staging" / "ge-8.26"));
}

TEST(ListedTaskStateTest, OnlyMissingIsReportedAsStaging) {
    EXPECT_EQ(listed_task_state(InstallState::Missing), InstallState::Staging);
    EXPECT_EQ(listed_task_state(InstallState::Staging), InstallState::Staging);
    EXPECT_EQ(listed_task_state(InstallState::Verifying), InstallState::Verifying);
    EXPECT_EQ(listed_task_state(InstallState::Installed), InstallState::Installed);
    EXPECT_EQ(listed_task_state(InstallState::Failed), InstallState::Failed);
}
