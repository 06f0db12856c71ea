#pragma once

#include "cache_store.hpp"
#include "cancel_token.hpp"
#include "registry.hpp"
#include "release_fetcher.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct ProgressSnapshot {
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
    InstallState state = InstallState::Missing;
};

// State reported for a version whose download task is still listed. Only Missing is
// replaced (the task has not staged yet); terminal states are reported as they are.
InstallState listed_task_state(InstallState cache_state);

// One caller's interest in a download. result().get() yields the installed directory or
// rethrows the task's terminal RtmException; every subscriber of a task sees the same outcome.
class Subscription {
public:
    Subscription() = default;

    const std::string& version_id() const { return version_id_; }
    const std::shared_future<std::filesystem::path>& result() const { return result_; }
    bool valid() const { return result_.valid(); }

private:
    friend class DownloadCoordinator;
    Subscription(std::string version_id, std::uint64_t id, std::shared_future<std::filesystem::path> result)
        : version_id_(std::move(version_id)), id_(id), result_(std::move(result)) {}

    std::string version_id_;
    std::uint64_t id_ = 0;
    std::shared_future<std::filesystem::path> result_;
};

// Runs at most one fetch per version id and fans its result out to every subscriber.
class DownloadCoordinator {
public:
    DownloadCoordinator(CacheStore& cache, ReleaseFetcher& fetcher);
    // Cancels outstanding downloads and waits for their workers.
    ~DownloadCoordinator();
    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    // Attaches to the running task for asset.id or starts one. An installed version
    // yields an already-satisfied subscription.
    Subscription request(const ReleaseAsset& asset);
    // Drops one subscriber; the fetch itself is cancelled when none remain.
    void cancel(const Subscription& subscription);

    ProgressSnapshot progress(const std::string& version_id);
    std::size_t subscriber_count(const std::string& version_id);

private:
    struct Task {
        std::string version_id;
        std::set<std::uint64_t> subscribers;
        CancelToken cancel;
        std::atomic<std::uint64_t> bytes_done{0};
        std::atomic<std::uint64_t> bytes_total{0};
        std::promise<std::filesystem::path> promise;
        std::shared_future<std::filesystem::path> result;
    };

    void run(std::shared_ptr<Task> task, ReleaseAsset asset, std::shared_future<std::filesystem::path> predecessor);
    void reap_workers();

    CacheStore& cache_;
    ReleaseFetcher& fetcher_;

    std::mutex mtx_;
    std::map<std::string, std::shared_ptr<Task>, std::less<>> tasks_;
    std::map<std::string, ProgressSnapshot, std::less<>> last_progress_;
    std::vector<std::future<void>> workers_;
    std::uint64_t next_subscription_ = 1;
    bool shutting_down_ = false;
};
