#include "download_coordinator.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <algorithm>
#include <chrono>

namespace fs = std::filesystem;

InstallState listed_task_state(InstallState cache_state) {
    return cache_state == InstallState::Missing ? InstallState::Staging : cache_state;
}

DownloadCoordinator::DownloadCoordinator(CacheStore& cache, ReleaseFetcher& fetcher)
    : cache_(cache), fetcher_(fetcher) {}

DownloadCoordinator::~DownloadCoordinator() {
    std::vector<std::future<void>> workers;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        shutting_down_ = true;
        for (auto& [id, task] : tasks_) {
            task->cancel.cancel();
        }
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        worker.wait();
    }
}

void DownloadCoordinator::reap_workers() {
    workers_.erase(std::remove_if(workers_.begin(), workers_.end(), [](std::future<void>& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), workers_.end());
}

Subscription DownloadCoordinator::request(const ReleaseAsset& asset) {
    validate_version_id(asset.id);

    std::lock_guard<std::mutex> lock(mtx_);
    if (shutting_down_) {
        throw RtmException(ErrorKind::Cancelled, get_string("error.coordinator_shutting_down"));
    }
    reap_workers();

    std::shared_future<fs::path> predecessor;
    if (auto it = tasks_.find(asset.id); it != tasks_.end()) {
        auto& task = it->second;
        if (!task->cancel.is_cancelled()) {
            const std::uint64_t id = next_subscription_++;
            task->subscribers.insert(id);
            log_info(string_format("info.download_attached", asset.id, task->subscribers.size()));
            return Subscription(asset.id, id, task->result);
        }
        // Every subscriber left; the old task is draining and still owns staging.
        predecessor = task->result;
    }

    if (auto installed = cache_.path(asset.id)) {
        std::promise<fs::path> ready;
        ready.set_value(*installed);
        return Subscription(asset.id, 0, ready.get_future().share());
    }

    auto task = std::make_shared<Task>();
    task->version_id = asset.id;
    task->result = task->promise.get_future().share();
    const std::uint64_t id = next_subscription_++;
    task->subscribers.insert(id);

    tasks_[asset.id] = task;
    last_progress_.erase(asset.id);
    try {
        workers_.push_back(std::async(std::launch::async, &DownloadCoordinator::run, this, task, asset, predecessor));
    } catch (const std::system_error&) {
        tasks_.erase(asset.id);
        throw;
    }
    log_info(string_format("info.download_started", asset.id));
    return Subscription(asset.id, id, task->result);
}

void DownloadCoordinator::cancel(const Subscription& subscription) {
    if (subscription.id_ == 0) return;

    std::lock_guard<std::mutex> lock(mtx_);
    auto it = tasks_.find(subscription.version_id_);
    if (it == tasks_.end()) return;
    auto& task = it->second;
    if (task->subscribers.erase(subscription.id_) == 0) return;

    if (task->subscribers.empty()) {
        log_info(string_format("info.download_cancelled", task->version_id));
        task->cancel.cancel();
    }
}

ProgressSnapshot DownloadCoordinator::progress(const std::string& version_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    ProgressSnapshot snapshot;
    snapshot.state = cache_.state(version_id);

    if (auto it = tasks_.find(version_id); it != tasks_.end()) {
        snapshot.bytes_done = it->second->bytes_done.load();
        snapshot.bytes_total = it->second->bytes_total.load();
        snapshot.state = listed_task_state(snapshot.state);
    } else if (auto last = last_progress_.find(version_id); last != last_progress_.end()) {
        snapshot.bytes_done = last->second.bytes_done;
        snapshot.bytes_total = last->second.bytes_total;
    }
    return snapshot;
}

std::size_t DownloadCoordinator::subscriber_count(const std::string& version_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = tasks_.find(version_id);
    return it == tasks_.end() ? 0 : it->second->subscribers.size();
}

void DownloadCoordinator::run(std::shared_ptr<Task> task, ReleaseAsset asset, std::shared_future<fs::path> predecessor) {
    if (predecessor.valid()) {
        predecessor.wait();
    }

    fs::path installed;
    std::exception_ptr failure;
    StagingHandle staging;

    auto abandon = [&](bool failed) {
        try {
            staging.abandon(failed);
        } catch (const std::exception& e) {
            log_error(string_format("error.staging_cleanup_failed", task->version_id, e.what()));
        }
    };

    try {
        task->cancel.throw_if_cancelled();
        // A draining predecessor may have committed before it noticed the cancel.
        if (auto done = cache_.path(task->version_id)) {
            installed = *done;
        } else {
            staging = cache_.begin_install(task->version_id);
            FetchDigest digest = fetcher_.fetch(asset, staging, task->cancel,
                [&task](std::uint64_t done_bytes, std::uint64_t total) {
                    task->bytes_done = done_bytes;
                    if (total > 0) task->bytes_total = total;
                });
            task->bytes_done = digest.bytes;
            task->cancel.throw_if_cancelled();
            cache_.mark_verifying(staging);
            installed = cache_.commit_install(staging, asset.integrity, digest);
        }
    } catch (const RtmException& e) {
        abandon(e.kind() != ErrorKind::Cancelled);
        failure = std::current_exception();
        if (e.kind() == ErrorKind::Cancelled) {
            log_warning(string_format("warning.download_cancelled", task->version_id));
        } else {
            log_error(string_format("error.fetch_failed", task->version_id, e.what()));
        }
    } catch (const std::exception& e) {
        abandon(true);
        failure = std::make_exception_ptr(RtmException(ErrorKind::Disk, string_format("error.fetch_failed", task->version_id, e.what())));
        log_error(string_format("error.fetch_failed", task->version_id, e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (auto it = tasks_.find(task->version_id); it != tasks_.end() && it->second == task) {
            tasks_.erase(it);
        }
        ProgressSnapshot last;
        last.bytes_done = task->bytes_done.load();
        last.bytes_total = task->bytes_total.load();
        last.state = cache_.state(task->version_id);
        last_progress_[task->version_id] = last;
    }

    // The task is terminal and unlisted before anyone can observe its result.
    if (failure) {
        task->promise.set_exception(failure);
    } else {
        task->promise.set_value(installed);
    }
}
