#pragma once

#include "cache_store.hpp"
#include "cancel_token.hpp"
#include "config.hpp"
#include "download_coordinator.hpp"
#include "registry.hpp"
#include "release_fetcher.hpp"
#include "version_resolver.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using InstallProgressFn = std::function<void(const ProgressSnapshot&)>;

FetchPolicy fetch_policy_from_settings(const Settings& settings);

// Owns one cache root and everything that operates on it. Leases handed out by
// resolve_runtime() must be released before the manager is destroyed.
class RuntimeManager {
public:
    RuntimeManager(std::filesystem::path cache_root, std::shared_ptr<RegistrySource> registry,
                   std::unique_ptr<ReleaseFetcher> fetcher, SystemRuntimeProbe probe);
    // Production wiring: a curl fetcher tuned by `settings` and the default system probe.
    RuntimeManager(std::filesystem::path cache_root, std::shared_ptr<RegistrySource> registry, const Settings& settings);
    RuntimeManager(const RuntimeManager&) = delete;
    RuntimeManager& operator=(const RuntimeManager&) = delete;

    ResolutionResult resolve_runtime(const std::string& requirement, const CancelToken& cancel = {});
    ProgressSnapshot get_install_progress(const std::string& version_id);
    std::vector<CacheEntry> list_cached();
    void evict(const std::string& version_id);

    // Downloads and installs an exact registry version without fallback. Throws
    // RtmException(NotFound) if the registry does not publish it.
    std::filesystem::path install(const std::string& version_id, const CancelToken& cancel = {},
                                  const InstallProgressFn& on_progress = {});
    void set_current(const std::string& version_id);
    std::optional<std::string> current();
    std::vector<std::string> collect_garbage(std::size_t keep);
    std::vector<ReleaseAsset> list_available();

    CacheStore& cache() { return cache_; }
    DownloadCoordinator& coordinator() { return coordinator_; }
    void set_poll_interval(std::chrono::milliseconds interval);

private:
    CacheStore cache_;
    std::unique_ptr<ReleaseFetcher> fetcher_;
    std::shared_ptr<RegistrySource> registry_;
    DownloadCoordinator coordinator_;
    VersionResolver resolver_;
    std::chrono::milliseconds poll_interval_{50};
};
