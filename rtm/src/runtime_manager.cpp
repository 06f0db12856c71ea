#include "runtime_manager.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "system_probe.hpp"
#include "utils.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

FetchPolicy fetch_policy_from_settings(const Settings& settings) {
    FetchPolicy policy;
    policy.max_attempts = settings.max_attempts;
    policy.backoff_base = settings.backoff_base;
    policy.backoff_max = settings.backoff_max;
    policy.transfer.connect_timeout_s = settings.connect_timeout_s;
    policy.transfer.low_speed_timeout_s = settings.low_speed_timeout_s;
    policy.transfer.transfer_timeout_s = settings.transfer_timeout_s;
    return policy;
}

RuntimeManager::RuntimeManager(fs::path cache_root, std::shared_ptr<RegistrySource> registry,
                               std::unique_ptr<ReleaseFetcher> fetcher, SystemRuntimeProbe probe)
    : cache_(std::move(cache_root)),
      fetcher_(std::move(fetcher)),
      registry_(std::move(registry)),
      coordinator_(cache_, *fetcher_),
      resolver_(cache_, coordinator_, *registry_, std::move(probe)) {}

RuntimeManager::RuntimeManager(fs::path cache_root, std::shared_ptr<RegistrySource> registry, const Settings& settings)
    : RuntimeManager(std::move(cache_root), std::move(registry),
                     std::make_unique<ReleaseFetcher>(fetch_policy_from_settings(settings)),
                     make_default_probe(settings)) {}

void RuntimeManager::set_poll_interval(std::chrono::milliseconds interval) {
    poll_interval_ = interval;
    resolver_.set_poll_interval(interval);
}

ResolutionResult RuntimeManager::resolve_runtime(const std::string& requirement, const CancelToken& cancel) {
    return resolver_.resolve(requirement, cancel);
}

ProgressSnapshot RuntimeManager::get_install_progress(const std::string& version_id) {
    return coordinator_.progress(version_id);
}

std::vector<CacheEntry> RuntimeManager::list_cached() {
    return cache_.list();
}

void RuntimeManager::evict(const std::string& version_id) {
    validate_version_id(version_id);
    cache_.evict(version_id);
}

fs::path RuntimeManager::install(const std::string& version_id, const CancelToken& cancel, const InstallProgressFn& on_progress) {
    validate_version_id(version_id);
    if (auto installed = cache_.path(version_id)) {
        log_info(string_format("info.already_installed", version_id));
        return *installed;
    }

    auto asset = registry_->find(version_id);
    if (!asset) {
        throw RtmException(ErrorKind::NotFound, string_format("error.not_in_registry", version_id));
    }

    Subscription subscription = coordinator_.request(*asset);
    while (subscription.result().wait_for(poll_interval_) != std::future_status::ready) {
        if (cancel.is_cancelled()) {
            coordinator_.cancel(subscription);
            throw RtmException(ErrorKind::Cancelled, get_string("error.cancelled"));
        }
        if (on_progress) {
            on_progress(coordinator_.progress(version_id));
        }
    }
    return subscription.result().get();
}

void RuntimeManager::set_current(const std::string& version_id) {
    validate_version_id(version_id);
    cache_.set_current(version_id);
}

std::optional<std::string> RuntimeManager::current() {
    return cache_.current();
}

std::vector<std::string> RuntimeManager::collect_garbage(std::size_t keep) {
    return cache_.collect_garbage(keep);
}

std::vector<ReleaseAsset> RuntimeManager::list_available() {
    return registry_->list_versions();
}
