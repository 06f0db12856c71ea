#include "version_resolver.hpp"

#include "localization.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

std::string_view resolution_kind_name(ResolutionKind kind) {
    switch (kind) {
        case ResolutionKind::UsedRequested: return "requested";
        case ResolutionKind::UsedCachedAlternate: return "cached-alternate";
        case ResolutionKind::UsedSystemFallback: return "system-fallback";
        case ResolutionKind::Failed: return "failed";
    }
    return "unknown";
}

ResolutionResult ResolutionResult::failed(ErrorKind reason, std::string message) {
    ResolutionResult result;
    result.kind = ResolutionKind::Failed;
    result.reason = reason;
    result.message = std::move(message);
    return result;
}

VersionResolver::VersionResolver(CacheStore& cache, DownloadCoordinator& coordinator, RegistrySource& registry,
                                 SystemRuntimeProbe probe, FallbackPolicy policy)
    : cache_(cache), coordinator_(coordinator), registry_(registry),
      probe_(std::move(probe)), policy_(policy) {}

std::optional<ResolutionResult> VersionResolver::use_cached(const PlanAttempt& attempt, ResolutionKind kind) {
    auto lease = cache_.acquire(attempt.version_id);
    if (!lease) {
        // Evicted since the plan was made.
        return std::nullopt;
    }
    ResolutionResult result;
    result.kind = kind;
    result.version_id = attempt.version_id;
    result.path = lease->path();
    result.lease = std::move(lease);
    return result;
}

std::optional<ResolutionResult> VersionResolver::fetch_exact(const PlanAttempt& attempt, const CancelToken& cancel) {
    std::optional<ReleaseAsset> asset;
    try {
        asset = registry_.find(attempt.version_id);
    } catch (const RtmException& e) {
        log_warning(string_format("warning.registry_lookup_failed", attempt.version_id, e.what()));
        return std::nullopt;
    }
    if (!asset) {
        log_info(string_format("info.not_in_registry", attempt.version_id));
        return std::nullopt;
    }

    Subscription subscription;
    try {
        subscription = coordinator_.request(*asset);
    } catch (const RtmException& e) {
        log_warning(string_format("warning.fetch_not_started", attempt.version_id, e.what()));
        return std::nullopt;
    }

    while (subscription.result().wait_for(poll_interval_) != std::future_status::ready) {
        if (cancel.is_cancelled()) {
            coordinator_.cancel(subscription);
            return ResolutionResult::failed(ErrorKind::Cancelled, get_string("error.cancelled"));
        }
    }

    try {
        subscription.result().get();
    } catch (const RtmException& e) {
        if (cancel.is_cancelled()) {
            return ResolutionResult::failed(ErrorKind::Cancelled, get_string("error.cancelled"));
        }
        log_warning(string_format("warning.fetch_failed_falling_back", attempt.version_id, e.what()));
        return std::nullopt;
    } catch (const std::exception& e) {
        log_warning(string_format("warning.fetch_failed_falling_back", attempt.version_id, e.what()));
        return std::nullopt;
    }

    try {
        cache_.set_current(attempt.version_id);
    } catch (const RtmException& e) {
        log_warning(e.what());
    }
    return use_cached(attempt, ResolutionKind::UsedRequested);
}

ResolutionResult VersionResolver::resolve(const std::string& requirement, const CancelToken& cancel) {
    if (cancel.is_cancelled()) {
        return ResolutionResult::failed(ErrorKind::Cancelled, get_string("error.cancelled"));
    }
    log_info(string_format("info.resolving", requirement));

    const FallbackPlan plan = probe_ ? policy_.decide_deferred(requirement, cache_.list())
                                     : policy_.decide(requirement, cache_.list(), std::nullopt);

    for (const auto& attempt : plan) {
        if (cancel.is_cancelled()) {
            return ResolutionResult::failed(ErrorKind::Cancelled, get_string("error.cancelled"));
        }

        std::optional<ResolutionResult> result;
        switch (attempt.kind) {
            case AttemptKind::UseInstalled:
                result = use_cached(attempt, ResolutionKind::UsedRequested);
                break;
            case AttemptKind::FetchExact:
                result = fetch_exact(attempt, cancel);
                break;
            case AttemptKind::UseCachedAlternate:
                result = use_cached(attempt, ResolutionKind::UsedCachedAlternate);
                if (result) {
                    log_warning(string_format("warning.using_cached_alternate", requirement, attempt.version_id));
                }
                break;
            case AttemptKind::UseSystem: {
                fs::path system_path = attempt.path;
                if (system_path.empty()) {
                    const std::optional<fs::path> probed = probe_ ? probe_() : std::nullopt;
                    if (!probed) break;
                    system_path = *probed;
                }
                result = ResolutionResult{};
                result->kind = ResolutionKind::UsedSystemFallback;
                result->path = system_path;
                log_warning(string_format("warning.using_system_runtime", requirement, system_path.string()));
                break;
            }
        }
        if (result) {
            if (result->ok()) {
                log_info(string_format("info.resolved", requirement, std::string(resolution_kind_name(result->kind)), result->path.string()));
            }
            return std::move(*result);
        }
    }

    log_error(string_format("error.runtime_unavailable", requirement));
    return ResolutionResult::failed(ErrorKind::RuntimeUnavailable, string_format("error.runtime_unavailable", requirement));
}
