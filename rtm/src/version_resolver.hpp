#pragma once

#include "cache_store.hpp"
#include "cancel_token.hpp"
#include "download_coordinator.hpp"
#include "exception.hpp"
#include "fallback_policy.hpp"
#include "registry.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

enum class ResolutionKind {
    UsedRequested,
    UsedCachedAlternate,
    UsedSystemFallback,
    Failed
};

std::string_view resolution_kind_name(ResolutionKind kind);

// Outcome of resolve(). Results naming a cached version hold a lease on it, so the
// directory cannot be evicted until the result (or its lease) is released.
struct ResolutionResult {
    ResolutionKind kind = ResolutionKind::Failed;
    std::string version_id;
    std::filesystem::path path;
    ErrorKind reason = ErrorKind::RuntimeUnavailable;
    std::string message;
    std::optional<RuntimeLease> lease;

    bool ok() const { return kind != ResolutionKind::Failed; }
    bool is_substitution() const { return kind == ResolutionKind::UsedCachedAlternate || kind == ResolutionKind::UsedSystemFallback; }

    static ResolutionResult failed(ErrorKind reason, std::string message);
};

// Returns an unmanaged runtime installed outside the cache, if any.
using SystemRuntimeProbe = std::function<std::optional<std::filesystem::path>()>;

class VersionResolver {
public:
    VersionResolver(CacheStore& cache, DownloadCoordinator& coordinator, RegistrySource& registry,
                    SystemRuntimeProbe probe, FallbackPolicy policy = {});

    ResolutionResult resolve(const std::string& requirement, const CancelToken& cancel);

    // How often a waiting resolve() re-checks its cancel token.
    void set_poll_interval(std::chrono::milliseconds interval) { poll_interval_ = interval; }

private:
    std::optional<ResolutionResult> use_cached(const PlanAttempt& attempt, ResolutionKind kind);
    std::optional<ResolutionResult> fetch_exact(const PlanAttempt& attempt, const CancelToken& cancel);

    CacheStore& cache_;
    DownloadCoordinator& coordinator_;
    RegistrySource& registry_;
    SystemRuntimeProbe probe_;
    FallbackPolicy policy_;
    std::chrono::milliseconds poll_interval_{50};
};
