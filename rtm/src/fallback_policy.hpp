#pragma once

#include "cache_store.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class AttemptKind {
    UseInstalled,       // exact (or "any") version already in the cache
    FetchExact,         // exact version, to be looked up in the registry and downloaded
    UseCachedAlternate, // a different cached version, flagged as substitution
    UseSystem           // unmanaged system runtime, flagged as fallback
};

struct PlanAttempt {
    AttemptKind kind;
    std::string version_id;
    std::filesystem::path path;
};

using FallbackPlan = std::vector<PlanAttempt>;

// Orders the ways a requirement may be satisfied. The plan is evaluated lazily by the
// resolver; an empty tail means Failed(RuntimeUnavailable).
class FallbackPolicy {
public:
    FallbackPlan decide(const std::string& requirement,
                        const std::vector<CacheEntry>& cache_state,
                        const std::optional<std::filesystem::path>& system_runtime) const;
    // Same order, with the system tier always planned and an empty path; the caller
    // looks for the system runtime only when the plan reaches that attempt.
    FallbackPlan decide_deferred(const std::string& requirement,
                                 const std::vector<CacheEntry>& cache_state) const;
};
