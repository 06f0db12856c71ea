#include "fallback_policy.hpp"

#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <algorithm>

namespace {

// Most recently used first; newer version ids break ties.
std::vector<CacheEntry> by_recent_use(std::vector<CacheEntry> entries) {
    std::sort(entries.begin(), entries.end(), [](const CacheEntry& a, const CacheEntry& b) {
        if (a.last_used != b.last_used) return a.last_used > b.last_used;
        return version_compare(b.version_id, a.version_id);
    });
    return entries;
}

void append_alternates(FallbackPlan& plan, const std::vector<CacheEntry>& ordered,
                       const std::string& excluded, AttemptKind kind) {
    for (const auto& entry : ordered) {
        if (entry.version_id == excluded) continue;
        plan.push_back({kind, entry.version_id, entry.directory});
    }
}

void append_system(FallbackPlan& plan, const std::optional<std::filesystem::path>& system_runtime) {
    if (system_runtime) {
        plan.push_back({AttemptKind::UseSystem, "", *system_runtime});
    }
}

} // anonymous namespace

FallbackPlan FallbackPolicy::decide(const std::string& requirement,
                                    const std::vector<CacheEntry>& cache_state,
                                    const std::optional<std::filesystem::path>& system_runtime) const {
    FallbackPlan plan;
    const auto ordered = by_recent_use(cache_state);

    if (requirement == SYSTEM_REQUIREMENT) {
        append_system(plan, system_runtime);
        append_alternates(plan, ordered, "", AttemptKind::UseCachedAlternate);
        return plan;
    }

    if (requirement == ANY_REQUIREMENT) {
        // Any managed runtime satisfies the requirement; the current one is preferred.
        auto current = std::find_if(ordered.begin(), ordered.end(), [](const CacheEntry& e) { return e.is_current; });
        std::string current_id;
        if (current != ordered.end()) {
            current_id = current->version_id;
            plan.push_back({AttemptKind::UseInstalled, current->version_id, current->directory});
        }
        append_alternates(plan, ordered, current_id, AttemptKind::UseInstalled);
        append_system(plan, system_runtime);
        return plan;
    }

    if (is_valid_version_id(requirement)) {
        auto exact = std::find_if(ordered.begin(), ordered.end(), [&](const CacheEntry& e) { return e.version_id == requirement; });
        if (exact != ordered.end()) {
            plan.push_back({AttemptKind::UseInstalled, exact->version_id, exact->directory});
        } else {
            plan.push_back({AttemptKind::FetchExact, requirement, {}});
        }
    } else {
        log_warning(string_format("warning.invalid_requirement", requirement));
    }

    append_alternates(plan, ordered, requirement, AttemptKind::UseCachedAlternate);
    append_system(plan, system_runtime);
    return plan;
}

FallbackPlan FallbackPolicy::decide_deferred(const std::string& requirement,
                                             const std::vector<CacheEntry>& cache_state) const {
    return decide(requirement, cache_state, std::filesystem::path());
}
