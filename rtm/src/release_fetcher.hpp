#pragma once

#include "cache_store.hpp"
#include "cancel_token.hpp"
#include "downloader.hpp"
#include "registry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

struct FetchPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds backoff_base{500};
    std::chrono::milliseconds backoff_max{8000};
    TransferOptions transfer;
};

// Receives (bytes_done, bytes_total); bytes_total is 0 while unknown.
using FetchProgressFn = std::function<void(std::uint64_t, std::uint64_t)>;

// Streams one release asset into a staging handle, digesting it on the way.
class ReleaseFetcher {
public:
    explicit ReleaseFetcher(FetchPolicy policy = {});
    virtual ~ReleaseFetcher() = default;

    // Retries transient network failures up to policy.max_attempts, restarting from byte 0
    // each time. Throws RtmException for terminal failures, Cancelled when `cancel` fires.
    virtual FetchDigest fetch(const ReleaseAsset& asset, StagingHandle& staging,
                              const CancelToken& cancel, const FetchProgressFn& progress);

    const FetchPolicy& policy() const { return policy_; }
    std::chrono::milliseconds backoff_delay(int failed_attempts) const;

protected:
    // One transfer attempt into `destination`. Returns the status with the digest of
    // what was written when the transfer succeeded.
    virtual TransferStatus transfer_once(const ReleaseAsset& asset, const std::filesystem::path& destination,
                                         const CancelToken& cancel, const FetchProgressFn& progress,
                                         FetchDigest& digest);

private:
    FetchPolicy policy_;
};
