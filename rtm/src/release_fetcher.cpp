#include "release_fetcher.hpp"

#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

ReleaseFetcher::ReleaseFetcher(FetchPolicy policy) : policy_(std::move(policy)) {
    if (policy_.max_attempts < 1) policy_.max_attempts = 1;
}

std::chrono::milliseconds ReleaseFetcher::backoff_delay(int failed_attempts) const {
    auto delay = policy_.backoff_base;
    for (int i = 1; i < failed_attempts && delay < policy_.backoff_max; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy_.backoff_max);
}

TransferStatus ReleaseFetcher::transfer_once(const ReleaseAsset& asset, const fs::path& destination,
                                             const CancelToken& cancel, const FetchProgressFn& progress,
                                             FetchDigest& digest) {
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        TransferStatus status;
        status.ok = false;
        status.kind = ErrorKind::Disk;
        status.message = string_format("error.create_file_failed", destination.string());
        return status;
    }

    Sha256Stream sha;
    std::uint64_t bytes = 0;
    const std::uint64_t declared_total = asset.integrity.size.value_or(0);

    TransferWriteFn write = [&](const char* data, std::size_t size) {
        if (cancel.is_cancelled()) return false;
        out.write(data, static_cast<std::streamsize>(size));
        if (!out) return false;
        try {
            sha.update(data, size);
        } catch (const RtmException& e) {
            log_error(e.what());
            return false;
        }
        bytes += size;
        return true;
    };
    TransferProgressFn xfer = [&](std::uint64_t done, std::uint64_t total) {
        if (cancel.is_cancelled()) return false;
        if (progress) progress(done, total > 0 ? total : declared_total);
        return true;
    };

    TransferStatus status = perform_transfer(asset.url, policy_.transfer, write, xfer);
    out.close();
    if (cancel.is_cancelled()) {
        status.ok = false;
        status.transient = false;
        status.kind = ErrorKind::Cancelled;
        status.message = get_string("error.cancelled");
        return status;
    }
    if (status.ok && !out) {
        status.ok = false;
        status.kind = ErrorKind::Disk;
        status.message = string_format("error.write_file_failed", destination.string());
        return status;
    }
    if (status.ok) {
        digest.sha256 = sha.finish();
        digest.bytes = bytes;
    }
    return status;
}

FetchDigest ReleaseFetcher::fetch(const ReleaseAsset& asset, StagingHandle& staging,
                                  const CancelToken& cancel, const FetchProgressFn& progress) {
    if (!staging.active()) {
        throw RtmException(ErrorKind::InvalidState, get_string("error.staging_not_active"));
    }
    const fs::path destination = staging.archive_path();

    for (int attempt = 1; ; ++attempt) {
        cancel.throw_if_cancelled();
        log_info(string_format("info.fetching", asset.id, attempt, policy_.max_attempts));

        FetchDigest digest;
        TransferStatus status = transfer_once(asset, destination, cancel, progress, digest);
        if (status.ok) {
            return digest;
        }

        std::error_code ec;
        fs::remove(destination, ec);

        if (!status.transient || attempt >= policy_.max_attempts) {
            throw RtmException(status.kind, status.message);
        }

        const auto delay = backoff_delay(attempt);
        log_warning(string_format("warning.fetch_retry", asset.id, status.message, delay.count()));
        if (cancel.wait_for(delay)) {
            cancel.throw_if_cancelled();
        }
    }
}
