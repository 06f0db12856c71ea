#pragma once

#include "../src/cache_store.hpp"
#include "../src/exception.hpp"
#include "../src/hash.hpp"
#include "../src/registry.hpp"
#include "../src/release_fetcher.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace fs = std::filesystem;

// Packs `files` (relative path -> content) into <out_dir>/<name>.tar.gz with the system tar.
// The default layout has two top-level entries, so commit keeps it as is.
inline fs::path make_runtime_tarball(const fs::path& out_dir, const std::string& name,
                                     const std::map<std::string, std::string>& files = {
                                         {"bin/wine", "#!/bin/sh\necho wine\n"},
                                         {"version", "1\n"}}) {
    fs::path work_dir = out_dir / ("work_" + name);
    fs::create_directories(work_dir);
    for (const auto& [rel, content] : files) {
        fs::create_directories((work_dir / rel).parent_path());
        std::ofstream f(work_dir / rel, std::ios::binary);
        f << content;
    }
    fs::path tarball = out_dir / (name + ".tar.gz");
    std::string cmd = "tar -czf " + tarball.string() + " -C " + work_dir.string() + " .";
    if (std::system(cmd.c_str()) != 0) {
        throw std::runtime_error("tar failed: " + cmd);
    }
    fs::remove_all(work_dir);
    return tarball;
}

inline std::string file_url(const fs::path& path) {
    return "file://" + fs::absolute(path).string();
}

inline fs::path path_from_url(const std::string& url) {
    return url.starts_with("file://") ? fs::path(url.substr(7)) : fs::path(url);
}

// A registry entry for `tarball` with both sha256 and size published.
inline ReleaseAsset asset_for(const std::string& id, const fs::path& tarball) {
    ReleaseAsset asset;
    asset.id = id;
    asset.url = file_url(tarball);
    asset.integrity.sha256 = calculate_sha256(tarball);
    asset.integrity.size = fs::file_size(tarball);
    return asset;
}

inline FetchPolicy fast_policy(int max_attempts = 3) {
    FetchPolicy policy;
    policy.max_attempts = max_attempts;
    policy.backoff_base = std::chrono::milliseconds(1);
    policy.backoff_max = std::chrono::milliseconds(4);
    return policy;
}

// Copies file:// assets into staging without curl. Transfers can be held half way
// (after reporting 50% progress) and transient failures can be injected.
class ScriptedFetcher : public ReleaseFetcher {
public:
    explicit ScriptedFetcher(FetchPolicy policy = fast_policy()) : ReleaseFetcher(policy) {}

    std::atomic<int> transfers{0};
    std::atomic<int> transient_failures{0};

    void hold() {
        std::lock_guard<std::mutex> lock(mtx_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            held_ = false;
        }
        cv_.notify_all();
    }

    // Waits until `count` transfers have reached the hold point.
    bool wait_until_waiting(int count, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lock(mtx_);
        return cv_.wait_for(lock, timeout, [&] { return waiting_ >= count; });
    }

protected:
    TransferStatus transfer_once(const ReleaseAsset& asset, const fs::path& destination,
                                 const CancelToken& cancel, const FetchProgressFn& progress,
                                 FetchDigest& digest) override {
        ++transfers;
        if (transient_failures > 0) {
            --transient_failures;
            TransferStatus status;
            status.ok = false;
            status.transient = true;
            status.kind = ErrorKind::Network;
            status.message = "injected transient failure";
            return status;
        }

        const fs::path source = path_from_url(asset.url);
        const std::uint64_t size = fs::file_size(source);
        if (progress) progress(size / 2, size);

        {
            std::unique_lock<std::mutex> lock(mtx_);
            ++waiting_;
            cv_.notify_all();
            while (held_ && !cancel.is_cancelled()) {
                cv_.wait_for(lock, std::chrono::milliseconds(5));
            }
        }

        if (cancel.is_cancelled()) {
            TransferStatus status;
            status.ok = false;
            status.kind = ErrorKind::Cancelled;
            status.message = "cancelled";
            return status;
        }

        fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
        digest.sha256 = calculate_sha256(destination);
        digest.bytes = size;
        if (progress) progress(size, size);
        return {};
    }

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    bool held_ = false;
    int waiting_ = 0;
};
