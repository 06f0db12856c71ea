#pragma once

#include "registry.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class InstallState {
    Missing,
    Staging,
    Verifying,
    Installed,
    Failed
};

std::string_view install_state_name(InstallState state);

struct CacheEntry {
    std::string version_id;
    std::filesystem::path directory;
    std::chrono::system_clock::time_point installed_at;
    std::chrono::system_clock::time_point last_used;
    bool is_current = false;
    std::string digest;
    std::uint64_t size_bytes = 0;
    std::size_t active_users = 0;
};

// What the fetcher actually received.
struct FetchDigest {
    std::string sha256;
    std::uint64_t bytes = 0;
};

class CacheStore;

// Exclusive claim on the staging location of one version id. Destroying an uncommitted
// handle deletes the staging directory and returns the version to Missing.
class StagingHandle {
public:
    StagingHandle() = default;
    StagingHandle(StagingHandle&& other) noexcept;
    StagingHandle& operator=(StagingHandle&& other) noexcept;
    StagingHandle(const StagingHandle&) = delete;
    StagingHandle& operator=(const StagingHandle&) = delete;
    ~StagingHandle();

    bool active() const { return store_ != nullptr; }
    const std::string& version_id() const { return version_id_; }
    const std::filesystem::path& directory() const { return directory_; }
    // Where the fetcher writes the downloaded asset.
    std::filesystem::path archive_path() const { return directory_ / "asset"; }

    // Deletes staging; the version becomes Failed, or Missing when `failed` is false.
    void abandon(bool failed);

private:
    friend class CacheStore;
    StagingHandle(CacheStore* store, std::string version_id, std::filesystem::path directory);
    void reset() noexcept;

    CacheStore* store_ = nullptr;
    std::string version_id_;
    std::filesystem::path directory_;
};

// Holds one active use of an installed version; eviction fails with Busy while any lease lives.
class RuntimeLease {
public:
    RuntimeLease(RuntimeLease&& other) noexcept;
    RuntimeLease& operator=(RuntimeLease&& other) noexcept;
    RuntimeLease(const RuntimeLease&) = delete;
    RuntimeLease& operator=(const RuntimeLease&) = delete;
    ~RuntimeLease();

    const std::string& version_id() const { return version_id_; }
    const std::filesystem::path& path() const { return path_; }
    void release();

private:
    friend class CacheStore;
    RuntimeLease(CacheStore* store, std::string version_id, std::filesystem::path path);

    CacheStore* store_ = nullptr;
    std::string version_id_;
    std::filesystem::path path_;
};

// On-disk registry of installed runtimes under one cache root:
//   versions/<id>/          committed payload plus its .rtm-meta record
//   staging/<id>/           in-progress download, never trusted across restarts
//   trash/                  evicted directories awaiting deletion
//   current                 id of the current runtime
// Mutations are serialised per version id; different ids never wait on each other.
class CacheStore {
public:
    // Recovers the cache root: staging and trash leftovers are deleted, committed versions
    // with a valid metadata record are loaded, and a dangling current pointer is cleared.
    explicit CacheStore(std::filesystem::path cache_root);
    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    const std::filesystem::path& root() const { return root_; }

    InstallState state(const std::string& version_id);
    std::optional<std::filesystem::path> path(const std::string& version_id);

    // Throws RtmException(AlreadyInstalling) if staging already exists for the id.
    StagingHandle begin_install(const std::string& version_id);
    void mark_verifying(StagingHandle& handle);
    // Verifies `actual` against `expected`, unpacks the staged asset and renames it into
    // versions/<id>. On any failure staging is discarded and the version becomes Failed.
    std::filesystem::path commit_install(StagingHandle& handle, const IntegrityCheck& expected, const FetchDigest& actual);

    // Throws RtmException(Busy) while leases are held, NotFound if not installed.
    void evict(const std::string& version_id);
    // Evicts unused, non-current versions, least recently used first, until `keep` remain.
    std::vector<std::string> collect_garbage(std::size_t keep);

    void set_current(const std::string& version_id);
    std::optional<std::string> current();

    std::optional<RuntimeLease> acquire(const std::string& version_id);
    std::size_t active_users(const std::string& version_id);

    std::vector<CacheEntry> list();
    // Number of version ids with in-memory state (installed, in flight or failed).
    std::size_t tracked_versions();

private:
    friend class StagingHandle;
    friend class RuntimeLease;

    struct VersionSlot {
        std::mutex mtx;
        InstallState state = InstallState::Missing;
        std::size_t active_users = 0;
        std::string digest;
        std::uint64_t size_bytes = 0;
        std::chrono::system_clock::time_point installed_at;
        std::chrono::system_clock::time_point last_used;
    };

    VersionSlot& slot(const std::string& version_id);
    // Like slot() but never creates one; nullptr means the id was never seen.
    VersionSlot* find_slot(const std::string& version_id);
    std::filesystem::path version_dir(const std::string& version_id) const { return versions_dir_ / version_id; }
    std::filesystem::path next_trash_path(const std::string& version_id);

    void recover();
    void load_installed();
    void load_current();
    void write_metadata(const std::filesystem::path& dir, const VersionSlot& s) const;
    void discard(StagingHandle& handle, InstallState final_state);
    void release(const std::string& version_id);

    std::filesystem::path root_;
    std::filesystem::path versions_dir_;
    std::filesystem::path staging_root_;
    std::filesystem::path trash_dir_;
    std::filesystem::path current_file_;

    std::mutex table_mtx_;
    std::map<std::string, std::unique_ptr<VersionSlot>, std::less<>> slots_;

    // Lock order: a version slot before current_mtx_.
    std::mutex current_mtx_;
    std::string current_;

    std::atomic<std::uint64_t> trash_counter_{0};
};
