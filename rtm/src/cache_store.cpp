#include "cache_store.hpp"

#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

constexpr const char* METADATA_FILE = ".rtm-meta";

std::int64_t to_epoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch(const std::string& value) {
    try {
        return std::chrono::system_clock::time_point(std::chrono::seconds(std::stoll(value)));
    } catch (const std::exception&) {
        return std::chrono::system_clock::time_point{};
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void remove_tree_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        log_warning(string_format("warning.remove_failed", path.string(), ec.message()));
    }
}

std::vector<fs::path> list_children(const fs::path& dir) {
    std::vector<fs::path> children;
    for (const auto& entry : fs::directory_iterator(dir)) {
        children.push_back(entry.path());
    }
    return children;
}

} // anonymous namespace

std::string_view install_state_name(InstallState state) {
    switch (state) {
        case InstallState::Missing: return "missing";
        case InstallState::Staging: return "staging";
        case InstallState::Verifying: return "verifying";
        case InstallState::Installed: return "installed";
        case InstallState::Failed: return "failed";
    }
    return "unknown";
}

// ---------------------------------------------------------------- StagingHandle

StagingHandle::StagingHandle(CacheStore* store, std::string version_id, fs::path directory)
    : store_(store), version_id_(std::move(version_id)), directory_(std::move(directory)) {}

StagingHandle::StagingHandle(StagingHandle&& other) noexcept
    : store_(other.store_), version_id_(std::move(other.version_id_)), directory_(std::move(other.directory_)) {
    other.store_ = nullptr;
}

StagingHandle& StagingHandle::operator=(StagingHandle&& other) noexcept {
    if (this != &other) {
        reset();
        store_ = other.store_;
        version_id_ = std::move(other.version_id_);
        directory_ = std::move(other.directory_);
        other.store_ = nullptr;
    }
    return *this;
}

StagingHandle::~StagingHandle() {
    reset();
}

void StagingHandle::reset() noexcept {
    if (!store_) return;
    try {
        store_->discard(*this, InstallState::Missing);
    } catch (const std::exception& e) {
        log_error(string_format("error.staging_cleanup_failed", version_id_, e.what()));
    }
    store_ = nullptr;
}

void StagingHandle::abandon(bool failed) {
    if (!store_) return;
    store_->discard(*this, failed ? InstallState::Failed : InstallState::Missing);
}

// ---------------------------------------------------------------- RuntimeLease

RuntimeLease::RuntimeLease(CacheStore* store, std::string version_id, fs::path path)
    : store_(store), version_id_(std::move(version_id)), path_(std::move(path)) {}

RuntimeLease::RuntimeLease(RuntimeLease&& other) noexcept
    : store_(other.store_), version_id_(std::move(other.version_id_)), path_(std::move(other.path_)) {
    other.store_ = nullptr;
}

RuntimeLease& RuntimeLease::operator=(RuntimeLease&& other) noexcept {
    if (this != &other) {
        release();
        store_ = other.store_;
        version_id_ = std::move(other.version_id_);
        path_ = std::move(other.path_);
        other.store_ = nullptr;
    }
    return *this;
}

RuntimeLease::~RuntimeLease() {
    release();
}

void RuntimeLease::release() {
    if (store_) {
        store_->release(version_id_);
        store_ = nullptr;
    }
}

// ---------------------------------------------------------------- CacheStore

CacheStore::CacheStore(fs::path cache_root)
    : root_(fs::absolute(cache_root).lexically_normal()),
      versions_dir_(root_ / "versions"),
      staging_root_(root_ / "staging"),
      trash_dir_(root_ / "trash"),
      current_file_(root_ / "current") {
    ensure_dir_exists(root_);
    ensure_dir_exists(versions_dir_);
    ensure_dir_exists(staging_root_);
    ensure_dir_exists(trash_dir_);
    recover();
    load_installed();
    load_current();
}

void CacheStore::recover() {
    // No task can own staging yet: anything left there was abandoned by a previous process.
    for (const auto& dir : {staging_root_, trash_dir_}) {
        for (const auto& leftover : list_children(dir)) {
            log_warning(string_format("warning.discarding_leftover", leftover.string()));
            remove_tree_quietly(leftover);
        }
    }
}

void CacheStore::load_installed() {
    for (const auto& dir : list_children(versions_dir_)) {
        const std::string id = dir.filename().string();
        if (!fs::is_directory(dir) || !is_valid_version_id(id)) {
            log_warning(string_format("warning.unexpected_cache_entry", dir.string()));
            continue;
        }

        const fs::path meta = dir / METADATA_FILE;
        std::map<std::string, std::string> record;
        if (fs::exists(meta)) {
            try {
                record = read_tab_record(meta);
            } catch (const RtmException& e) {
                log_warning(e.what());
            }
        }
        if (record["state"] != "installed") {
            // Not committed by us; it cannot be trusted as Installed.
            log_warning(string_format("warning.untrusted_version_dir", dir.string()));
            std::error_code ec;
            fs::rename(dir, next_trash_path(id), ec);
            if (ec) {
                log_warning(string_format("warning.remove_failed", dir.string(), ec.message()));
            }
            continue;
        }

        auto& s = slot(id);
        std::lock_guard<std::mutex> lock(s.mtx);
        s.state = InstallState::Installed;
        s.digest = record["digest"];
        try {
            s.size_bytes = std::stoull(record["size"]);
        } catch (const std::exception&) {
            s.size_bytes = 0;
        }
        s.installed_at = from_epoch(record["installed_at"]);
        s.last_used = record.contains("last_used") ? from_epoch(record["last_used"]) : s.installed_at;
    }

    for (const auto& leftover : list_children(trash_dir_)) {
        remove_tree_quietly(leftover);
    }
}

void CacheStore::load_current() {
    std::ifstream file(current_file_);
    if (!file.is_open()) return;
    std::string id;
    std::getline(file, id);
    if (!id.empty() && id.back() == '\r') id.pop_back();
    file.close();

    if (!id.empty() && is_valid_version_id(id) && state(id) == InstallState::Installed) {
        std::lock_guard<std::mutex> lock(current_mtx_);
        current_ = id;
        return;
    }
    if (!id.empty()) {
        log_warning(string_format("warning.dangling_current", id));
    }
    std::error_code ec;
    fs::remove(current_file_, ec);
}

CacheStore::VersionSlot& CacheStore::slot(const std::string& version_id) {
    std::lock_guard<std::mutex> lock(table_mtx_);
    auto it = slots_.find(version_id);
    if (it == slots_.end()) {
        it = slots_.emplace(version_id, std::make_unique<VersionSlot>()).first;
    }
    return *it->second;
}

CacheStore::VersionSlot* CacheStore::find_slot(const std::string& version_id) {
    std::lock_guard<std::mutex> lock(table_mtx_);
    auto it = slots_.find(version_id);
    return it == slots_.end() ? nullptr : it->second.get();
}

fs::path CacheStore::next_trash_path(const std::string& version_id) {
    return trash_dir_ / (version_id + "." + std::to_string(++trash_counter_));
}

InstallState CacheStore::state(const std::string& version_id) {
    VersionSlot* s = find_slot(version_id);
    if (!s) return InstallState::Missing;
    std::lock_guard<std::mutex> lock(s->mtx);
    return s->state;
}

std::optional<fs::path> CacheStore::path(const std::string& version_id) {
    VersionSlot* s = find_slot(version_id);
    if (!s) return std::nullopt;
    std::lock_guard<std::mutex> lock(s->mtx);
    if (s->state != InstallState::Installed) return std::nullopt;
    return version_dir(version_id);
}

StagingHandle CacheStore::begin_install(const std::string& version_id) {
    validate_version_id(version_id);
    auto& s = slot(version_id);
    std::lock_guard<std::mutex> lock(s.mtx);

    if (s.state == InstallState::Staging || s.state == InstallState::Verifying) {
        throw RtmException(ErrorKind::AlreadyInstalling, string_format("error.already_installing", version_id));
    }
    if (s.state == InstallState::Installed) {
        throw RtmException(ErrorKind::InvalidState, string_format("error.already_installed", version_id));
    }

    const fs::path dir = staging_root_ / version_id;
    if (fs::exists(dir)) {
        remove_tree_quietly(dir);
    }
    ensure_dir_exists(dir);
    s.state = InstallState::Staging;
    return StagingHandle(this, version_id, dir);
}

void CacheStore::mark_verifying(StagingHandle& handle) {
    if (handle.store_ != this) {
        throw RtmException(ErrorKind::InvalidState, get_string("error.staging_not_active"));
    }
    auto& s = slot(handle.version_id());
    std::lock_guard<std::mutex> lock(s.mtx);
    s.state = InstallState::Verifying;
}

void CacheStore::discard(StagingHandle& handle, InstallState final_state) {
    remove_tree_quietly(handle.directory());
    auto& s = slot(handle.version_id());
    {
        std::lock_guard<std::mutex> lock(s.mtx);
        if (s.state == InstallState::Staging || s.state == InstallState::Verifying) {
            s.state = final_state;
        }
    }
    handle.store_ = nullptr;
}

void CacheStore::write_metadata(const fs::path& dir, const VersionSlot& s) const {
    std::ostringstream out;
    out << "state\tinstalled\n"
        << "digest\t" << s.digest << "\n"
        << "size\t" << s.size_bytes << "\n"
        << "installed_at\t" << to_epoch(s.installed_at) << "\n"
        << "last_used\t" << to_epoch(s.last_used) << "\n";
    write_file_atomic(dir / METADATA_FILE, out.str());
}

fs::path CacheStore::commit_install(StagingHandle& handle, const IntegrityCheck& expected, const FetchDigest& actual) {
    if (handle.store_ != this) {
        throw RtmException(ErrorKind::InvalidState, get_string("error.staging_not_active"));
    }
    const std::string id = handle.version_id();
    auto& s = slot(id);
    {
        std::lock_guard<std::mutex> lock(s.mtx);
        s.state = InstallState::Verifying;
    }

    const fs::path final_dir = version_dir(id);
    try {
        if (expected.empty()) {
            throw RtmException(ErrorKind::Integrity, string_format("error.no_integrity_data", id));
        }
        if (!expected.sha256.empty() && to_lower(actual.sha256) != to_lower(expected.sha256)) {
            throw RtmException(ErrorKind::Integrity, string_format("error.hash_mismatch", id, expected.sha256, actual.sha256));
        }
        if (expected.size && *expected.size != actual.bytes) {
            throw RtmException(ErrorKind::Integrity, string_format("error.size_mismatch", id, *expected.size, actual.bytes));
        }

        const fs::path payload = handle.directory() / "payload";
        log_info(string_format("info.unpacking", id));
        extract_archive(handle.archive_path(), payload);
        std::error_code ec;
        fs::remove(handle.archive_path(), ec);

        // Release tarballs usually wrap everything in one directory (GE-Proton8-26/).
        fs::path runtime_root = payload;
        fs::directory_iterator it(payload);
        if (it != fs::directory_iterator()) {
            const fs::directory_entry only = *it;
            if (++it == fs::directory_iterator() && !only.is_symlink() && only.is_directory()) {
                runtime_root = only.path();
            }
        }

        VersionSlot record;
        record.digest = actual.sha256;
        record.size_bytes = actual.bytes;
        record.installed_at = std::chrono::system_clock::now();
        record.last_used = record.installed_at;
        write_metadata(runtime_root, record);

        std::lock_guard<std::mutex> lock(s.mtx);
        if (fs::exists(final_dir)) {
            fs::rename(final_dir, next_trash_path(id), ec);
            if (ec) {
                throw RtmException(ErrorKind::Disk, string_format("error.rename_failed", final_dir.string(), trash_dir_.string()));
            }
        }
        fs::rename(runtime_root, final_dir, ec);
        if (ec) {
            throw RtmException(ErrorKind::Disk, string_format("error.rename_failed", runtime_root.string(), final_dir.string()) + ": " + ec.message());
        }
        s.state = InstallState::Installed;
        s.digest = record.digest;
        s.size_bytes = record.size_bytes;
        s.installed_at = record.installed_at;
        s.last_used = record.last_used;
    } catch (const RtmException& e) {
        log_error(string_format("error.commit_failed", id, e.what()));
        discard(handle, InstallState::Failed);
        throw;
    } catch (const fs::filesystem_error& e) {
        discard(handle, InstallState::Failed);
        throw RtmException(ErrorKind::Disk, string_format("error.commit_failed", id, e.what()));
    }

    remove_tree_quietly(handle.directory());
    handle.store_ = nullptr;
    log_info(string_format("info.version_installed", id, final_dir.string()));
    return final_dir;
}

void CacheStore::evict(const std::string& version_id) {
    validate_version_id(version_id);
    VersionSlot* slot_ptr = find_slot(version_id);
    if (!slot_ptr) {
        throw RtmException(ErrorKind::NotFound, string_format("error.version_not_installed", version_id));
    }
    auto& s = *slot_ptr;
    fs::path trash;
    {
        std::lock_guard<std::mutex> lock(s.mtx);
        if (s.state != InstallState::Installed) {
            throw RtmException(ErrorKind::NotFound, string_format("error.version_not_installed", version_id));
        }
        if (s.active_users > 0) {
            throw RtmException(ErrorKind::Busy, string_format("error.version_busy", version_id, s.active_users));
        }

        trash = next_trash_path(version_id);
        std::error_code ec;
        fs::rename(version_dir(version_id), trash, ec);
        if (ec) {
            throw RtmException(ErrorKind::Disk, string_format("error.rename_failed", version_dir(version_id).string(), trash.string()) + ": " + ec.message());
        }
        s.state = InstallState::Missing;
        s.digest.clear();
        s.size_bytes = 0;

        std::lock_guard<std::mutex> current_lock(current_mtx_);
        if (current_ == version_id) {
            current_.clear();
            fs::remove(current_file_, ec);
        }
    }
    remove_tree_quietly(trash);
    log_info(string_format("info.version_evicted", version_id));
}

std::vector<std::string> CacheStore::collect_garbage(std::size_t keep) {
    auto entries = list();
    std::sort(entries.begin(), entries.end(), [](const CacheEntry& a, const CacheEntry& b) {
        return a.last_used > b.last_used;
    });

    auto pinned = [](const CacheEntry& e) { return e.is_current || e.active_users > 0; };
    // Pinned versions always stay and use up part of `keep`.
    std::size_t kept = static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(), pinned));

    std::vector<std::string> evicted;
    for (const auto& entry : entries) {
        if (pinned(entry)) continue;
        if (kept < keep) {
            ++kept;
            continue;
        }
        try {
            evict(entry.version_id);
            evicted.push_back(entry.version_id);
        } catch (const RtmException& e) {
            if (e.kind() != ErrorKind::Busy && e.kind() != ErrorKind::NotFound) throw;
            log_warning(e.what());
        }
    }
    return evicted;
}

void CacheStore::set_current(const std::string& version_id) {
    validate_version_id(version_id);
    VersionSlot* slot_ptr = find_slot(version_id);
    if (!slot_ptr) {
        throw RtmException(ErrorKind::InvalidState, string_format("error.version_not_installed", version_id));
    }
    auto& s = *slot_ptr;
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.state != InstallState::Installed) {
        throw RtmException(ErrorKind::InvalidState, string_format("error.version_not_installed", version_id));
    }
    std::lock_guard<std::mutex> current_lock(current_mtx_);
    write_file_atomic(current_file_, version_id + "\n");
    current_ = version_id;
}

std::optional<std::string> CacheStore::current() {
    std::lock_guard<std::mutex> lock(current_mtx_);
    if (current_.empty()) return std::nullopt;
    return current_;
}

std::optional<RuntimeLease> CacheStore::acquire(const std::string& version_id) {
    VersionSlot* slot_ptr = find_slot(version_id);
    if (!slot_ptr) return std::nullopt;
    auto& s = *slot_ptr;
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.state != InstallState::Installed) return std::nullopt;

    ++s.active_users;
    s.last_used = std::chrono::system_clock::now();
    try {
        write_metadata(version_dir(version_id), s);
    } catch (const RtmException& e) {
        log_warning(e.what());
    }
    return RuntimeLease(this, version_id, version_dir(version_id));
}

void CacheStore::release(const std::string& version_id) {
    auto& s = slot(version_id);
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.active_users > 0) --s.active_users;
}

std::size_t CacheStore::active_users(const std::string& version_id) {
    VersionSlot* s = find_slot(version_id);
    if (!s) return 0;
    std::lock_guard<std::mutex> lock(s->mtx);
    return s->active_users;
}

std::vector<CacheEntry> CacheStore::list() {
    std::vector<std::pair<std::string, VersionSlot*>> snapshot;
    {
        std::lock_guard<std::mutex> lock(table_mtx_);
        for (auto& [id, s] : slots_) snapshot.emplace_back(id, s.get());
    }
    const auto current_id = current();

    std::vector<CacheEntry> entries;
    for (auto& [id, s] : snapshot) {
        std::lock_guard<std::mutex> lock(s->mtx);
        if (s->state != InstallState::Installed) continue;
        CacheEntry entry;
        entry.version_id = id;
        entry.directory = version_dir(id);
        entry.installed_at = s->installed_at;
        entry.last_used = s->last_used;
        entry.is_current = current_id && *current_id == id;
        entry.digest = s->digest;
        entry.size_bytes = s->size_bytes;
        entry.active_users = s->active_users;
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::size_t CacheStore::tracked_versions() {
    std::lock_guard<std::mutex> lock(table_mtx_);
    return slots_.size();
}
