#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace fs = std::filesystem;

namespace {

// Custom deleters for libarchive handles
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

// Errors from the reader mean a bad archive, errors from the disk writer a local problem.
[[noreturn]] void fail(const fs::path& archive_path, struct archive* a, const std::string& fallback_key,
                       ErrorKind kind = ErrorKind::Integrity) {
    const char* err = archive_error_string(a);
    throw RtmException(kind,
        string_format("error.extract_failed", archive_path.string()) + ": " + (err ? err : get_string(fallback_key)));
}

} // anonymous namespace

long long extract_archive(const fs::path& archive_path, const fs::path& output_dir) {
    ensure_dir_exists(output_dir);

    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    // No ownership or ACL restore: the cache belongs to the invoking user.
    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT
    );

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        fail(archive_path, a.get(), "error.unknown");
    }

    struct archive_entry* entry;
    int r = ARCHIVE_OK;
    long long count = 0;
    while (true) {
        r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                fail(archive_path, a.get(), "error.fatal_read");
            }
            log_warning(archive_error_string(a.get()));
        }

        const char* current_path = archive_entry_pathname(entry);
        if (!current_path) continue;

        fs::path dest_path;
        try {
            dest_path = validate_path(current_path, output_dir);
        } catch (const RtmException&) {
            throw RtmException(ErrorKind::Integrity, string_format("error.malicious_path_in_archive", std::string(current_path)));
        }
        archive_entry_set_pathname(entry, dest_path.c_str());

        // Hardlink targets are archive-relative and must stay inside output_dir too.
        if (const char* hardlink = archive_entry_hardlink(entry)) {
            try {
                fs::path link_dest = validate_path(hardlink, output_dir);
                archive_entry_set_hardlink(entry, link_dest.c_str());
            } catch (const RtmException&) {
                throw RtmException(ErrorKind::Integrity, string_format("error.malicious_path_in_archive", std::string(hardlink)));
            }
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                fail(archive_path, ext.get(), "error.fatal_write", ErrorKind::Disk);
            }
            log_warning(archive_error_string(ext.get()));
        } else if (archive_entry_size(entry) > 0) {
            const void* buff;
            size_t size;
            la_int64_t offset;
            while (true) {
                r = archive_read_data_block(a.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r < ARCHIVE_OK) {
                    if (r < ARCHIVE_WARN) {
                        fail(archive_path, a.get(), "error.data_block_read");
                    }
                    log_warning(archive_error_string(a.get()));
                    break;
                }
                if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                    const char* err = archive_error_string(ext.get());
                    throw RtmException(ErrorKind::Disk,
                        string_format("error.extract_failed", archive_path.string()) + ": " + (err ? err : get_string("error.data_block_write")));
                }
            }
        }
        if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
            fail(archive_path, ext.get(), "error.fatal_write", ErrorKind::Disk);
        }
        ++count;
    }

    log_info(string_format("info.extract_complete", count));
    return count;
}
