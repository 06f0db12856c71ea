#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {
    bool quiet_mode = false;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;
    bool progress_line_open = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        if (progress_line_open) {
            std::cout << std::endl;
            progress_line_open = false;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network: return "NetworkError";
        case ErrorKind::Integrity: return "IntegrityError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::Disk: return "DiskError";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::Busy: return "Busy";
        case ErrorKind::RuntimeUnavailable: return "RuntimeUnavailable";
        case ErrorKind::AlreadyInstalling: return "AlreadyInstalling";
        case ErrorKind::InvalidState: return "InvalidState";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::Config: return "ConfigError";
    }
    return "UnknownError";
}

void log_info(std::string_view msg) {
    if (quiet_mode) return;
    log_internal(get_string("info.log_prefix") + " ", COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();
    if (quiet_mode || !is_stdout_tty) {
        return;
    }

    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << "==> " << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
    progress_line_open = true;
}

void end_progress() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (progress_line_open) {
        std::cout << std::endl;
        progress_line_open = false;
    }
}

void set_quiet_mode(bool enable) {
    quiet_mode = enable;
}

bool get_quiet_mode() {
    return quiet_mode;
}

CacheLock::CacheLock(const fs::path& cache_root) {
    ensure_dir_exists(cache_root);
    const fs::path lock_file = cache_root / ".lock";
    lock_fd = open(lock_file.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (lock_fd < 0) {
        throw RtmException(ErrorKind::Disk, string_format("error.create_file_failed", lock_file.string()) + ": " + strerror(errno));
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw RtmException(ErrorKind::Busy, string_format("error.cache_locked", cache_root.string()));
        }
        throw RtmException(ErrorKind::Disk, string_format("error.cache_lock_failed", cache_root.string()));
    }
}

CacheLock::~CacheLock() {
    if (lock_fd != -1) {
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw RtmException(ErrorKind::Disk, string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw RtmException(ErrorKind::Disk, string_format("error.path_not_dir", path.string()));
    }
}

void write_file_atomic(const fs::path& path, const std::string& content) {
    fs::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw RtmException(ErrorKind::Disk, string_format("error.create_file_failed", tmp_path.string()));
        }
        file << content;
        file.flush();
        if (!file) {
            throw RtmException(ErrorKind::Disk, string_format("error.write_file_failed", tmp_path.string()));
        }
    }
    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw RtmException(ErrorKind::Disk, string_format("error.rename_failed", tmp_path.string(), path.string()));
    }
}

// Strictly parses Tab-separated line: key\tvalue
std::optional<std::pair<std::string, std::string>> parse_tab_line(const std::string& line) {
    if (line.empty()) return std::nullopt;
    if (const auto pos = line.find('\t'); pos != std::string::npos) {
        std::string key = line.substr(0, pos);
        std::string val = line.substr(pos + 1);
        if (!val.empty() && val.back() == '\r') val.pop_back();
        return std::make_pair(std::move(key), std::move(val));
    }
    return std::nullopt;
}

std::map<std::string, std::string> read_tab_record(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw RtmException(ErrorKind::Disk, string_format("error.open_file_failed", path.string()));
    }
    std::map<std::string, std::string> record;
    std::string line;
    while (std::getline(file, line)) {
        if (auto kv = parse_tab_line(line)) {
            record[kv->first] = kv->second;
        }
    }
    return record;
}

std::filesystem::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw RtmException(ErrorKind::InvalidArgument, string_format("error.path_not_relative", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw RtmException(ErrorKind::InvalidArgument, string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}
