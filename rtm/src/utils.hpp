#pragma once

#include "exception.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);
void end_progress();

// Quiet mode drops info and progress output; warnings and errors still print.
void set_quiet_mode(bool enable);
bool get_quiet_mode();

// Cross-process exclusion for one cache root (RAII advisory flock).
class CacheLock {
public:
    explicit CacheLock(const fs::path& cache_root);
    ~CacheLock();
    CacheLock(const CacheLock&) = delete;
    CacheLock& operator=(const CacheLock&) = delete;
private:
    int lock_fd = -1;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
void write_file_atomic(const fs::path& path, const std::string& content);
std::optional<std::pair<std::string, std::string>> parse_tab_line(const std::string& line);
std::map<std::string, std::string> read_tab_record(const fs::path& path);
std::filesystem::path validate_path(const fs::path& path, const fs::path& root);
