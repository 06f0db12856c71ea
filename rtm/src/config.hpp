#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path ROOT_DIR;
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path CACHE_DIR;
extern std::filesystem::path L10N_DIR;

// Derived paths
extern std::filesystem::path SETTINGS_CONF;
extern std::filesystem::path REGISTRY_CONF;

// Tunables read from rtm.conf (key=value).
struct Settings {
    std::string registry_url;
    int max_attempts = 3;
    std::chrono::milliseconds backoff_base{500};
    std::chrono::milliseconds backoff_max{8000};
    long connect_timeout_s = 15;
    long low_speed_timeout_s = 30;
    long transfer_timeout_s = 1800;
    std::optional<std::filesystem::path> system_runtime;
    std::size_t keep_versions = 3;
};

void set_root_path(const std::string& root_path);
void set_cache_dir(const std::filesystem::path& cache_dir);
void init_filesystem();

// Parses a settings file. Missing file yields defaults; bad values throw RtmException(Config).
Settings load_settings(const std::filesystem::path& path);
// load_settings(SETTINGS_CONF) with the RTM_REGISTRY_URL environment override applied.
Settings load_settings();
std::string get_registry_url(const Settings& settings);
