#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

fs::path ROOT_DIR = "/";
fs::path CONFIG_DIR = RTM_CONF_DIR;
fs::path CACHE_DIR = RTM_CACHE_DEFAULT_DIR;
fs::path L10N_DIR = RTM_L10N_DIR;

// Derived paths
fs::path SETTINGS_CONF = fs::path(RTM_CONF_DIR) / "rtm.conf";
fs::path REGISTRY_CONF = fs::path(RTM_CONF_DIR) / "registry.conf";

namespace {

bool cache_dir_overridden = false;

template<typename T>
T parse_number(const std::string& key, const std::string& value) {
    T result{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        throw RtmException(ErrorKind::Config, string_format("error.invalid_setting", key, value));
    }
    return result;
}

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

void set_root_path(const std::string& root_path) {
    ROOT_DIR = fs::path(root_path).lexically_normal();
    if (ROOT_DIR.empty()) ROOT_DIR = "/";

    auto rebase = [&](const std::string& default_path) {
        fs::path p(default_path);
        if (p.is_absolute()) {
            return ROOT_DIR / p.relative_path();
        }
        return ROOT_DIR / p;
    };

    CONFIG_DIR = rebase(RTM_CONF_DIR);
    L10N_DIR = rebase(RTM_L10N_DIR);
    if (!cache_dir_overridden) {
        CACHE_DIR = rebase(RTM_CACHE_DEFAULT_DIR);
    }

    SETTINGS_CONF = CONFIG_DIR / "rtm.conf";
    REGISTRY_CONF = CONFIG_DIR / "registry.conf";
}

void set_cache_dir(const fs::path& cache_dir) {
    if (cache_dir.empty()) {
        cache_dir_overridden = false;
        set_root_path(ROOT_DIR.string());
        return;
    }
    CACHE_DIR = fs::absolute(cache_dir).lexically_normal();
    cache_dir_overridden = true;
}

void init_filesystem() {
    ensure_dir_exists(CACHE_DIR);
}

Settings load_settings(const fs::path& path) {
    Settings settings;
    std::ifstream file(path);
    if (!file.is_open()) {
        return settings;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            throw RtmException(ErrorKind::Config, string_format("error.malformed_setting_line", line));
        }
        const std::string key = trim(line.substr(0, pos));
        const std::string value = trim(line.substr(pos + 1));

        if (key == "registry_url") {
            settings.registry_url = value;
        } else if (key == "max_attempts") {
            settings.max_attempts = parse_number<int>(key, value);
            if (settings.max_attempts < 1) {
                throw RtmException(ErrorKind::Config, string_format("error.invalid_setting", key, value));
            }
        } else if (key == "backoff_base_ms") {
            settings.backoff_base = std::chrono::milliseconds(parse_number<long>(key, value));
        } else if (key == "backoff_max_ms") {
            settings.backoff_max = std::chrono::milliseconds(parse_number<long>(key, value));
        } else if (key == "connect_timeout_s") {
            settings.connect_timeout_s = parse_number<long>(key, value);
        } else if (key == "low_speed_timeout_s") {
            settings.low_speed_timeout_s = parse_number<long>(key, value);
        } else if (key == "transfer_timeout_s") {
            settings.transfer_timeout_s = parse_number<long>(key, value);
        } else if (key == "system_runtime") {
            if (!value.empty()) settings.system_runtime = fs::path(value);
        } else if (key == "keep_versions") {
            settings.keep_versions = parse_number<std::size_t>(key, value);
        } else {
            log_warning(string_format("warning.unknown_setting", key));
        }
    }

    if (settings.backoff_max < settings.backoff_base) {
        settings.backoff_max = settings.backoff_base;
    }
    return settings;
}

Settings load_settings() {
    Settings settings = load_settings(SETTINGS_CONF);
    if (const char* url = std::getenv("RTM_REGISTRY_URL"); url && *url) {
        settings.registry_url = url;
    }
    return settings;
}

std::string get_registry_url(const Settings& settings) {
    if (!settings.registry_url.empty()) {
        return settings.registry_url;
    }
    std::ifstream registry_file(REGISTRY_CONF);
    if (!registry_file.is_open()) {
        throw RtmException(ErrorKind::Config, string_format("error.open_file_failed", REGISTRY_CONF.string()));
    }
    std::string registry_url;
    if (!std::getline(registry_file, registry_url) || trim(registry_url).empty()) {
        throw RtmException(ErrorKind::Config, get_string("error.invalid_registry_config"));
    }
    return trim(registry_url);
}
