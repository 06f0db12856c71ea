#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <limits.h> // For PATH_MAX
#include <unistd.h> // For readlink

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex translations_mutex;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        if (count != -1) {
            return fs::path(std::string(result, static_cast<size_t>(count))).parent_path();
        }
        return fs::current_path();
    }

    void load_strings(const std::string& lang, const fs::path& base_dir) {
        auto file_path = base_dir / (lang + ".txt");
        std::ifstream file(file_path);
        if (!file.is_open()) {
            if (lang != "en") {
                log_warning("Could not open localization file for " + lang + ", falling back to English.");
                load_strings("en", base_dir);
            }
            return;
        }

        std::lock_guard<std::mutex> lock(translations_mutex);
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
    }
}

void init_localization() {
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).find("zh") == 0) {
        lang = "zh";
    }

    // A build tree keeps l10n/ next to bin/; an installed copy uses L10N_DIR.
    fs::path relative_l10n_dir = get_executable_dir() / ".." / "l10n";
    if (fs::exists(relative_l10n_dir) && fs::is_directory(relative_l10n_dir)) {
        load_strings(lang, relative_l10n_dir);
    } else {
        load_strings(lang, L10N_DIR);
    }
}

const std::string& get_string(const std::string& key) {
    std::lock_guard<std::mutex> lock(translations_mutex);
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
