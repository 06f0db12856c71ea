#include "system_probe.hpp"

#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

std::vector<fs::path> default_system_runtime_dirs() {
    std::vector<fs::path> dirs = {
        ROOT_DIR / "usr/share/steam/compatibilitytools.d/proton-ge-custom",
        ROOT_DIR / "usr/lib/proton",
        ROOT_DIR / "usr/share/proton",
    };
    if (const char* home = std::getenv("HOME"); home && *home) {
        dirs.push_back(fs::path(home) / ".steam/steam/steamapps/common/Proton - Experimental");
        dirs.push_back(fs::path(home) / ".local/share/Steam/steamapps/common/Proton - Experimental");
    }
    return dirs;
}

std::optional<fs::path> find_system_runtime(const std::vector<fs::path>& candidates) {
    for (const auto& dir : candidates) {
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            return dir;
        }
    }
    return std::nullopt;
}

SystemRuntimeProbe make_default_probe(const Settings& settings) {
    if (settings.system_runtime) {
        fs::path configured = *settings.system_runtime;
        return [configured]() -> std::optional<fs::path> {
            std::error_code ec;
            if (fs::is_directory(configured, ec)) {
                return configured;
            }
            log_warning(string_format("warning.system_runtime_missing", configured.string()));
            return std::nullopt;
        };
    }
    return []() { return find_system_runtime(default_system_runtime_dirs()); };
}
