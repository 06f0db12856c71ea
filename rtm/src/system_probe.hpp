#pragma once

#include "config.hpp"
#include "version_resolver.hpp"

#include <filesystem>
#include <optional>
#include <vector>

// Directories where distributions and Steam place an unmanaged runtime.
std::vector<std::filesystem::path> default_system_runtime_dirs();

// First existing directory among `candidates`, if any.
std::optional<std::filesystem::path> find_system_runtime(const std::vector<std::filesystem::path>& candidates);

// settings.system_runtime when configured, otherwise the well-known locations.
SystemRuntimeProbe make_default_probe(const Settings& settings);
