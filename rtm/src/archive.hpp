#pragma once

#include <filesystem>

// Unpacks a runtime tarball (any compression libarchive understands) under output_dir.
// Returns the number of entries written. Entries escaping output_dir abort the extraction.
long long extract_archive(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir);
