#pragma once

#include "downloader.hpp"

#include <cstdint>
#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Integrity data declared by the registry. sha256 wins when both are present.
struct IntegrityCheck {
    std::string sha256;
    std::optional<std::uint64_t> size;

    bool empty() const { return sha256.empty() && !size.has_value(); }
};

struct ReleaseAsset {
    std::string id;
    std::string url;
    IntegrityCheck integrity;
};

// Registry collaborator: the published runtime versions, in registry order.
class RegistrySource {
public:
    virtual ~RegistrySource() = default;
    virtual std::vector<ReleaseAsset> list_versions() = 0;

    std::optional<ReleaseAsset> find(const std::string& id);
};

// Fixed in-memory list of releases.
class StaticRegistry : public RegistrySource {
public:
    StaticRegistry() = default;
    explicit StaticRegistry(std::vector<ReleaseAsset> releases) : releases_(std::move(releases)) {}

    std::vector<ReleaseAsset> list_versions() override { return releases_; }

private:
    std::vector<ReleaseAsset> releases_;
};

// Registry backed by an index file of `id|asset_url|sha256|size` lines, read from a local
// path, a file:// URL or downloaded over http(s).
class IndexRegistry : public RegistrySource {
public:
    explicit IndexRegistry(std::string index_url, TransferOptions options = {});

    std::vector<ReleaseAsset> list_versions() override;
    // Drops the cached index so the next list_versions() reloads it.
    void refresh();

    static std::vector<ReleaseAsset> parse_index(std::istream& in);

private:
    void load_index();

    std::string index_url_;
    TransferOptions options_;
    std::mutex mtx_;
    bool loaded_ = false;
    std::vector<ReleaseAsset> releases_;
};
