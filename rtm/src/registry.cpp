#include "registry.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <set>
#include <sstream>
#include <string_view>

namespace {

std::vector<std::string_view> split(std::string_view s, char delim) {
    std::vector<std::string_view> res;
    size_t start = 0, end = 0;
    while ((end = s.find(delim, start)) != std::string_view::npos) {
        res.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    res.push_back(s.substr(start));
    return res;
}

bool is_hex_digest(std::string_view s) {
    if (s.size() != 64) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

std::optional<ReleaseAsset> RegistrySource::find(const std::string& id) {
    for (auto& release : list_versions()) {
        if (release.id == id) return release;
    }
    return std::nullopt;
}

IndexRegistry::IndexRegistry(std::string index_url, TransferOptions options)
    : index_url_(std::move(index_url)), options_(options) {}

std::vector<ReleaseAsset> IndexRegistry::list_versions() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!loaded_) {
        load_index();
    }
    return releases_;
}

void IndexRegistry::refresh() {
    std::lock_guard<std::mutex> lock(mtx_);
    loaded_ = false;
    releases_.clear();
}

void IndexRegistry::load_index() {
    const bool is_remote = index_url_.starts_with("http://") || index_url_.starts_with("https://");

    if (is_remote) {
        std::string body;
        TransferWriteFn write = [&body](const char* data, std::size_t size) {
            body.append(data, size);
            return true;
        };
        TransferStatus status = perform_transfer(index_url_, options_, write, {});
        if (!status.ok) {
            throw RtmException(status.kind, string_format("error.registry_unreachable", index_url_) + ": " + status.message);
        }
        std::istringstream in(body);
        releases_ = parse_index(in);
    } else {
        const std::string path_str = index_url_.starts_with("file://") ? index_url_.substr(7) : index_url_;
        std::ifstream file(path_str);
        if (!file.is_open()) {
            throw RtmException(ErrorKind::Config, string_format("error.registry_unreachable", index_url_));
        }
        releases_ = parse_index(file);
    }
    loaded_ = true;
    log_info(string_format("info.registry_loaded", releases_.size(), index_url_));
}

std::vector<ReleaseAsset> IndexRegistry::parse_index(std::istream& in) {
    std::vector<ReleaseAsset> releases;
    std::set<std::string> seen;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        std::string_view sv = line;
        if (!sv.empty() && sv.back() == '\r') sv.remove_suffix(1);
        if (sv.empty() || sv[0] == '#') continue;

        auto parts = split(sv, '|');
        if (parts.size() < 3) {
            log_warning(string_format("warning.registry_malformed_line", line_no));
            continue;
        }

        ReleaseAsset release;
        release.id = std::string(parts[0]);
        release.url = std::string(parts[1]);

        if (!is_valid_version_id(release.id)) {
            log_warning(string_format("warning.registry_invalid_id", release.id, line_no));
            continue;
        }
        if (release.url.empty()) {
            log_warning(string_format("warning.registry_malformed_line", line_no));
            continue;
        }

        if (!parts[2].empty()) {
            if (!is_hex_digest(parts[2])) {
                log_warning(string_format("warning.registry_bad_digest", release.id));
                continue;
            }
            for (char c : parts[2]) release.integrity.sha256.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        if (parts.size() > 3 && !parts[3].empty()) {
            std::uint64_t size = 0;
            auto [ptr, ec] = std::from_chars(parts[3].data(), parts[3].data() + parts[3].size(), size);
            if (ec != std::errc() || ptr != parts[3].data() + parts[3].size()) {
                log_warning(string_format("warning.registry_bad_size", release.id));
                continue;
            }
            release.integrity.size = size;
        }

        if (release.integrity.empty()) {
            log_warning(string_format("warning.registry_no_integrity", release.id));
            continue;
        }
        if (!seen.insert(release.id).second) {
            log_warning(string_format("warning.registry_duplicate_id", release.id));
            continue;
        }
        releases.push_back(std::move(release));
    }
    return releases;
}
