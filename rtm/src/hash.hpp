#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

struct evp_md_ctx_st;

struct EvpMdCtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const;
};

// Incremental SHA-256, fed chunk by chunk while a download streams in.
class Sha256Stream {
public:
    Sha256Stream();
    void update(const void* data, std::size_t size);
    // Returns the lowercase hex digest. The stream cannot be updated afterwards.
    std::string finish();

private:
    std::unique_ptr<evp_md_ctx_st, EvpMdCtxDeleter> ctx_;
    bool finished_ = false;
};

// Calculates the SHA256 hash of a file.
// Throws RtmException if the file cannot be opened.
std::string calculate_sha256(const fs::path& file_path);
