#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>

void EvpMdCtxDeleter::operator()(EVP_MD_CTX* ctx) const {
    if (ctx) {
        EVP_MD_CTX_free(ctx);
    }
}

Sha256Stream::Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw RtmException(ErrorKind::Integrity, get_string("error.openssl_ctx_failed"));
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw RtmException(ErrorKind::Integrity, get_string("error.openssl_init_failed"));
    }
}

void Sha256Stream::update(const void* data, std::size_t size) {
    if (finished_) {
        throw RtmException(ErrorKind::InvalidState, get_string("error.digest_finished"));
    }
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw RtmException(ErrorKind::Integrity, get_string("error.openssl_update_failed"));
    }
}

std::string Sha256Stream::finish() {
    if (finished_) {
        throw RtmException(ErrorKind::InvalidState, get_string("error.digest_finished"));
    }
    finished_ = true;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
        throw RtmException(ErrorKind::Integrity, get_string("error.openssl_final_failed"));
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string calculate_sha256(const fs::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw RtmException(ErrorKind::Disk, string_format("error.open_file_failed", file_path.string()));
    }

    Sha256Stream digest;
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer))) {
        digest.update(buffer, static_cast<std::size_t>(file.gcount()));
    }
    if (file.gcount() > 0) { // Handle the last chunk
        digest.update(buffer, static_cast<std::size_t>(file.gcount()));
    }
    return digest.finish();
}
