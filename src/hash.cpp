#include "hash.hpp"
#include "exception.hpp"

#include <openssl/evp.h>

#include <format>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace {

// Custom deleter for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

EvpMdCtxPtr new_sha256_context() {
    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw PlugupException("Failed to create OpenSSL digest context");
    }
    if (EVP_DigestInit_ex(md_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw PlugupException("Failed to initialize SHA256 digest");
    }
    return md_ctx;
}

void update(EVP_MD_CTX* ctx, const void* data, size_t len) {
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw PlugupException("Failed to update SHA256 digest");
    }
}

std::string finish(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        throw PlugupException("Failed to finalize SHA256 digest");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // anonymous namespace

std::string calculate_sha256(const fs::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw PlugupException(std::format("Failed to open file: {}", file_path.string()));
    }

    EvpMdCtxPtr md_ctx = new_sha256_context();

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer))) {
        update(md_ctx.get(), buffer, file.gcount());
    }
    if (file.gcount() > 0) { // Handle the last chunk
        update(md_ctx.get(), buffer, file.gcount());
    }

    return finish(md_ctx.get());
}

std::string sha256_hex(std::string_view data) {
    EvpMdCtxPtr md_ctx = new_sha256_context();
    update(md_ctx.get(), data.data(), data.size());
    return finish(md_ctx.get());
}
