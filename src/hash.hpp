#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

// Incremental SHA-256.
class Sha256 {
public:
    Sha256();
    void update(const void* data, size_t size);
    // Finishes the digest; the object must not be updated afterwards.
    std::string hex_digest();

private:
    EvpMdCtxPtr ctx_;
};

// Calculates the SHA256 hash of a file.
// Throws PackgetException if the file cannot be opened.
std::string calculate_sha256(const std::filesystem::path& file_path);
std::string calculate_sha256_of(std::string_view data);
