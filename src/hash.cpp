#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw PackgetException(ErrorKind::IntegrityFailed, get_string("error.openssl_ctx_failed"));
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw PackgetException(ErrorKind::IntegrityFailed, get_string("error.openssl_init_failed"));
    }
}

void Sha256::update(const void* data, size_t size) {
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw PackgetException(ErrorKind::IntegrityFailed, get_string("error.openssl_update_failed"));
    }
}

std::string Sha256::hex_digest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) {
        throw PackgetException(ErrorKind::IntegrityFailed, get_string("error.openssl_final_failed"));
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string calculate_sha256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw PackgetException(ErrorKind::FetchFailed, string_format("error.open_file_failed", file_path.string()));
    }

    Sha256 sha;
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer))) {
        sha.update(buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.gcount() > 0) {
        sha.update(buffer, static_cast<size_t>(file.gcount()));
    }
    return sha.hex_digest();
}

std::string calculate_sha256_of(std::string_view data) {
    Sha256 sha;
    sha.update(data.data(), data.size());
    return sha.hex_digest();
}
