#include "integrity.hpp"
#include "archive.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};

struct BioDeleter {
    void operator()(BIO* bio) const {
        if (bio) {
            BIO_free(bio);
        }
    }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

[[noreturn]] void integrity_failed(const std::string& message) {
    throw PackgetException(ErrorKind::IntegrityFailed, message);
}

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return get_string("error.unknown");
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

EvpPkeyPtr load_key(const fs::path& pem_path, bool is_private) {
    BioPtr bio(BIO_new_file(pem_path.c_str(), "r"));
    if (!bio) {
        integrity_failed(string_format("error.key_load_failed", pem_path.string(), openssl_error()));
    }
    EvpPkeyPtr key(is_private ? PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr)
                              : PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        integrity_failed(string_format("error.key_load_failed", pem_path.string(), openssl_error()));
    }
    return key;
}

template <typename Fn>
void for_each_chunk(const fs::path& file_path, Fn&& fn) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        integrity_failed(string_format("error.open_file_failed", file_path.string()));
    }
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        fn(buffer, static_cast<size_t>(file.gcount()));
    }
}

std::map<std::string, std::string> entry_digests(const fs::path& pack_path) {
    std::map<std::string, std::string> digests;
    for_each_archive_entry(pack_path, [&](const std::string& name, ArchiveEntryReader& reader) {
        Sha256 sha;
        char buffer[EXTRACT_CHUNK_SIZE];
        while (size_t n = reader.read(buffer, sizeof(buffer))) {
            sha.update(buffer, n);
        }
        digests[name] = sha.hex_digest();
    });
    return digests;
}

bool is_hex_digest(const std::string& s) {
    return s.size() == 64 && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c); });
}

} // anonymous namespace

void verify_pack(const fs::path& pack_path, const VerificationOptions& options) {
    if (!options.expected_sha256.empty()) {
        verify_sha256(pack_path, options.expected_sha256);
    }
    if (!options.checksum_file.empty()) {
        verify_checksum_file(pack_path, options.checksum_file);
    }
    if (!options.signature_file.empty()) {
        if (options.public_key_file.empty()) {
            throw PackgetException(ErrorKind::Usage, get_string("error.pubkey_required"));
        }
        verify_signature(pack_path, options.signature_file, options.public_key_file);
    }
}

void verify_sha256(const fs::path& file_path, const std::string& expected) {
    const std::string actual = calculate_sha256(file_path);
    if (to_lower(expected) != actual) {
        integrity_failed(string_format("error.hash_mismatch", file_path.filename().string(), expected, actual));
    }
    log_debug(string_format("debug.hash_verified", file_path.filename().string()));
}

std::string read_hash_file(const fs::path& hash_file) {
    std::istringstream in(read_file(hash_file));
    std::string digest;
    in >> digest;
    if (!is_hex_digest(digest)) {
        throw PackgetException(ErrorKind::Usage, string_format("error.bad_hash_file", hash_file.string()));
    }
    return to_lower(digest);
}

fs::path checksum_file_name(const fs::path& pack_path, const fs::path& dest_dir) {
    fs::path dir = dest_dir.empty() ? pack_path.parent_path() : dest_dir;
    return dir / (pack_path.stem().string() + ".sha256.checksum");
}

fs::path generate_checksum_file(const fs::path& pack_path, const fs::path& dest_dir) {
    if (!fs::exists(pack_path)) {
        throw PackgetException(ErrorKind::FetchFailed, string_format("error.file_not_found", pack_path.string()));
    }
    if (!dest_dir.empty() && !fs::is_directory(dest_dir)) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.path_not_dir", dest_dir.string()));
    }
    const fs::path output = checksum_file_name(pack_path, dest_dir);
    if (fs::exists(output)) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.path_exists", output.string()));
    }

    std::ostringstream out;
    for (const auto& [name, digest] : entry_digests(pack_path)) {
        out << digest << " " << name << "\n";
    }
    write_file_atomic(output, out.str());
    log_info(string_format("info.checksum_created", output.string()));
    return output;
}

void verify_checksum_file(const fs::path& pack_path, const fs::path& checksum_file) {
    if (!fs::exists(checksum_file)) {
        integrity_failed(string_format("error.file_not_found", checksum_file.string()));
    }
    const auto digests = entry_digests(pack_path);

    std::istringstream in(read_file(checksum_file));
    std::string line;
    size_t listed = 0;
    std::vector<std::string> mismatched;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        size_t space = line.find(' ');
        if (space == std::string::npos) {
            integrity_failed(string_format("error.bad_checksum_line", checksum_file.string(), line));
        }
        const std::string digest = to_lower(line.substr(0, space));
        const std::string name = line.substr(space + 1);
        ++listed;

        auto it = digests.find(name);
        if (it == digests.end()) {
            integrity_failed(string_format("error.checksum_entry_missing", name));
        }
        if (it->second != digest) {
            log_error(string_format("error.checksum_mismatch", name));
            mismatched.push_back(name);
        }
    }

    if (listed != digests.size()) {
        integrity_failed(string_format("error.checksum_count_mismatch", listed, digests.size()));
    }
    if (!mismatched.empty()) {
        integrity_failed(string_format("error.bad_pack_integrity", pack_path.filename().string(), mismatched.size()));
    }
    log_info(get_string("info.checksum_verified"));
}

void sign_file(const fs::path& file_path, const fs::path& private_key_pem, const fs::path& signature_file) {
    EvpPkeyPtr key = load_key(private_key_pem, true);
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1) {
        integrity_failed(string_format("error.signature_failed", file_path.string(), openssl_error()));
    }
    for_each_chunk(file_path, [&](const char* data, size_t size) {
        if (EVP_DigestSignUpdate(ctx.get(), data, size) != 1) {
            integrity_failed(string_format("error.signature_failed", file_path.string(), openssl_error()));
        }
    });

    size_t sig_len = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) != 1) {
        integrity_failed(string_format("error.signature_failed", file_path.string(), openssl_error()));
    }
    std::string signature(sig_len, '\0');
    if (EVP_DigestSignFinal(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()), &sig_len) != 1) {
        integrity_failed(string_format("error.signature_failed", file_path.string(), openssl_error()));
    }
    signature.resize(sig_len);
    write_file_atomic(signature_file, signature);
    log_info(string_format("info.signature_created", signature_file.string()));
}

void verify_signature(const fs::path& file_path, const fs::path& signature_file, const fs::path& public_key_pem) {
    if (!fs::exists(signature_file)) {
        integrity_failed(string_format("error.file_not_found", signature_file.string()));
    }
    const std::string signature = read_file(signature_file);
    EvpPkeyPtr key = load_key(public_key_pem, false);

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1) {
        integrity_failed(string_format("error.signature_invalid", file_path.filename().string(), openssl_error()));
    }
    for_each_chunk(file_path, [&](const char* data, size_t size) {
        if (EVP_DigestVerifyUpdate(ctx.get(), data, size) != 1) {
            integrity_failed(string_format("error.signature_invalid", file_path.filename().string(), openssl_error()));
        }
    });

    int rc = EVP_DigestVerifyFinal(ctx.get(), reinterpret_cast<const unsigned char*>(signature.data()), signature.size());
    if (rc != 1) {
        integrity_failed(string_format("error.signature_invalid", file_path.filename().string(), openssl_error()));
    }
    log_info(string_format("info.signature_verified", file_path.filename().string()));
}
