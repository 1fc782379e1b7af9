#pragma once

#include <filesystem>
#include <string>

// Proof material supplied for one pack. Empty fields are skipped.
struct VerificationOptions {
    std::string expected_sha256;
    std::filesystem::path checksum_file;
    std::filesystem::path signature_file;
    std::filesystem::path public_key_file;

    bool empty() const {
        return expected_sha256.empty() && checksum_file.empty() && signature_file.empty();
    }
};

// Runs every configured check. Throws IntegrityFailed on the first mismatch.
void verify_pack(const std::filesystem::path& pack_path, const VerificationOptions& options);

void verify_sha256(const std::filesystem::path& file_path, const std::string& expected);
// First token of a "<hex digest> [file name]" file.
std::string read_hash_file(const std::filesystem::path& hash_file);

// "<dir>/<pack name without extension>.sha256.checksum"; `dest_dir` defaults to the pack's directory.
std::filesystem::path checksum_file_name(const std::filesystem::path& pack_path, const std::filesystem::path& dest_dir = {});
// Writes one "<sha256> <entry name>" line per file in the pack. Refuses to overwrite.
std::filesystem::path generate_checksum_file(const std::filesystem::path& pack_path, const std::filesystem::path& dest_dir = {});
void verify_checksum_file(const std::filesystem::path& pack_path, const std::filesystem::path& checksum_file);

// Detached SHA-256 signature over the whole file, keys in PEM format.
void sign_file(const std::filesystem::path& file_path, const std::filesystem::path& private_key_pem,
               const std::filesystem::path& signature_file);
void verify_signature(const std::filesystem::path& file_path, const std::filesystem::path& signature_file,
                      const std::filesystem::path& public_key_pem);
