#pragma once

#include "cancellation.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

struct archive;

// Per-entry cap on extracted data.
inline constexpr std::uint64_t MAX_EXTRACT_ENTRY_SIZE = 20ULL * 1024 * 1024 * 1024;
inline constexpr size_t EXTRACT_CHUNK_SIZE = 4096;

struct ExtractOptions {
    // Leading folder removed from every entry name; entries outside it are skipped.
    std::string strip_prefix;
    std::uint64_t max_entry_size = MAX_EXTRACT_ENTRY_SIZE;
};

// Reads the data of the current archive entry.
class ArchiveEntryReader {
public:
    explicit ArchiveEntryReader(struct archive* a) : a_(a) {}
    // Returns 0 at the end of the entry. Throws ExtractionFailed on read errors.
    size_t read(char* buffer, size_t size);
private:
    struct archive* a_;
};

// Entry names with "./" removed, directories end in '/'.
std::vector<std::string> list_archive_entries(const std::filesystem::path& archive_path);

// Calls `visit` for every regular file entry.
void for_each_archive_entry(const std::filesystem::path& archive_path,
                            const std::function<void(const std::string& name, ArchiveEntryReader& reader)>& visit);

// Extracts every entry below `output_dir` and returns the written paths.
// Throws ExtractionFailed for traversal attempts, oversized entries and broken
// archives, Cancelled when `token` fires (the partially written file is removed).
std::vector<std::filesystem::path> extract_archive(const std::filesystem::path& archive_path,
                                                   const std::filesystem::path& output_dir,
                                                   const CancellationToken& token,
                                                   const ExtractOptions& options = {});

// Reads a single entry into memory. Throws ExtractionFailed if it is missing or too large.
std::string extract_file_from_archive(const std::filesystem::path& archive_path, const std::string& internal_path,
                                      std::uint64_t max_size = 64ULL * 1024 * 1024);
