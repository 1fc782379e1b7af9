#pragma once

#include "cancellation.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

inline constexpr std::uint64_t MAX_DOWNLOAD_SIZE = 20ULL * 1024 * 1024 * 1024;

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};

// Downloads `url` into `output_path` through a ".part" file that is renamed on success
// and removed on failure. Throws FetchFailed, or Cancelled when `token` fires.
void download_file(const std::string& url, const fs::path& output_path, const CancellationToken& token,
                   bool show_progress = true, std::uint64_t max_size = MAX_DOWNLOAD_SIZE);

// Returns `cache_dir/<file name of url>`, downloading it first unless it is already cached.
fs::path fetch_pack(const std::string& url, const fs::path& cache_dir, const CancellationToken& token);
