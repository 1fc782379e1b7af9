#pragma once

#include <string>
#include <filesystem>

inline constexpr const char* DEFAULT_PUBLIC_INDEX_URL = "https://www.keil.com/pack/index.pidx";
inline constexpr const char* PUBLIC_INDEX_NAME = "index.pidx";
inline constexpr const char* LOCAL_INDEX_NAME = "local_repository.pidx";

// Pack root layout (set by set_pack_root)
extern std::filesystem::path PACK_ROOT;
extern std::filesystem::path DOWNLOAD_DIR;
extern std::filesystem::path LOCAL_DIR;
extern std::filesystem::path WEB_DIR;
extern std::filesystem::path PUBLIC_INDEX_FILE;
extern std::filesystem::path LOCAL_INDEX_FILE;
extern std::filesystem::path PACK_IDX_FILE;
extern std::filesystem::path LOCK_FILE;

extern std::filesystem::path L10N_DIR;

// Functions
void set_pack_root(const std::string& root_path);
std::string get_default_pack_root();
void init_filesystem();
