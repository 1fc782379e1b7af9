#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

fs::path PACK_ROOT;
fs::path DOWNLOAD_DIR;
fs::path LOCAL_DIR;
fs::path WEB_DIR;
fs::path PUBLIC_INDEX_FILE;
fs::path LOCAL_INDEX_FILE;
fs::path PACK_IDX_FILE;
fs::path LOCK_FILE;

fs::path L10N_DIR = PACKGET_L10N_DIR;

void set_pack_root(const std::string& root_path) {
    if (root_path.empty()) {
        throw PackgetException(ErrorKind::Usage, get_string("error.pack_root_empty"));
    }
    PACK_ROOT = fs::absolute(fs::path(root_path)).lexically_normal();
    if (!PACK_ROOT.has_filename() && PACK_ROOT.has_parent_path() && PACK_ROOT != PACK_ROOT.root_path()) {
        PACK_ROOT = PACK_ROOT.parent_path();
    }

    DOWNLOAD_DIR = PACK_ROOT / ".Download";
    LOCAL_DIR = PACK_ROOT / ".Local";
    WEB_DIR = PACK_ROOT / ".Web";
    PUBLIC_INDEX_FILE = WEB_DIR / PUBLIC_INDEX_NAME;
    LOCAL_INDEX_FILE = LOCAL_DIR / LOCAL_INDEX_NAME;
    PACK_IDX_FILE = PACK_ROOT / "pack.idx";
    LOCK_FILE = PACK_ROOT / ".lock";
}

std::string get_default_pack_root() {
    if (const char* root = getenv("CMSIS_PACK_ROOT"); root && *root) {
        return fs::path(root).lexically_normal().string();
    }
    fs::path base;
    if (const char* xdg = getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = getenv("HOME"); home && *home) {
        base = fs::path(home) / ".cache";
    } else {
        return "";
    }
    return (base / "arm" / "packs").lexically_normal().string();
}

void init_filesystem() {
    if (PACK_ROOT.empty()) {
        throw PackgetException(ErrorKind::Usage, get_string("error.pack_root_empty"));
    }
    ensure_dir_exists(PACK_ROOT);
    ensure_dir_exists(DOWNLOAD_DIR);
    ensure_dir_exists(LOCAL_DIR);
    ensure_dir_exists(WEB_DIR);
}
