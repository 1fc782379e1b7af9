#include <gtest/gtest.h>
#include "../src/config.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    std::optional<std::string> saved_pack_root;
    std::optional<std::string> saved_xdg;
    std::optional<std::string> saved_home;

    static std::optional<std::string> get_env(const char* name) {
        const char* v = getenv(name);
        return v ? std::optional<std::string>(v) : std::nullopt;
    }

    static void restore_env(const char* name, const std::optional<std::string>& value) {
        if (value) {
            setenv(name, value->c_str(), 1);
        } else {
            unsetenv(name);
        }
    }

    void SetUp() override {
        init_localization();
        saved_pack_root = get_env("CMSIS_PACK_ROOT");
        saved_xdg = get_env("XDG_CACHE_HOME");
        saved_home = get_env("HOME");
    }

    void TearDown() override {
        restore_env("CMSIS_PACK_ROOT", saved_pack_root);
        restore_env("XDG_CACHE_HOME", saved_xdg);
        restore_env("HOME", saved_home);
    }
};

TEST_F(ConfigTest, PackRootLayout) {
    set_pack_root("/opt/packs");
    EXPECT_EQ(PACK_ROOT, "/opt/packs");
    EXPECT_EQ(DOWNLOAD_DIR, "/opt/packs/.Download");
    EXPECT_EQ(LOCAL_DIR, "/opt/packs/.Local");
    EXPECT_EQ(WEB_DIR, "/opt/packs/.Web");
    EXPECT_EQ(PUBLIC_INDEX_FILE, "/opt/packs/.Web/index.pidx");
    EXPECT_EQ(LOCAL_INDEX_FILE, "/opt/packs/.Local/local_repository.pidx");
    EXPECT_EQ(PACK_IDX_FILE, "/opt/packs/pack.idx");
}

TEST_F(ConfigTest, TrailingSlashAndRelativeRoot) {
    set_pack_root("/opt/packs/");
    EXPECT_EQ(PACK_ROOT, "/opt/packs");

    set_pack_root("relative/packs");
    EXPECT_EQ(PACK_ROOT, (fs::current_path() / "relative" / "packs").lexically_normal());
}

TEST_F(ConfigTest, EmptyRootRejected) {
    try {
        set_pack_root("");
        FAIL() << "empty root accepted";
    } catch (const PackgetException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Usage);
    }
}

TEST_F(ConfigTest, DefaultPackRootFromEnvironment) {
    setenv("CMSIS_PACK_ROOT", "/data/packs", 1);
    setenv("XDG_CACHE_HOME", "/xdg", 1);
    EXPECT_EQ(get_default_pack_root(), "/data/packs");

    unsetenv("CMSIS_PACK_ROOT");
    EXPECT_EQ(get_default_pack_root(), "/xdg/arm/packs");

    unsetenv("XDG_CACHE_HOME");
    setenv("HOME", "/home/dev", 1);
    EXPECT_EQ(get_default_pack_root(), "/home/dev/.cache/arm/packs");

    unsetenv("HOME");
    EXPECT_EQ(get_default_pack_root(), "");
}
