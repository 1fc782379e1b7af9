#include <gtest/gtest.h>
#include "../src/utils.hpp"
#include "../src/config.hpp"
#include "../src/localization.hpp"
#include <filesystem>
#include <future>
#include <memory>
#include <thread>

namespace fs = std::filesystem;

class LockTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        init_localization();
        test_root = fs::absolute("tmp_lock_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);

        set_pack_root(test_root.string());
        init_filesystem();
    }

    void TearDown() override {
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }
};

TEST_F(LockTest, BasicLocking) {
    std::unique_ptr<PackRootLock> lock1;
    EXPECT_NO_THROW(lock1 = std::make_unique<PackRootLock>());
    EXPECT_TRUE(fs::exists(test_root / ".lock"));

    try {
        PackRootLock lock2;
        FAIL() << "second lock acquired";
    } catch (const PackgetException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::FileSystem);
    }
}

TEST_F(LockTest, LockReleaseAndReacquire) {
    {
        PackRootLock lock1;
    }
    EXPECT_NO_THROW(PackRootLock lock2);
}

TEST_F(LockTest, HeldByOtherThread) {
    std::promise<void> acquired;
    std::promise<void> release;
    auto acquired_future = acquired.get_future();
    auto release_future = release.get_future().share();

    std::thread holder([&]() {
        PackRootLock lock;
        acquired.set_value();
        release_future.wait();
    });

    acquired_future.wait();
    EXPECT_THROW(PackRootLock lock2, PackgetException);
    release.set_value();
    holder.join();

    EXPECT_NO_THROW(PackRootLock lock3);
}
