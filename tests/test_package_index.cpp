#include <gtest/gtest.h>
#include "../src/package_index.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "../src/utils.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <filesystem>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

PdscTag make_tag(const std::string& vendor, const std::string& name, const std::string& version,
                 const std::string& url = "https://example.com/packs/") {
    PdscTag tag;
    tag.vendor = vendor;
    tag.name = name;
    tag.version = version;
    tag.url = url;
    return tag;
}

std::vector<PdscTag> sorted(std::vector<PdscTag> tags) {
    std::sort(tags.begin(), tags.end(), [](const PdscTag& a, const PdscTag& b) {
        return a.key() != b.key() ? a.key() < b.key() : a.url < b.url;
    });
    return tags;
}

} // namespace

class PackageIndexTest : public ::testing::Test {
protected:
    fs::path test_root;
    fs::path index_file;

    void SetUp() override {
        init_localization();
        test_root = fs::absolute("tmp_index_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);
        index_file = test_root / "local_repository.pidx";
    }

    void TearDown() override {
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }

    void expect_kind(const std::function<void()>& fn, ErrorKind kind) {
        try {
            fn();
            FAIL() << "expected " << error_kind_name(kind);
        } catch (const PackgetException& e) {
            EXPECT_EQ(e.kind(), kind) << e.what();
        }
    }
};

TEST_F(PackageIndexTest, ReadCreatesMissingFile) {
    PackageIndex index(index_file);
    index.read();

    EXPECT_TRUE(fs::exists(index_file));
    EXPECT_TRUE(index.empty());
    EXPECT_EQ(index.vendor(), "local_repository");
    EXPECT_EQ(index.schema_version(), "1.1.0");
    EXPECT_TRUE(parse_timestamp(index.timestamp()).has_value());
}

TEST_F(PackageIndexTest, AddAndLookup) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0"));

    EXPECT_FALSE(index.empty());
    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "1.0.0")), 0);
    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "1.0.0", "https://mirror.example.com/")), PDSC_INDEX_NOT_FOUND);
    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "2.0.0")), PDSC_INDEX_NOT_FOUND);
    EXPECT_EQ(index.find_pdsc_tags(make_tag("Vendor", "Pack", "1.0.0")).size(), 1u);
}

TEST_F(PackageIndexTest, DuplicateExactKeyRejected) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0"));

    expect_kind([&] { index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0")); }, ErrorKind::EntryExists);
    expect_kind([&] { index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0", "https://other.example.com/")); }, ErrorKind::EntryExists);

    auto all = index.list_pdsc_tags();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].url, "https://example.com/packs/");
}

TEST_F(PackageIndexTest, VersionsOfOneFamilyCoexist) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0"));
    index.add_pdsc(make_tag("Vendor", "Pack", "1.10.0"));
    index.add_pdsc(make_tag("Vendor", "Pack", "1.2.0"));

    PdscTag family;
    family.vendor = "Vendor";
    family.name = "Pack";
    auto found = index.find_pdsc_tags(family);
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].version, "1.10.0");
    EXPECT_EQ(found[1].version, "1.2.0");
    EXPECT_EQ(found[2].version, "1.0.0");

    // The most recently added version is canonical.
    auto canonical = index.find_canonical_pdsc_tag(family);
    ASSERT_TRUE(canonical.has_value());
    EXPECT_EQ(canonical->version, "1.2.0");
}

TEST_F(PackageIndexTest, FamilyLookupIgnoresCase) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0"));

    PdscTag family;
    family.vendor = "VENDOR";
    family.name = "pack";
    EXPECT_EQ(index.find_pdsc_tags(family).size(), 1u);
}

TEST_F(PackageIndexTest, FamilyLookupDoesNotMatchPrefixes) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "PackExtra", "1.0.0"));
    index.add_pdsc(make_tag("OtherVendor", "Pack", "1.0.0"));

    PdscTag family;
    family.vendor = "Vendor";
    family.name = "Pack";
    EXPECT_TRUE(index.find_pdsc_tags(family).empty());
    expect_kind([&] { index.remove_pdsc(family); }, ErrorKind::EntryNotFound);
    EXPECT_EQ(index.list_pdsc_tags().size(), 2u);
}

TEST_F(PackageIndexTest, RoundTrip) {
    {
        PackageIndex index(index_file);
        index.read();
        auto deprecated = make_tag("Vendor", "Old", "0.9.0");
        deprecated.deprecated = "2023-05-01";
        deprecated.replacement = "Vendor.New";
        index.add_pdsc(deprecated);
        index.add_pdsc(make_tag("Vendor", "New", "1.0.0"));
        index.add_pdsc(make_tag("Vendor", "New", "1.1.0+build.3"));
        index.add_pdsc(make_tag("Other", "Pack", "2.0.0-rc1", "file://localhost/work/"));
        index.write();
        // Writing again must not duplicate anything.
        index.write();
    }

    PackageIndex first(index_file);
    first.read();

    PackageIndex reread(index_file);
    reread.read();
    EXPECT_EQ(sorted(reread.list_pdsc_tags()), sorted(first.list_pdsc_tags()));
    ASSERT_EQ(reread.list_pdsc_tags().size(), 4u);

    auto old = reread.find_pdsc_tags(make_tag("Vendor", "Old", "0.9.0"));
    ASSERT_EQ(old.size(), 1u);
    EXPECT_EQ(old[0].deprecated, "2023-05-01");
    EXPECT_EQ(old[0].replacement, "Vendor.New");
}

TEST_F(PackageIndexTest, RemoveWithoutVersionRemovesWholeFamily) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0"));
    index.add_pdsc(make_tag("Vendor", "Pack", "2.0.0"));
    index.add_pdsc(make_tag("Other", "Pack", "1.0.0"));

    PdscTag family;
    family.vendor = "Vendor";
    family.name = "Pack";
    index.remove_pdsc(family);

    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "1.0.0")), PDSC_INDEX_NOT_FOUND);
    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "2.0.0")), PDSC_INDEX_NOT_FOUND);
    EXPECT_EQ(index.has_pdsc(make_tag("Other", "Pack", "1.0.0")), 0);
    EXPECT_FALSE(index.find_canonical_pdsc_tag(family).has_value());
}

TEST_F(PackageIndexTest, RemoveSingleVersion) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0"));
    index.add_pdsc(make_tag("Vendor", "Pack", "2.0.0"));

    index.remove_pdsc(make_tag("Vendor", "Pack", "1.0.0"));
    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "1.0.0")), PDSC_INDEX_NOT_FOUND);
    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "2.0.0")), 0);

    expect_kind([&] { index.remove_pdsc(make_tag("Vendor", "Pack", "1.0.0")); }, ErrorKind::EntryNotFound);
}

TEST_F(PackageIndexTest, RemoveToleratesBuildMetadata) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "Pack", "1.2.3+meta"));

    EXPECT_EQ(index.find_pdsc_tags(make_tag("Vendor", "Pack", "1.2.3")).size(), 1u);
    index.remove_pdsc(make_tag("Vendor", "Pack", "1.2.3"));
    EXPECT_TRUE(index.empty());
}

TEST_F(PackageIndexTest, RemovingCanonicalPromotesHighestVersion) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0"));
    index.add_pdsc(make_tag("Vendor", "Pack", "3.0.0"));
    index.add_pdsc(make_tag("Vendor", "Pack", "2.0.0"));

    index.remove_pdsc(make_tag("Vendor", "Pack", "2.0.0"));

    PdscTag family;
    family.vendor = "Vendor";
    family.name = "Pack";
    auto canonical = index.find_canonical_pdsc_tag(family);
    ASSERT_TRUE(canonical.has_value());
    EXPECT_EQ(canonical->version, "3.0.0");
}

TEST_F(PackageIndexTest, ReplaceVersion) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0"));

    index.replace_pdsc_version(make_tag("Vendor", "Pack", "2.0.0"));

    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "1.0.0")), PDSC_INDEX_NOT_FOUND);
    EXPECT_GE(index.has_pdsc(make_tag("Vendor", "Pack", "2.0.0")), 0);

    PdscTag family;
    family.vendor = "Vendor";
    family.name = "Pack";
    EXPECT_EQ(index.find_pdsc_tags(family).size(), 1u);
    EXPECT_EQ(index.list_pdsc_tags().size(), 1u);
}

TEST_F(PackageIndexTest, ReplaceKeepsUrlUnlessGiven) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("Vendor", "Pack", "1.0.0", "file://localhost/dev/"));

    index.replace_pdsc_version(make_tag("Vendor", "Pack", "1.1.0", ""));
    auto tags = index.list_pdsc_tags();
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].version, "1.1.0");
    EXPECT_EQ(tags[0].url, "file://localhost/dev/");
}

TEST_F(PackageIndexTest, ReplaceUnknownFamilyFails) {
    PackageIndex index(index_file);
    index.read();
    expect_kind([&] { index.replace_pdsc_version(make_tag("Vendor", "Pack", "2.0.0")); }, ErrorKind::EntryNotFound);
    EXPECT_TRUE(index.empty());
}

TEST_F(PackageIndexTest, FamilyConsistencyAfterMixedOperations) {
    PackageIndex index(index_file);
    index.read();
    index.add_pdsc(make_tag("A", "One", "1.0.0"));
    index.add_pdsc(make_tag("A", "One", "1.1.0"));
    index.add_pdsc(make_tag("B", "Two", "0.1.0"));
    index.replace_pdsc_version(make_tag("A", "One", "1.2.0"));
    index.remove_pdsc(make_tag("A", "One", "1.0.0"));
    index.add_pdsc(make_tag("C", "Three", "5.0.0"));
    index.replace_pdsc_version(make_tag("C", "Three", "5.0.1"));
    index.remove_pdsc(make_tag("B", "Two", ""));

    const auto all = index.list_pdsc_tags();
    ASSERT_EQ(all.size(), 2u);
    for (const auto& tag : all) {
        PdscTag family;
        family.vendor = tag.vendor;
        family.name = tag.name;
        auto canonical = index.find_canonical_pdsc_tag(family);
        ASSERT_TRUE(canonical.has_value()) << tag.key();
        EXPECT_EQ(canonical->family_key(), tag.family_key());
        EXPECT_GE(index.has_pdsc(*canonical), 0);

        auto members = index.find_pdsc_tags(family);
        EXPECT_NE(std::find(members.begin(), members.end(), tag), members.end());
    }
}

TEST_F(PackageIndexTest, SameKeyUnderSeveralUrlsFromDisk) {
    write_text(index_file, make_pidx(format_timestamp(std::chrono::system_clock::now()),
        "    <pdsc vendor=\"Vendor\" name=\"Pack\" version=\"1.0.0\" url=\"https://a.example.com/\"/>\n"
        "    <pdsc vendor=\"Vendor\" name=\"Pack\" version=\"1.0.0\" url=\"https://b.example.com/\"/>\n"));

    PackageIndex index(index_file);
    index.read();
    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "1.0.0", "https://a.example.com/")), 0);
    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "1.0.0", "https://b.example.com/")), 1);
    EXPECT_EQ(index.vendor(), "TestVendor");
    EXPECT_EQ(index.url(), "https://example.com/");

    // A URL-restricted removal only drops the matching source.
    index.remove_pdsc(make_tag("Vendor", "Pack", "1.0.0", "https://a.example.com/"));
    EXPECT_EQ(index.has_pdsc(make_tag("Vendor", "Pack", "1.0.0", "https://b.example.com/")), 0);
}

TEST_F(PackageIndexTest, StaleIndex) {
    const auto now = std::chrono::system_clock::now();

    write_text(index_file, make_pidx(format_timestamp(now - std::chrono::hours(48)), ""));
    PackageIndex stale(index_file);
    expect_kind([&] { stale.check_time(); }, ErrorKind::StaleIndex);

    write_text(index_file, make_pidx(format_timestamp(now - std::chrono::hours(1)), ""));
    PackageIndex fresh(index_file);
    EXPECT_NO_THROW(fresh.check_time());
}

TEST_F(PackageIndexTest, CheckTimeEdgeCases) {
    PackageIndex missing(test_root / "absent.pidx");
    EXPECT_NO_THROW(missing.check_time());
    EXPECT_FALSE(fs::exists(test_root / "absent.pidx"));

    write_text(index_file, make_pidx("", ""));
    PackageIndex no_stamp(index_file);
    expect_kind([&] { no_stamp.check_time(); }, ErrorKind::StaleIndex);

    write_text(index_file, make_pidx("yesterday", ""));
    PackageIndex bad_stamp(index_file);
    expect_kind([&] { bad_stamp.check_time(); }, ErrorKind::IndexCorrupt);

    // Offsets are honoured: 10:00+02:00 is 08:00Z.
    auto parsed = parse_timestamp("2024-01-01T10:00:00.5+02:00");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(format_timestamp(*parsed), "2024-01-01T08:00:00.500000000Z");
}

TEST_F(PackageIndexTest, WriteRefreshesTimestamp) {
    write_text(index_file, make_pidx(format_timestamp(std::chrono::system_clock::now() - std::chrono::hours(72)), ""));
    PackageIndex index(index_file);
    index.read();
    index.write();
    EXPECT_NO_THROW(index.check_time());
}

TEST_F(PackageIndexTest, CorruptFilesAreReported) {
    write_text(index_file, "<index><pindex><pdsc vendor=");
    PackageIndex broken(index_file);
    expect_kind([&] { broken.read(); }, ErrorKind::IndexCorrupt);

    write_text(index_file, "<?xml version=\"1.0\"?><package/>");
    PackageIndex wrong_root(index_file);
    expect_kind([&] { wrong_root.read(); }, ErrorKind::IndexCorrupt);

    write_text(index_file, make_pidx("", "    <pdsc name=\"NoVendor\" version=\"1.0.0\" url=\"x\"/>\n"));
    PackageIndex bad_entry(index_file);
    expect_kind([&] { bad_entry.read(); }, ErrorKind::IndexCorrupt);
}

TEST_F(PackageIndexTest, ConcurrentAdds) {
    PackageIndex index(index_file);
    index.read();

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&index, t]() {
            for (int i = 0; i < 25; ++i) {
                index.add_pdsc(make_tag("Vendor", "Pack" + std::to_string(t), "1.0." + std::to_string(i)));
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(index.list_pdsc_tags().size(), 200u);
    PdscTag family;
    family.vendor = "Vendor";
    family.name = "Pack3";
    EXPECT_EQ(index.find_pdsc_tags(family).size(), 25u);
}
