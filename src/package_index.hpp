#pragma once

#include "pdsc.hpp"
#include "utils.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

inline constexpr int PDSC_INDEX_NOT_FOUND = -1;
inline constexpr const char* PIDX_SCHEMA_VERSION = "1.1.0";

// A pidx file: the persisted list of known pack versions for one scope
// (the public web index or the local development index).
//
// Entries are held twice: by exact key ("Vendor.Name.Version") and by
// lowercase family key ("vendor.name"). Every family references at least one
// exact key, and the family's canonical key is the most recently added or
// replaced version. All access is serialized by one mutex; read() and write()
// hold it for their whole I/O pass.
class PackageIndex {
public:
    explicit PackageIndex(std::filesystem::path file_name);

    PackageIndex(const PackageIndex&) = delete;
    PackageIndex& operator=(const PackageIndex&) = delete;

    // Loads the file, creating an empty one when it does not exist.
    // Throws IndexCorrupt on malformed content.
    void read();
    // Stamps the current time and atomically rewrites the file.
    void write();
    // Throws StaleIndex if the on-disk timestamp is missing or older than 24 hours.
    // A missing file is considered fresh. Does not touch in-memory state.
    void check_time() const;

    // Throws EntryExists if the exact key is already indexed.
    void add_pdsc(const PdscTag& tag);
    // Moves the family's canonical entry to tag.version (and tag.url when set).
    // Throws EntryNotFound if the family is unknown.
    void replace_pdsc_version(const PdscTag& tag);
    // With a version removes that entry (only the one from tag.url when set);
    // without one removes every version of the family (restricted to tag.url when set).
    // Throws EntryNotFound if nothing matched.
    void remove_pdsc(const PdscTag& tag);

    // Position of the entry with tag's exact key and URL, or PDSC_INDEX_NOT_FOUND.
    int has_pdsc(const PdscTag& tag) const;
    // With a version: entries of that version, tolerating build metadata.
    // Without: all versions of the family, highest first.
    std::vector<PdscTag> find_pdsc_tags(const PdscTag& tag) const;
    std::optional<PdscTag> find_canonical_pdsc_tag(const PdscTag& tag) const;
    std::vector<PdscTag> list_pdsc_tags() const;
    bool empty() const;

    const std::filesystem::path& file_name() const { return file_name_; }
    std::string schema_version() const;
    std::string vendor() const;
    std::string url() const;
    std::string timestamp() const;
    void set_url(const std::string& url);

private:
    struct FamilyRecord {
        std::string canonical_key;
        std::set<std::string> keys;
    };

    void write_unlocked();
    void insert_unlocked(const PdscTag& tag);
    std::vector<std::string> matching_keys_unlocked(const PdscTag& tag) const;
    // Drops entry `index` of `key` and repairs the family record.
    void erase_unlocked(const std::string& key, size_t index);

    std::filesystem::path file_name_;
    std::string schema_version_;
    std::string vendor_;
    std::string url_;
    std::string timestamp_;

    std::map<std::string, std::vector<PdscTag>> entries_;
    std::map<std::string, FamilyRecord> families_;
    mutable std::mutex mtx_;
};
