#pragma once

#include <filesystem>
#include <string>
#include <vector>

// One index record: a vendor/name/version triple and where it was published.
struct PdscTag {
    std::string vendor;
    std::string name;
    std::string version;
    std::string url;
    std::string deprecated;
    std::string replacement;

    // "Vendor.Name.Version"
    std::string key() const;
    // lowercase "vendor.name"
    std::string family_key() const;
    // "Vendor.Name"
    std::string vname() const;
    // "Vendor::Name@Version"
    std::string pack_id() const;
    std::string pack_url() const;

    bool operator==(const PdscTag&) const = default;
};

struct PdscRelease {
    std::string version;
    std::string date;
    std::string url;
};

struct PackRequirement {
    std::string name;
    std::string vendor;
    std::string range;  // "latest", "min:_" or "min:max"
};

// Package descriptor (Vendor.Name.pdsc).
class PdscFile {
public:
    // Throws ExtractionFailed if the file is missing or malformed.
    static PdscFile read(const std::filesystem::path& path);
    static PdscFile parse(const std::string& content, const std::string& origin);

    const std::string& vendor() const { return vendor_; }
    const std::string& name() const { return name_; }
    const std::string& url() const { return url_; }
    const std::string& license() const { return license_; }
    const std::vector<PdscRelease>& releases() const { return releases_; }

    // The first listed release, or empty.
    std::string latest_version() const;
    // Release matching `version` (empty selects the latest), or nullptr.
    const PdscRelease* find_release(const std::string& version) const;
    std::string pack_url(const std::string& version = "") const;
    std::vector<PackRequirement> requirements() const;
    PdscTag tag() const;

private:
    std::string vendor_;
    std::string name_;
    std::string url_;
    std::string license_;
    std::vector<PdscRelease> releases_;
    std::vector<PackRequirement> requirements_;
};
