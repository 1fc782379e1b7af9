#pragma once

#include <filesystem>
#include <string>

enum class VersionModifier {
    Exact,
    Latest,
    Any,
    GreaterOrEqual,
    CompatibleMajor,
    CompatiblePatch,
    Range
};

const char* version_modifier_name(VersionModifier modifier);

// Parsed form of a user supplied pack reference. Built only by parse_pack_identity.
struct PackIdentity {
    std::string vendor;
    std::string name;
    std::string version;    // exact version, "latest", "min:max" range, or empty
    std::string extension;  // "pack", "zip", "pdsc" or empty for pack IDs
    std::string location;   // directory URL ending in '/', empty for pack IDs
    std::string file_name;  // last path component for file references
    bool is_pack_id = false;
    VersionModifier modifier = VersionModifier::Any;

    std::string family_key() const;
    bool is_remote() const;
    bool is_pdsc() const { return extension == "pdsc"; }
    // Full URL or file:// reference of the source file.
    std::string source() const;
    // Local filesystem path of a file reference. Empty for remote ones.
    std::filesystem::path local_path() const;

    bool operator==(const PackIdentity&) const = default;
};

// Accepts:
//   [location/]Vendor.Pack.x.y.z.pack|zip, [location/]Vendor.Pack.pdsc
//   Vendor.Pack[.x.y.z][:max], Vendor.Pack.latest
//   Vendor::Pack[@x.y.z|@^x.y.z|@~x.y.z|@>=x.y.z|>=x.y.z|@latest]
// Throws PackgetException(BadIdentifier) on anything else.
PackIdentity parse_pack_identity(const std::string& reference);

bool is_pack_name_valid(const std::string& name);

// Converts "file://localhost/abs/dir/" (or "file:///abs/dir/") to a path.
std::filesystem::path location_to_path(const std::string& location);

// (name, vendor, "x:_") -> "Vendor::Name@>=x"; "x:x" -> "@x"; "a:b" -> "@a:b"; "latest" -> "@latest".
std::string format_pack_requirement(const std::string& name, const std::string& vendor, const std::string& range);
