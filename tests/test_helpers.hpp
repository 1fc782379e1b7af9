#pragma once

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct ZipEntry {
    std::string name;
    std::string content;
    bool is_dir = false;
};

// Writes a zip archive with libarchive. Entry names are stored verbatim, so
// hostile names like "../evil" can be produced.
inline void write_zip(const fs::path& path, const std::vector<ZipEntry>& entries) {
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    if (archive_write_open_filename(a, path.c_str()) != ARCHIVE_OK) {
        std::string err = archive_error_string(a) ? archive_error_string(a) : "unknown";
        archive_write_free(a);
        throw std::runtime_error("cannot create " + path.string() + ": " + err);
    }
    for (const auto& e : entries) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, e.name.c_str());
        if (e.is_dir) {
            archive_entry_set_filetype(entry, AE_IFDIR);
            archive_entry_set_perm(entry, 0755);
            archive_entry_set_size(entry, 0);
        } else {
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, 0644);
            archive_entry_set_size(entry, static_cast<la_int64_t>(e.content.size()));
        }
        archive_write_header(a, entry);
        if (!e.is_dir && !e.content.empty()) {
            archive_write_data(a, e.content.data(), e.content.size());
        }
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);
}

inline void write_text(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    f << content;
}

// Minimal descriptor; `versions` are listed newest first like real pdsc files.
inline std::string make_pdsc(const std::string& vendor, const std::string& name,
                             const std::vector<std::string>& versions, const std::string& url = "",
                             const std::string& requirements = "") {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                      "<package schemaVersion=\"1.7.7\">\n"
                      "  <vendor>" + vendor + "</vendor>\n"
                      "  <name>" + name + "</name>\n"
                      "  <description>Test pack</description>\n"
                      "  <url>" + url + "</url>\n"
                      "  <license>LICENSE.txt</license>\n"
                      "  <releases>\n";
    for (const auto& v : versions) {
        xml += "    <release version=\"" + v + "\" date=\"2024-01-01\">Release " + v + "</release>\n";
    }
    xml += "  </releases>\n";
    if (!requirements.empty()) {
        xml += "  <requirements>\n    <packages>\n" + requirements + "    </packages>\n  </requirements>\n";
    }
    xml += "</package>\n";
    return xml;
}

// Writes dir/Vendor.Name.Version.pack holding the descriptor (optionally inside
// `subfolder`) and a couple of support files. Returns the pack path.
inline fs::path make_pack(const fs::path& dir, const std::string& vendor, const std::string& name,
                          const std::string& version, const std::string& subfolder = "",
                          const std::string& requirements = "") {
    fs::create_directories(dir);
    const std::string prefix = subfolder.empty() ? "" : subfolder + "/";
    std::vector<ZipEntry> entries;
    if (!subfolder.empty()) {
        entries.push_back({prefix, "", true});
    }
    entries.push_back({prefix + vendor + "." + name + ".pdsc", make_pdsc(vendor, name, {version, "0.0.1"}, "", requirements)});
    entries.push_back({prefix + "Files/", "", true});
    entries.push_back({prefix + "Files/readme.txt", "support file for " + name + "\n"});
    entries.push_back({prefix + "LICENSE.txt", "licensed\n"});

    const fs::path pack = dir / (vendor + "." + name + "." + version + ".pack");
    write_zip(pack, entries);
    return pack;
}

inline std::string make_pidx(const std::string& timestamp, const std::string& pdsc_lines) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<index schemaVersion=\"1.1.0\">\n"
           "  <vendor>TestVendor</vendor>\n"
           "  <url>https://example.com/</url>\n" +
           (timestamp.empty() ? std::string() : "  <timestamp>" + timestamp + "</timestamp>\n") +
           "  <pindex>\n" + pdsc_lines + "  </pindex>\n"
           "</index>\n";
}
