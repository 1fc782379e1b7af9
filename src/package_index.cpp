#include "package_index.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"
#include "xml_utils.hpp"

#include <algorithm>
#include <chrono>

namespace fs = std::filesystem;

namespace {
    constexpr auto MAX_INDEX_AGE = std::chrono::hours(24);

    bool version_greater(const PdscTag& a, const PdscTag& b) {
        int c = version_compare(a.version, b.version);
        return c != 0 ? c > 0 : a.version > b.version;
    }
}

PackageIndex::PackageIndex(fs::path file_name)
    : file_name_(std::move(file_name)), schema_version_(PIDX_SCHEMA_VERSION) {}

void PackageIndex::read() {
    std::lock_guard<std::mutex> lock(mtx_);
    log_debug(string_format("debug.index_reading", file_name_.string()));

    entries_.clear();
    families_.clear();

    if (!fs::exists(file_name_)) {
        log_debug(string_format("debug.index_creating", file_name_.string()));
        schema_version_ = PIDX_SCHEMA_VERSION;
        vendor_ = file_name_.stem().string();
        write_unlocked();
        return;
    }

    XmlDocument doc = xml_read_file(file_name_, ErrorKind::IndexCorrupt);
    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (xml_node_name(root) != "index") {
        throw PackgetException(ErrorKind::IndexCorrupt, string_format("error.index_bad_root", file_name_.string(), xml_node_name(root)));
    }

    schema_version_ = xml_property(root, "schemaVersion").value_or("");
    vendor_ = xml_field(root, "vendor");
    url_ = xml_field(root, "url");
    timestamp_ = xml_field(root, "timestamp");

    if (const xmlNode* pindex = xml_child(root, "pindex")) {
        for (const xmlNode* node : xml_children(pindex, "pdsc")) {
            PdscTag tag;
            tag.vendor = xml_property(node, "vendor").value_or("");
            tag.name = xml_property(node, "name").value_or("");
            tag.version = xml_property(node, "version").value_or("");
            tag.url = xml_property(node, "url").value_or("");
            tag.deprecated = xml_property(node, "deprecated").value_or("");
            tag.replacement = xml_property(node, "replacement").value_or("");
            if (tag.vendor.empty() || tag.name.empty()) {
                throw PackgetException(ErrorKind::IndexCorrupt, string_format("error.index_bad_entry", file_name_.string(), node->line));
            }
            insert_unlocked(tag);
        }
    }
    log_debug(string_format("debug.index_loaded", file_name_.string(), entries_.size()));
}

void PackageIndex::write() {
    std::lock_guard<std::mutex> lock(mtx_);
    write_unlocked();
}

void PackageIndex::write_unlocked() {
    log_debug(string_format("debug.index_writing", file_name_.string()));
    timestamp_ = format_timestamp(std::chrono::system_clock::now());

    XmlDocument doc(xmlNewDoc(reinterpret_cast<const xmlChar*>("1.0")));
    xmlNode* root = xmlNewNode(nullptr, reinterpret_cast<const xmlChar*>("index"));
    xmlDocSetRootElement(doc.get(), root);
    xml_set_property(root, "schemaVersion", schema_version_);
    xml_add_child(root, "vendor", vendor_);
    xml_add_child(root, "url", url_);
    xml_add_child(root, "timestamp", timestamp_);

    xmlNode* pindex = xml_add_child(root, "pindex");
    for (const auto& [key, tags] : entries_) {
        for (const auto& tag : tags) {
            xmlNode* node = xml_add_child(pindex, "pdsc");
            xml_set_property(node, "vendor", tag.vendor);
            xml_set_property(node, "name", tag.name);
            xml_set_property(node, "version", tag.version);
            xml_set_property(node, "url", tag.url);
            if (!tag.deprecated.empty()) xml_set_property(node, "deprecated", tag.deprecated);
            if (!tag.replacement.empty()) xml_set_property(node, "replacement", tag.replacement);
        }
    }

    xml_write_file(doc.get(), file_name_);
}

void PackageIndex::check_time() const {
    std::lock_guard<std::mutex> lock(mtx_);
    log_debug(string_format("debug.index_check_time", file_name_.string()));

    if (!fs::exists(file_name_)) {
        return;
    }

    XmlDocument doc = xml_read_file(file_name_, ErrorKind::IndexCorrupt);
    const std::string stamp = xml_field(xmlDocGetRootElement(doc.get()), "timestamp");
    if (stamp.empty()) {
        throw PackgetException(ErrorKind::StaleIndex, string_format("error.index_no_timestamp", file_name_.string()));
    }
    auto written = parse_timestamp(stamp);
    if (!written) {
        throw PackgetException(ErrorKind::IndexCorrupt, string_format("error.index_bad_timestamp", file_name_.string(), stamp));
    }
    if (std::chrono::system_clock::now() - *written > MAX_INDEX_AGE) {
        throw PackgetException(ErrorKind::StaleIndex, string_format("error.index_too_old", file_name_.string(), stamp));
    }
}

void PackageIndex::add_pdsc(const PdscTag& tag) {
    std::lock_guard<std::mutex> lock(mtx_);
    log_debug(string_format("debug.index_add", tag.key(), tag.url, file_name_.string()));
    if (entries_.contains(tag.key())) {
        throw PackgetException(ErrorKind::EntryExists, string_format("error.pdsc_entry_exists", tag.key(), file_name_.string()));
    }
    insert_unlocked(tag);
}

void PackageIndex::replace_pdsc_version(const PdscTag& tag) {
    std::lock_guard<std::mutex> lock(mtx_);
    log_debug(string_format("debug.index_replace", tag.vname(), tag.version, file_name_.string()));

    auto family = families_.find(tag.family_key());
    if (family == families_.end()) {
        throw PackgetException(ErrorKind::EntryNotFound, string_format("error.pdsc_entry_not_found", tag.vname(), file_name_.string()));
    }

    const std::string old_key = family->second.canonical_key;
    PdscTag moved = entries_.at(old_key).front();
    moved.version = tag.version;
    if (!tag.url.empty()) {
        moved.url = tag.url;
    }

    erase_unlocked(old_key, 0);

    auto& existing = entries_[moved.key()];
    auto same_url = std::find_if(existing.begin(), existing.end(), [&](const PdscTag& t) { return t.url == moved.url; });
    if (same_url == existing.end()) {
        existing.push_back(moved);
    }
    auto& record = families_[moved.family_key()];
    record.keys.insert(moved.key());
    record.canonical_key = moved.key();
}

void PackageIndex::remove_pdsc(const PdscTag& tag) {
    std::lock_guard<std::mutex> lock(mtx_);
    log_debug(string_format("debug.index_remove", tag.key(), tag.url, file_name_.string()));

    std::vector<std::string> keys;
    if (!tag.version.empty()) {
        keys = matching_keys_unlocked(tag);
    } else if (auto family = families_.find(tag.family_key()); family != families_.end()) {
        keys.assign(family->second.keys.begin(), family->second.keys.end());
    }

    size_t removed = 0;
    for (const auto& key : keys) {
        auto it = entries_.find(key);
        if (it == entries_.end()) continue;
        // Walk backwards so indices stay valid while erasing.
        for (size_t i = it->second.size(); i-- > 0;) {
            if (!tag.url.empty() && it->second[i].url != tag.url) continue;
            erase_unlocked(key, i);
            ++removed;
            if (!entries_.contains(key)) break;
        }
    }

    if (removed == 0) {
        throw PackgetException(ErrorKind::EntryNotFound, string_format("error.pdsc_entry_not_found",
            tag.version.empty() ? tag.vname() : tag.key(), file_name_.string()));
    }
}

int PackageIndex::has_pdsc(const PdscTag& tag) const {
    std::lock_guard<std::mutex> lock(mtx_);
    int index = PDSC_INDEX_NOT_FOUND;
    if (auto it = entries_.find(tag.key()); it != entries_.end()) {
        for (size_t i = 0; i < it->second.size(); ++i) {
            if (it->second[i].url == tag.url) {
                index = static_cast<int>(i);
                break;
            }
        }
    }
    log_debug(string_format("debug.index_has", file_name_.string(), tag.key(), tag.url, index));
    return index;
}

std::vector<PdscTag> PackageIndex::find_pdsc_tags(const PdscTag& tag) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<PdscTag> found;

    std::vector<std::string> keys;
    if (!tag.version.empty()) {
        keys = matching_keys_unlocked(tag);
    } else if (auto family = families_.find(tag.family_key()); family != families_.end()) {
        keys.assign(family->second.keys.begin(), family->second.keys.end());
    }

    for (const auto& key : keys) {
        const auto& tags = entries_.at(key);
        found.insert(found.end(), tags.begin(), tags.end());
    }
    std::stable_sort(found.begin(), found.end(), version_greater);

    log_debug(string_format("debug.index_found", file_name_.string(), found.size(), tag.version.empty() ? tag.vname() : tag.key()));
    return found;
}

std::optional<PdscTag> PackageIndex::find_canonical_pdsc_tag(const PdscTag& tag) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto family = families_.find(tag.family_key());
    if (family == families_.end()) {
        return std::nullopt;
    }
    return entries_.at(family->second.canonical_key).front();
}

std::vector<PdscTag> PackageIndex::list_pdsc_tags() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<PdscTag> tags;
    for (const auto& [key, list] : entries_) {
        tags.insert(tags.end(), list.begin(), list.end());
    }
    return tags;
}

bool PackageIndex::empty() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.empty();
}

std::string PackageIndex::schema_version() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return schema_version_;
}

std::string PackageIndex::vendor() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return vendor_;
}

std::string PackageIndex::url() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return url_;
}

std::string PackageIndex::timestamp() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return timestamp_;
}

void PackageIndex::set_url(const std::string& url) {
    std::lock_guard<std::mutex> lock(mtx_);
    url_ = url;
}

void PackageIndex::insert_unlocked(const PdscTag& tag) {
    const std::string key = tag.key();
    entries_[key].push_back(tag);
    auto& record = families_[tag.family_key()];
    record.keys.insert(key);
    record.canonical_key = key;
}

std::vector<std::string> PackageIndex::matching_keys_unlocked(const PdscTag& tag) const {
    if (entries_.contains(tag.key())) {
        return {tag.key()};
    }
    std::vector<std::string> keys;
    auto family = families_.find(tag.family_key());
    if (family == families_.end()) {
        return keys;
    }
    for (const auto& key : family->second.keys) {
        if (version_matches(entries_.at(key).front().version, tag.version)) {
            keys.push_back(key);
        }
    }
    return keys;
}

void PackageIndex::erase_unlocked(const std::string& key, size_t index) {
    auto it = entries_.find(key);
    if (it == entries_.end() || index >= it->second.size()) {
        return;
    }
    const std::string family_key = it->second[index].family_key();
    it->second.erase(it->second.begin() + static_cast<std::ptrdiff_t>(index));
    if (!it->second.empty()) {
        return;
    }
    entries_.erase(it);

    auto family = families_.find(family_key);
    if (family == families_.end()) {
        return;
    }
    family->second.keys.erase(key);
    if (family->second.keys.empty()) {
        families_.erase(family);
        return;
    }
    if (family->second.canonical_key == key) {
        auto best = std::max_element(family->second.keys.begin(), family->second.keys.end(),
            [this](const std::string& a, const std::string& b) {
                return version_greater(entries_.at(b).front(), entries_.at(a).front());
            });
        family->second.canonical_key = *best;
    }
}
