#include "pack_identity.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <regex>

namespace fs = std::filesystem;

namespace {

const std::string NAME_PATTERN = R"([\-_A-Za-z0-9]+)";
const std::string VERSION_PATTERN =
    R"((?:\d+)\.(?:\d+)\.(?:\d+)(?:-(?:(?:\d+|\d*[a-zA-Z-][0-9a-zA-Z-]*)(?:\.(?:\d+|\d*[a-zA-Z-][0-9a-zA-Z-]*))*))?(?:\+(?:[0-9a-zA-Z-]+(?:\.[0-9a-zA-Z-]+)*))?)";

const std::regex& name_regex() {
    static const std::regex re("^" + NAME_PATTERN + "$");
    return re;
}

// Vendor.Name.version.pack, Vendor.Name.version.zip or Vendor.Name.pdsc
const std::regex& file_name_regex() {
    static const std::regex re("^(" + NAME_PATTERN + R"()\.()" + NAME_PATTERN + R"()\.(?:()" + VERSION_PATTERN +
                               R"()\.(pack|zip)|(pdsc))$)");
    return re;
}

const std::regex& dotted_id_regex() {
    static const std::regex re("^(" + NAME_PATTERN + R"()\.()" + NAME_PATTERN + R"()(?:\.()" + VERSION_PATTERN + "))?$");
    return re;
}

const std::regex& legacy_id_regex() {
    static const std::regex re("^(" + NAME_PATTERN + ")::(" + NAME_PATTERN + R"()(?:(@\^|@~|@>=|>=|@)()" +
                               VERSION_PATTERN + "|latest))?$");
    return re;
}

[[noreturn]] void bad_identifier(const std::string& reference) {
    throw PackgetException(ErrorKind::BadIdentifier, string_format("error.bad_pack_name", reference));
}

std::string strip_url_suffixes(std::string reference) {
    size_t cut = reference.find_first_of("?#");
    if (cut != std::string::npos) {
        reference.resize(cut);
    }
    return reference;
}

std::string normalize_location(std::string location) {
    for (auto& c : location) {
        if (c == '\\') c = '/';
    }
    if (is_url(location) || location.starts_with("file://")) {
        return location;
    }

    fs::path dir = location.empty() ? fs::current_path() : fs::path(location);
    if (dir.is_relative()) {
        dir = fs::current_path() / dir;
    }
    std::string abs = dir.lexically_normal().generic_string();
    if (!abs.ends_with("/")) {
        abs += "/";
    }
    return "file://localhost" + abs;
}

VersionModifier modifier_from_operator(const std::string& op) {
    if (op == "@^") return VersionModifier::CompatibleMajor;
    if (op == "@~") return VersionModifier::CompatiblePatch;
    if (op == "@>=" || op == ">=") return VersionModifier::GreaterOrEqual;
    return VersionModifier::Exact;
}

} // anonymous namespace

const char* version_modifier_name(VersionModifier modifier) {
    switch (modifier) {
        case VersionModifier::Exact: return "exact";
        case VersionModifier::Latest: return "latest";
        case VersionModifier::Any: return "any";
        case VersionModifier::GreaterOrEqual: return ">=";
        case VersionModifier::CompatibleMajor: return "^";
        case VersionModifier::CompatiblePatch: return "~";
        case VersionModifier::Range: return "range";
    }
    return "unknown";
}

std::string PackIdentity::family_key() const {
    return to_lower(vendor + "." + name);
}

bool PackIdentity::is_remote() const {
    return is_url(location);
}

std::string PackIdentity::source() const {
    return location + file_name;
}

fs::path PackIdentity::local_path() const {
    if (is_pack_id || is_remote()) {
        return {};
    }
    return location_to_path(location) / file_name;
}

PackIdentity parse_pack_identity(const std::string& reference) {
    log_debug(string_format("debug.parsing_reference", reference));

    std::string path = reference;
    std::string max_version;

    if (is_url(path)) {
        path = strip_url_suffixes(path);
    } else {
        static const std::regex range_suffix(R"(([\-_A-Za-z0-9]+\.){4}[\-_A-Za-z0-9]+:)");
        if (std::regex_search(path, range_suffix)) {
            size_t colon = path.find(':');
            max_version = path.substr(colon + 1);
            path = path.substr(0, colon);
            if (!is_version_valid(max_version)) {
                bad_identifier(reference);
            }
        }
    }

    static const std::regex latest_suffix(R"(([\-_A-Za-z0-9]+\.){2}latest$)");
    if (std::regex_search(path, latest_suffix)) {
        path.resize(path.size() - std::string(".latest").size());
    }

    std::string location;
    std::string file_name = path;
    size_t sep = path.find_last_of("/\\");
    if (sep != std::string::npos) {
        location = path.substr(0, sep + 1);
        file_name = path.substr(sep + 1);
    }

    PackIdentity id;
    std::smatch m;
    if (std::regex_match(file_name, m, file_name_regex())) {
        if (!max_version.empty()) {
            bad_identifier(reference);
        }
        id.vendor = m[1].str();
        id.name = m[2].str();
        if (m[5].matched) {
            id.extension = "pdsc";
        } else {
            id.version = m[3].str();
            id.extension = m[4].str();
            id.modifier = VersionModifier::Exact;
        }
        id.file_name = file_name;
        id.location = normalize_location(location);
        log_debug(string_format("debug.parsed_file_reference", reference, id.vendor, id.name, id.version, id.extension, id.location));
        return id;
    }

    // Pack IDs never carry a location.
    if (!location.empty()) {
        bad_identifier(reference);
    }

    id.is_pack_id = true;
    if (std::regex_match(file_name, m, dotted_id_regex())) {
        id.vendor = m[1].str();
        id.name = m[2].str();
        if (m[3].matched) {
            id.version = m[3].str();
            id.modifier = VersionModifier::Exact;
            if (!max_version.empty()) {
                id.version += ":" + max_version;
                id.modifier = VersionModifier::Range;
            }
        } else if (!max_version.empty()) {
            bad_identifier(reference);
        }
    } else if (max_version.empty() && std::regex_match(file_name, m, legacy_id_regex())) {
        id.vendor = m[1].str();
        id.name = m[2].str();
        if (m[3].matched) {
            id.version = m[4].str();
            id.modifier = (id.version == "latest") ? VersionModifier::Latest : modifier_from_operator(m[3].str());
        }
    } else {
        bad_identifier(reference);
    }

    log_debug(string_format("debug.parsed_pack_id", reference, id.vendor, id.name,
                            format_version_range(id.version), version_modifier_name(id.modifier)));
    return id;
}

bool is_pack_name_valid(const std::string& name) {
    return std::regex_match(name, name_regex());
}

fs::path location_to_path(const std::string& location) {
    std::string p = location;
    if (p.starts_with("file://localhost")) {
        p = p.substr(std::string("file://localhost").size());
    } else if (p.starts_with("file://")) {
        p = p.substr(std::string("file://").size());
    }
    return fs::path(p);
}

std::string format_pack_requirement(const std::string& name, const std::string& vendor, const std::string& range) {
    const std::string prefix = vendor + "::" + name + "@";
    if (range.empty() || range == "latest") {
        return prefix + "latest";
    }
    size_t colon = range.find(':');
    if (colon == std::string::npos) {
        return prefix + ">=" + range;
    }
    std::string low = range.substr(0, colon);
    std::string high = range.substr(colon + 1);
    if (high == "_") {
        return prefix + ">=" + low;
    }
    if (low == high) {
        return prefix + low;
    }
    return prefix + low + ":" + high;
}
