#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <string_view>
#include <vector>

namespace {

struct ParsedVersion {
    std::string major;
    std::string minor;
    std::string patch;
    std::vector<std::string> prerelease;
    std::string short_form;
};

bool is_numeric(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool is_ident(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isalnum(c) || c == '-'; });
}

std::string strip_leading_zeros(const std::string& version) {
    static const std::regex zeros(R"(\.0*(\d+))");
    std::string out = std::regex_replace(version, zeros, ".$1");
    size_t first = out.find_first_not_of('0');
    out = (first == std::string::npos) ? std::string() : out.substr(first);
    if (out.starts_with(".")) {
        out = "0" + out;
    }
    return out;
}

std::string before_colon(const std::string& v) {
    return v.substr(0, v.find(':'));
}

// Accepts "1", "1.2" and "1.2.3" with optional prerelease and build suffixes.
std::optional<ParsedVersion> parse_version(const std::string& raw) {
    std::string v = strip_leading_zeros(raw);
    v = before_colon(v);

    ParsedVersion p;
    size_t plus = v.find('+');
    if (plus != std::string::npos) {
        std::string build = v.substr(plus + 1);
        v = v.substr(0, plus);
        size_t start = 0;
        while (true) {
            size_t dot = build.find('.', start);
            if (!is_ident(std::string_view(build).substr(start, dot == std::string::npos ? std::string::npos : dot - start))) return std::nullopt;
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
    }

    size_t dash = v.find('-');
    std::string core = v.substr(0, dash);
    if (dash != std::string::npos) {
        std::string pre = v.substr(dash + 1);
        size_t start = 0;
        while (true) {
            size_t dot = pre.find('.', start);
            std::string id = pre.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            if (!is_ident(id)) return std::nullopt;
            if (is_numeric(id) && id.size() > 1 && id[0] == '0') return std::nullopt;
            p.prerelease.push_back(id);
            if (dot == std::string::npos) break;
            start = dot + 1;
        }
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = core.find('.', start);
        parts.push_back(core.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    if (parts.empty() || parts.size() > 3) return std::nullopt;
    for (const auto& part : parts) {
        if (!is_numeric(part)) return std::nullopt;
        if (part.size() > 1 && part[0] == '0') return std::nullopt;
    }
    // Shorthand forms may not carry suffixes.
    if (parts.size() < 3 && (dash != std::string::npos || plus != std::string::npos)) return std::nullopt;

    p.major = parts[0];
    p.minor = parts.size() > 1 ? parts[1] : "0";
    p.patch = parts.size() > 2 ? parts[2] : "0";
    return p;
}

int compare_numeric(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    if (a == b) return 0;
    return a < b ? -1 : 1;
}

int compare_prerelease(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() && b.empty()) return 0;
    if (a.empty()) return 1;
    if (b.empty()) return -1;

    size_t len = std::min(a.size(), b.size());
    for (size_t i = 0; i < len; ++i) {
        const bool num_a = is_numeric(a[i]);
        const bool num_b = is_numeric(b[i]);
        if (num_a && num_b) {
            if (int c = compare_numeric(a[i], b[i]); c != 0) return c;
        } else if (num_a) {
            return -1;
        } else if (num_b) {
            return 1;
        } else if (a[i] != b[i]) {
            return a[i] < b[i] ? -1 : 1;
        }
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

} // anonymous namespace

int version_compare(const std::string& v1, const std::string& v2) {
    auto p1 = parse_version(v1);
    auto p2 = parse_version(v2);
    if (!p1 && !p2) return 0;
    if (!p1) return -1;
    if (!p2) return 1;

    if (int c = compare_numeric(p1->major, p2->major); c != 0) return c;
    if (int c = compare_numeric(p1->minor, p2->minor); c != 0) return c;
    if (int c = compare_numeric(p1->patch, p2->patch); c != 0) return c;
    return compare_prerelease(p1->prerelease, p2->prerelease);
}

int version_compare_range(const std::string& version, const std::string& range) {
    size_t colon = range.find(':');
    std::string low = range.substr(0, colon);
    if (colon != std::string::npos) {
        std::string high = range.substr(colon + 1);
        if (!high.empty() && high != "_" && version_compare(version, high) > 0) {
            return 1;
        }
    }
    if (!low.empty() && version_compare(version, low) < 0) {
        return -1;
    }
    return 0;
}

std::string version_major(const std::string& version) {
    auto p = parse_version(version);
    return p ? p->major : "";
}

std::string version_major_minor(const std::string& version) {
    auto p = parse_version(version);
    return p ? p->major + "." + p->minor : "";
}

bool version_has_meta(const std::string& version) {
    return version.find('+') != std::string::npos;
}

std::string version_strip_meta(const std::string& version) {
    return version.substr(0, version.find('+'));
}

bool is_version_valid(const std::string& version) {
    static const std::regex semver(
        R"(^(?:\d+)\.(?:\d+)\.(?:\d+))"
        R"((?:-(?:(?:\d+|\d*[a-zA-Z-][0-9a-zA-Z-]*)(?:\.(?:\d+|\d*[a-zA-Z-][0-9a-zA-Z-]*))*))?)"
        R"((?:\+(?:[0-9a-zA-Z-]+(?:\.[0-9a-zA-Z-]+)*))?$)");
    return std::regex_match(version, semver);
}

bool version_matches(const std::string& stored, const std::string& requested) {
    if (version_has_meta(requested)) {
        if (!version_has_meta(stored)) return false;
        return version_compare(stored, requested) == 0 &&
               stored.substr(stored.find('+')) == requested.substr(requested.find('+'));
    }
    return version_compare(stored, requested) == 0;
}

std::string format_version_range(const std::string& range) {
    if (range.ends_with(":_")) {
        return ">=" + range.substr(0, range.size() - 2);
    }
    return range;
}
