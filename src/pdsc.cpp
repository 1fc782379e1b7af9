#include "pdsc.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"
#include "xml_utils.hpp"

namespace fs = std::filesystem;

std::string PdscTag::key() const {
    return vendor + "." + name + "." + version;
}

std::string PdscTag::family_key() const {
    return to_lower(vname());
}

std::string PdscTag::vname() const {
    return vendor + "." + name;
}

std::string PdscTag::pack_id() const {
    return vendor + "::" + name + "@" + version;
}

std::string PdscTag::pack_url() const {
    std::string base = url;
    if (!base.empty() && base.back() != '/') base += '/';
    return base + vendor + "." + name + "." + version_strip_meta(version) + ".pack";
}

PdscFile PdscFile::read(const fs::path& path) {
    log_debug(string_format("debug.reading_pdsc", path.string()));
    if (!fs::exists(path)) {
        throw PackgetException(ErrorKind::ExtractionFailed, string_format("error.pdsc_not_found", path.string()));
    }

    return parse(read_file(path), path.string());
}

PdscFile PdscFile::parse(const std::string& content, const std::string& origin) {
    XmlDocument doc = xml_read_memory(content, origin, ErrorKind::ExtractionFailed);
    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (xml_node_name(root) != "package") {
        throw PackgetException(ErrorKind::ExtractionFailed, string_format("error.pdsc_bad_root", origin, xml_node_name(root)));
    }

    PdscFile pdsc;
    pdsc.vendor_ = xml_field(root, "vendor");
    pdsc.name_ = xml_field(root, "name");
    pdsc.url_ = xml_field(root, "url");
    pdsc.license_ = xml_field(root, "license");

    if (const xmlNode* releases = xml_child(root, "releases")) {
        for (const xmlNode* release : xml_children(releases, "release")) {
            PdscRelease r;
            r.version = xml_property(release, "version").value_or("");
            r.date = xml_property(release, "Date").value_or(xml_property(release, "date").value_or(""));
            r.url = xml_property(release, "url").value_or("");
            pdsc.releases_.push_back(std::move(r));
        }
    }

    if (const xmlNode* reqs = xml_child(root, "requirements")) {
        for (const xmlNode* packages : xml_children(reqs, "packages")) {
            for (const xmlNode* package : xml_children(packages, "package")) {
                PackRequirement req;
                req.vendor = xml_property(package, "vendor").value_or("");
                req.name = xml_property(package, "name").value_or("");
                req.range = xml_property(package, "version").value_or("");
                if (req.range.empty()) {
                    req.range = "latest";
                } else if (req.range.find(':') == std::string::npos) {
                    req.range += ":_";
                }
                pdsc.requirements_.push_back(std::move(req));
            }
        }
    }

    return pdsc;
}

std::string PdscFile::latest_version() const {
    return releases_.empty() ? "" : releases_.front().version;
}

const PdscRelease* PdscFile::find_release(const std::string& version) const {
    if (releases_.empty()) return nullptr;
    if (version.empty()) return &releases_.front();
    for (const auto& release : releases_) {
        if (version_compare(release.version, version) == 0) {
            return &release;
        }
    }
    return nullptr;
}

std::string PdscFile::pack_url(const std::string& version) const {
    PdscTag t = tag();
    if (!version.empty()) t.version = version;
    return t.pack_url();
}

std::vector<PackRequirement> PdscFile::requirements() const {
    return requirements_;
}

PdscTag PdscFile::tag() const {
    PdscTag t;
    t.vendor = vendor_;
    t.name = name_;
    t.url = url_;
    t.version = latest_version();
    return t;
}
