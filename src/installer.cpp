#include "installer.hpp"
#include "archive.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <algorithm>

namespace {

std::string pdsc_file_name(const std::string& vendor, const std::string& name) {
    return vendor + "." + name + ".pdsc";
}

std::string versioned_pdsc_file_name(const std::string& vendor, const std::string& name, const std::string& version) {
    return vendor + "." + name + "." + version + ".pdsc";
}

// Entry name without the trailing '/' and its directory depth.
size_t entry_depth(const std::string& name) {
    return static_cast<size_t>(std::count(name.begin(), name.end(), '/'));
}

bool satisfies(const std::string& version, const PackIdentity& identity) {
    const std::string& wanted = identity.version;
    switch (identity.modifier) {
        case VersionModifier::Latest:
        case VersionModifier::Any:
            return true;
        case VersionModifier::Exact:
            return version_matches(version, wanted);
        case VersionModifier::GreaterOrEqual:
            return version_compare(version, wanted) >= 0;
        case VersionModifier::CompatibleMajor:
            return version_major(version) == version_major(wanted) && version_compare(version, wanted) >= 0;
        case VersionModifier::CompatiblePatch:
            return version_major_minor(version) == version_major_minor(wanted) && version_compare(version, wanted) >= 0;
        case VersionModifier::Range:
            return version_compare_range(version, wanted) == 0;
    }
    return false;
}

// Runs one coordinator step, turning std::filesystem failures into FileSystem errors.
template <typename Fn>
void with_filesystem_errors(Fn&& fn) {
    try {
        fn();
    } catch (const fs::filesystem_error& e) {
        throw PackgetException(ErrorKind::FileSystem,
            string_format("error.filesystem_failed", e.path1().string(), e.code().message()));
    }
}

bool is_extracted(const PdscTag& tag) {
    return fs::exists(pack_install_dir(tag.vendor, tag.name, version_strip_meta(tag.version)));
}

PackIdentity identity_for_tag(const PdscTag& tag) {
    PackIdentity id;
    id.vendor = tag.vendor;
    id.name = tag.name;
    id.version = version_strip_meta(tag.version);
    id.extension = "pack";
    id.modifier = VersionModifier::Exact;
    const std::string url = tag.pack_url();
    size_t slash = url.find_last_of('/');
    id.location = url.substr(0, slash + 1);
    id.file_name = url.substr(slash + 1);
    return id;
}

} // anonymous namespace

fs::path pack_install_dir(const std::string& vendor, const std::string& name, const std::string& version) {
    return PACK_ROOT / vendor / name / version;
}

// --- InstallationTask ---

InstallationTask::InstallationTask(PackIdentity identity, const CancellationToken& token)
    : identity_(std::move(identity)), token_(token) {
    source_ = identity_.source();
    is_local_ = !identity_.is_remote();
    destination_ = pack_install_dir(identity_.vendor, identity_.name, identity_.version);
}

PdscTag InstallationTask::tag() const {
    PdscTag t;
    t.vendor = identity_.vendor;
    t.name = identity_.name;
    t.version = identity_.version;
    t.url = identity_.location;
    return t;
}

void InstallationTask::prepare(const PackFetcher& fetcher, const VerificationOptions& verification) {
    fetch(fetcher);
    token_.cancellation_point();

    locate_descriptor();

    const std::string latest = pdsc_->latest_version();
    if (latest.empty() || version_compare(latest, identity_.version) != 0) {
        throw PackgetException(ErrorKind::ExtractionFailed,
            string_format("error.pack_version_mismatch", identity_.file_name, identity_.version, latest));
    }

    if (!verification.empty()) {
        log_info(string_format("info.verifying_pack", identity_.file_name));
        verify_pack(archive_path_, verification);
    }

    log_info(string_format("info.extracting_pack", identity_.file_name, destination_.string()));
    ExtractOptions extract_options;
    extract_options.strip_prefix = subfolder_;
    extract_archive(archive_path_, destination_, token_, extract_options);
}

void InstallationTask::fetch(const PackFetcher& fetcher) {
    if (is_local_) {
        archive_path_ = identity_.local_path();
        if (!fs::exists(archive_path_)) {
            throw PackgetException(ErrorKind::FetchFailed, string_format("error.file_not_found", archive_path_.string()));
        }
        log_debug(string_format("debug.using_local_pack", archive_path_.string()));
        return;
    }
    archive_path_ = fetcher(source_, DOWNLOAD_DIR, token_);
}

void InstallationTask::locate_descriptor() {
    const std::string expected = pdsc_file_name(identity_.vendor, identity_.name);
    std::string found;
    for (const auto& entry : list_archive_entries(archive_path_)) {
        if (entry.ends_with('/') || entry_depth(entry) > 1) continue;
        const std::string base = entry.substr(entry.find_last_of('/') + 1);
        if (base == expected) {
            found = entry;
            break;
        }
    }
    if (found.empty()) {
        throw PackgetException(ErrorKind::ExtractionFailed,
            string_format("error.pdsc_missing_in_pack", archive_path_.filename().string(), expected));
    }
    subfolder_ = found.substr(0, found.size() - expected.size());
    log_debug(string_format("debug.pdsc_located", found));

    pdsc_ = PdscFile::parse(extract_file_from_archive(archive_path_, found), archive_path_.filename().string() + "/" + found);
    if (pdsc_->vendor() != identity_.vendor || pdsc_->name() != identity_.name) {
        throw PackgetException(ErrorKind::ExtractionFailed,
            string_format("error.pdsc_identity_mismatch", found, pdsc_->vendor(), pdsc_->name()));
    }
}

void InstallationTask::commit(PackageIndex& index) {
    token_.cancellation_point();

    const fs::path installed_pdsc = destination_ / pdsc_file_name(identity_.vendor, identity_.name);
    ensure_dir_exists(DOWNLOAD_DIR);
    copy_file_atomic(installed_pdsc, DOWNLOAD_DIR / versioned_pdsc_file_name(identity_.vendor, identity_.name, identity_.version));
    if (is_local_) {
        copy_file_atomic(installed_pdsc, LOCAL_DIR / pdsc_file_name(identity_.vendor, identity_.name));
        const fs::path cached_pack = DOWNLOAD_DIR / identity_.file_name;
        if (fs::absolute(archive_path_).lexically_normal() != cached_pack.lexically_normal()) {
            copy_file_atomic(archive_path_, cached_pack);
        }
    }

    // Packs resolved from the public catalog are already listed there.
    if (index.find_pdsc_tags(tag()).empty()) {
        index.add_pdsc(tag());
    }

    for (const auto& req : pdsc_->requirements()) {
        log_info(string_format("info.pack_requirement", format_pack_requirement(req.name, req.vendor, req.range)));
    }
    log_info(string_format("info.pack_installed", identity_.vendor + "::" + identity_.name + "@" + identity_.version));
}

// --- InstallationCoordinator ---

InstallationCoordinator::InstallationCoordinator(PackageIndex& web_index, PackageIndex& local_index,
                                                 const CancellationToken& token, PackFetcher fetcher)
    : web_index_(web_index), local_index_(local_index), token_(token), fetcher_(std::move(fetcher)) {}

void InstallationCoordinator::install(const std::string& reference, const InstallOptions& options) {
    with_filesystem_errors([&] { install_reference(reference, options); });
}

void InstallationCoordinator::install_reference(const std::string& reference, const InstallOptions& options) {
    PackIdentity identity = parse_pack_identity(reference);
    token_.cancellation_point();

    if (identity.is_pdsc()) {
        install_pdsc(identity);
        return;
    }

    if (identity.is_pack_id) {
        const PdscTag resolved = resolve_pack_id(identity);
        if (is_extracted(resolved)) {
            throw PackgetException(ErrorKind::EntryExists, string_format("error.pack_already_installed", resolved.pack_id()));
        }
        install_pack(identity_for_tag(resolved), web_index_, options);
        return;
    }

    PackageIndex& index = identity.is_remote() ? web_index_ : local_index_;
    PdscTag candidate;
    candidate.vendor = identity.vendor;
    candidate.name = identity.name;
    candidate.version = identity.version;
    candidate.url = identity.location;
    // Matched by exact key whatever the URL. The web index doubles as the public
    // catalog, so a listed remote pack counts only once extracted.
    const bool listed = !index.find_pdsc_tags(candidate).empty();
    if (listed && (!identity.is_remote() || is_extracted(candidate))) {
        throw PackgetException(ErrorKind::EntryExists, string_format("error.pack_already_installed", candidate.pack_id()));
    }
    install_pack(identity, index, options);
}

void InstallationCoordinator::install_pack(const PackIdentity& identity, PackageIndex& index, const InstallOptions& options) {
    log_info(string_format("info.installing_pack", identity.source()));
    InstallationTask task(identity, token_);
    task.prepare(fetcher_, options.verification);
    task.commit(index);
}

void InstallationCoordinator::install_pdsc(const PackIdentity& identity) {
    const fs::path path = identity.local_path();
    if (path.empty() || !fs::exists(path)) {
        throw PackgetException(ErrorKind::FetchFailed, string_format("error.file_not_found", identity.source()));
    }
    const PdscFile pdsc = PdscFile::read(path);
    if (pdsc.vendor() != identity.vendor || pdsc.name() != identity.name) {
        throw PackgetException(ErrorKind::ExtractionFailed,
            string_format("error.pdsc_identity_mismatch", path.string(), pdsc.vendor(), pdsc.name()));
    }
    if (pdsc.latest_version().empty()) {
        throw PackgetException(ErrorKind::ExtractionFailed, string_format("error.pdsc_no_release", path.string()));
    }

    PdscTag tag;
    tag.vendor = identity.vendor;
    tag.name = identity.name;
    tag.version = pdsc.latest_version();
    tag.url = identity.location;

    PdscTag family;
    family.vendor = tag.vendor;
    family.name = tag.name;
    const auto existing = local_index_.find_pdsc_tags(family);
    auto same_location = std::find_if(existing.begin(), existing.end(), [&](const PdscTag& t) { return t.url == tag.url; });

    if (same_location == existing.end()) {
        local_index_.add_pdsc(tag);
        log_info(string_format("info.pdsc_registered", tag.key(), tag.url));
        return;
    }
    if (same_location->version == tag.version) {
        log_info(string_format("info.pdsc_already_registered", tag.key(), tag.url));
        return;
    }

    const auto canonical = local_index_.find_canonical_pdsc_tag(family);
    if (canonical && canonical->url == tag.url) {
        local_index_.replace_pdsc_version(tag);
    } else {
        local_index_.remove_pdsc(*same_location);
        local_index_.add_pdsc(tag);
    }
    log_info(string_format("info.pdsc_version_updated", tag.vname(), same_location->version, tag.version));
}

void InstallationCoordinator::update(const std::string& reference, const InstallOptions& options) {
    with_filesystem_errors([&] { update_reference(reference, options); });
}

void InstallationCoordinator::update_reference(const std::string& reference, const InstallOptions& options) {
    PackIdentity identity = parse_pack_identity(reference);
    if (!identity.is_pack_id || (identity.modifier != VersionModifier::Any && identity.modifier != VersionModifier::Latest)) {
        throw PackgetException(ErrorKind::BadIdentifier, string_format("error.update_needs_pack_id", reference));
    }
    token_.cancellation_point();

    PdscTag family;
    family.vendor = identity.vendor;
    family.name = identity.name;
    const auto published = web_index_.find_pdsc_tags(family);
    if (std::none_of(published.begin(), published.end(), is_extracted)) {
        throw PackgetException(ErrorKind::EntryNotFound, string_format("error.pack_not_installed", reference));
    }

    identity.version.clear();
    identity.modifier = VersionModifier::Latest;
    const PdscTag latest = resolve_pack_id(identity);
    if (is_extracted(latest)) {
        log_info(string_format("info.pack_up_to_date", latest.pack_id()));
        return;
    }
    log_info(string_format("info.updating_pack", family.vname(), latest.version));
    install_pack(identity_for_tag(latest), web_index_, options);
}

PdscTag InstallationCoordinator::resolve_pack_id(const PackIdentity& identity) const {
    PdscTag family;
    family.vendor = identity.vendor;
    family.name = identity.name;
    const auto available = web_index_.find_pdsc_tags(family);
    if (available.empty()) {
        throw PackgetException(ErrorKind::EntryNotFound, string_format("error.pack_not_in_index", family.vname(), web_index_.file_name().string()));
    }

    // find_pdsc_tags() returns the highest version first.
    for (const auto& candidate : available) {
        if (satisfies(candidate.version, identity)) {
            log_debug(string_format("debug.pack_id_resolved", family.vname(), version_modifier_name(identity.modifier), candidate.version));
            return candidate;
        }
    }

    // No indexed version qualifies: fall back to the lower bound the request names.
    PdscTag fallback = web_index_.find_canonical_pdsc_tag(family).value_or(available.front());
    switch (identity.modifier) {
        case VersionModifier::Exact:
        case VersionModifier::CompatibleMajor:
        case VersionModifier::CompatiblePatch:
            fallback.version = identity.version;
            break;
        case VersionModifier::Range:
            fallback.version = identity.version.substr(0, identity.version.find(':'));
            break;
        default:
            throw PackgetException(ErrorKind::EntryNotFound,
                string_format("error.pack_version_not_found", family.vname(), format_version_range(identity.version)));
    }
    log_debug(string_format("debug.pack_id_fallback", family.vname(), fallback.version));
    return fallback;
}

void InstallationCoordinator::remove(const std::string& reference, bool purge) {
    with_filesystem_errors([&] { remove_reference(reference, purge); });
}

void InstallationCoordinator::remove_reference(const std::string& reference, bool purge) {
    PackIdentity identity = parse_pack_identity(reference);

    PdscTag tag;
    tag.vendor = identity.vendor;
    tag.name = identity.name;

    if (identity.is_pdsc()) {
        tag.url = identity.location;
        local_index_.remove_pdsc(tag);
        log_info(string_format("info.pdsc_unregistered", tag.vname(), tag.url));
        return;
    }

    if (!identity.version.empty()) {
        if (identity.modifier != VersionModifier::Exact) {
            throw PackgetException(ErrorKind::BadIdentifier, string_format("error.remove_needs_exact_version", reference));
        }
        tag.version = identity.version;
    }

    if (!identity.is_remote()) {
        PdscTag family = tag;
        family.version.clear();
        if (!local_index_.find_pdsc_tags(family).empty()) {
            const auto removed = local_index_.find_pdsc_tags(tag);
            local_index_.remove_pdsc(tag);
            log_info(string_format("info.pack_removed", tag.version.empty() ? tag.vname() : tag.key(), local_index_.file_name().string()));
            if (purge) {
                for (const auto& t : removed) {
                    remove_extracted(t);
                    purge_downloads(t);
                }
            }
            return;
        }
    }

    // Public catalog rows stay; uninstalling a public pack removes its extracted versions.
    std::vector<PdscTag> installed;
    for (const auto& t : web_index_.find_pdsc_tags(tag)) {
        if (is_extracted(t)) installed.push_back(t);
    }
    if (installed.empty()) {
        throw PackgetException(ErrorKind::EntryNotFound, string_format("error.pack_not_installed", reference));
    }
    for (const auto& t : installed) {
        remove_extracted(t);
        if (purge) {
            purge_downloads(t);
        }
        log_info(string_format("info.pack_removed", t.key(), PACK_ROOT.string()));
    }
}

void InstallationCoordinator::remove_extracted(const PdscTag& tag) const {
    const fs::path dir = pack_install_dir(tag.vendor, tag.name, version_strip_meta(tag.version));
    std::error_code ec;
    if (fs::exists(dir)) {
        fs::remove_all(dir, ec);
        if (ec) {
            throw PackgetException(ErrorKind::FileSystem, string_format("error.remove_failed", dir.string(), ec.message()));
        }
        log_info(string_format("info.purged_dir", dir.string()));
    }
    remove_empty_parents(dir.parent_path(), PACK_ROOT);
}

void InstallationCoordinator::purge_downloads(const PdscTag& tag) const {
    std::error_code ec;
    const std::string stem = tag.vendor + "." + tag.name + "." + version_strip_meta(tag.version);
    for (const char* ext : {".pack", ".zip", ".pdsc"}) {
        const fs::path cached = DOWNLOAD_DIR / (stem + ext);
        if (fs::exists(cached) && !fs::remove(cached, ec)) {
            throw PackgetException(ErrorKind::FileSystem, string_format("error.remove_failed", cached.string(), ec.message()));
        }
    }
}
