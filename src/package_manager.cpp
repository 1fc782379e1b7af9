#include "package_manager.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace {

// Per-reference failure: logged, the batch continues.
void report_failure(const std::string& reference, const PackgetException& e) {
    if (e.kind() == ErrorKind::EntryExists) {
        log_warning(string_format("warning.reference_skipped", reference, e.what()));
    } else {
        log_error(string_format("error.reference_failed", reference, error_kind_name(e.kind()), e.what()));
    }
}

bool is_fatal(ErrorKind kind) {
    return kind == ErrorKind::Cancelled || kind == ErrorKind::IndexCorrupt;
}

bool matches_filter(const PdscTag& tag, const std::vector<std::string>& words) {
    const std::string haystack = to_lower(tag.pack_id());
    return std::all_of(words.begin(), words.end(), [&](const std::string& w) {
        return haystack.find(w) != std::string::npos;
    });
}

} // anonymous namespace

PackManager::PackManager(const CancellationToken& token, PackFetcher fetcher)
    : token_(token), fetcher_(std::move(fetcher)) {}

void PackManager::init(const std::string& pack_root) {
    set_pack_root(pack_root);
    init_filesystem();
    log_debug(string_format("debug.pack_root", PACK_ROOT.string()));

    web_index_ = std::make_unique<PackageIndex>(PUBLIC_INDEX_FILE);
    local_index_ = std::make_unique<PackageIndex>(LOCAL_INDEX_FILE);
    web_index_->read();
    local_index_->read();

    coordinator_ = std::make_unique<InstallationCoordinator>(*web_index_, *local_index_, token_, fetcher_);
}

void PackManager::save() {
    if (!web_index_ || !local_index_) {
        throw PackgetException(ErrorKind::Usage, get_string("error.not_initialized"));
    }
    web_index_->write();
    local_index_->write();
    write_file_atomic(PACK_IDX_FILE, "");
    log_debug(get_string("debug.indices_saved"));
}

bool PackManager::run_each(const std::vector<std::string>& references, const std::function<void(const std::string&)>& operation) {
    if (!coordinator_) {
        throw PackgetException(ErrorKind::Usage, get_string("error.not_initialized"));
    }
    bool all_ok = true;
    for (const auto& reference : references) {
        try {
            operation(reference);
        } catch (const PackgetException& e) {
            if (is_fatal(e.kind())) {
                throw;
            }
            report_failure(reference, e);
            all_ok = false;
        }
    }
    return all_ok;
}

bool PackManager::install(const std::vector<std::string>& references, const InstallOptions& options) {
    return run_each(references, [&](const std::string& reference) { coordinator_->install(reference, options); });
}

bool PackManager::uninstall(const std::vector<std::string>& references, bool purge) {
    return run_each(references, [&](const std::string& reference) { coordinator_->remove(reference, purge); });
}

bool PackManager::update(const std::vector<std::string>& references, const InstallOptions& options) {
    std::vector<std::string> targets = references;
    if (targets.empty() && web_index_) {
        std::set<std::string> families;
        for (const auto& tag : web_index_->list_pdsc_tags()) {
            if (fs::exists(pack_install_dir(tag.vendor, tag.name, version_strip_meta(tag.version))) && families.insert(tag.family_key()).second) {
                targets.push_back(tag.vname());
            }
        }
        if (targets.empty()) {
            log_info(get_string("info.nothing_to_update"));
        }
    }
    return run_each(targets, [&](const std::string& reference) { coordinator_->update(reference, options); });
}

std::vector<PdscTag> PackManager::list_installed(const std::string& filter, bool include_public) const {
    std::vector<std::string> words;
    std::istringstream in(to_lower(filter));
    for (std::string w; in >> w;) {
        words.push_back(w);
    }

    std::vector<PdscTag> result;
    for (const auto& tag : local_index_->list_pdsc_tags()) {
        if (matches_filter(tag, words)) result.push_back(tag);
    }
    for (const auto& tag : web_index_->list_pdsc_tags()) {
        if (!include_public && !fs::exists(pack_install_dir(tag.vendor, tag.name, tag.version))) continue;
        if (matches_filter(tag, words)) result.push_back(tag);
    }
    std::sort(result.begin(), result.end(), [](const PdscTag& a, const PdscTag& b) {
        return a.key() < b.key();
    });
    return result;
}

void PackManager::update_public_index(const std::string& source) {
    const fs::path staged = WEB_DIR / (std::string(PUBLIC_INDEX_NAME) + ".new");
    log_info(string_format("info.updating_index", source));

    if (is_url(source)) {
        download_file(source, staged, token_, get_log_level() != LogLevel::QUIET);
    } else {
        fs::path path = source;
        if (source.starts_with("file://")) {
            path = location_to_path(source);
        }
        if (!fs::exists(path)) {
            throw PackgetException(ErrorKind::FetchFailed, string_format("error.file_not_found", path.string()));
        }
        copy_file_atomic(path, staged);
    }

    // Validate before replacing the current index.
    try {
        PackageIndex candidate(staged);
        candidate.read();
    } catch (const PackgetException&) {
        std::error_code ec;
        fs::remove(staged, ec);
        throw;
    }

    std::error_code ec;
    fs::rename(staged, PUBLIC_INDEX_FILE, ec);
    if (ec) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.rename_failed", staged.string(), PUBLIC_INDEX_FILE.string()));
    }
    web_index_->read();
    if (web_index_->url().empty()) {
        web_index_->set_url(is_url(source) ? source : DEFAULT_PUBLIC_INDEX_URL);
    }
    log_info(string_format("info.index_updated", web_index_->list_pdsc_tags().size()));
}

std::vector<PdscTag> PackManager::list_cached(const std::string& filter) const {
    std::vector<std::string> words;
    std::istringstream in(to_lower(filter));
    for (std::string w; in >> w;) {
        words.push_back(w);
    }

    std::vector<PdscTag> result;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(DOWNLOAD_DIR, ec)) {
        const std::string file = entry.path().filename().string();
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !(file.ends_with(".pack") || file.ends_with(".zip"))) continue;
        try {
            const PackIdentity id = parse_pack_identity(file);
            if (id.is_pack_id) {
                log_debug(string_format("debug.skipping_cached_file", file, get_string("error.not_a_pack_file")));
                continue;
            }
            PdscTag tag;
            tag.vendor = id.vendor;
            tag.name = id.name;
            tag.version = id.version;
            if (matches_filter(tag, words)) result.push_back(tag);
        } catch (const PackgetException& e) {
            log_debug(string_format("debug.skipping_cached_file", file, e.what()));
        }
    }
    if (ec) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.filesystem_failed", DOWNLOAD_DIR.string(), ec.message()));
    }
    std::sort(result.begin(), result.end(), [](const PdscTag& a, const PdscTag& b) {
        return a.key() < b.key();
    });
    return result;
}

bool PackManager::check_staleness() const {
    try {
        web_index_->check_time();
    } catch (const PackgetException& e) {
        if (e.kind() != ErrorKind::StaleIndex) {
            throw;
        }
        log_warning(string_format("warning.index_stale", e.what()));
        return false;
    }
    return true;
}

std::vector<std::string> read_packs_list(const fs::path& list_file) {
    if (!fs::exists(list_file)) {
        throw PackgetException(ErrorKind::Usage, string_format("error.file_not_found", list_file.string()));
    }
    std::vector<std::string> references;
    std::istringstream in(read_file(list_file));
    for (std::string line; std::getline(in, line);) {
        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        const auto last = line.find_last_not_of(" \t\r");
        references.push_back(line.substr(first, last - first + 1));
    }
    log_debug(string_format("debug.packs_list_read", list_file.string(), references.size()));
    return references;
}
