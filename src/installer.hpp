#pragma once

#include "cancellation.hpp"
#include "integrity.hpp"
#include "pack_identity.hpp"
#include "package_index.hpp"
#include "pdsc.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Downloads `url` into `cache_dir` and returns the local file. fetch_pack() in production.
using PackFetcher = std::function<fs::path(const std::string& url, const fs::path& cache_dir, const CancellationToken& token)>;

struct InstallOptions {
    VerificationOptions verification;
};

// One pack install, split in two phases so that nothing is recorded in an
// index until every filesystem side effect has succeeded.
class InstallationTask {
public:
    // `identity` must be a .pack/.zip file reference.
    InstallationTask(PackIdentity identity, const CancellationToken& token);

    // Fetches, validates, verifies and extracts the pack.
    void prepare(const PackFetcher& fetcher, const VerificationOptions& verification);
    // Copies the descriptor to the bookkeeping directories and records the pack in `index`.
    void commit(PackageIndex& index);

    const PackIdentity& identity() const { return identity_; }
    const fs::path& destination() const { return destination_; }
    bool is_local() const { return is_local_; }
    PdscTag tag() const;

private:
    void fetch(const PackFetcher& fetcher);
    void locate_descriptor();

    PackIdentity identity_;
    const CancellationToken& token_;
    std::string source_;
    fs::path destination_;
    bool is_local_ = true;
    fs::path archive_path_;
    std::string subfolder_;
    std::optional<PdscFile> pdsc_;
};

// Drives installs and removals against the web and local indices.
class InstallationCoordinator {
public:
    InstallationCoordinator(PackageIndex& web_index, PackageIndex& local_index,
                            const CancellationToken& token, PackFetcher fetcher);

    void install(const std::string& reference, const InstallOptions& options = {});
    // Local packs: removes the index record; with `purge` also the extracted files and
    // cached downloads. Public packs: the catalog is kept and the extracted versions
    // are deleted (their downloads too with `purge`).
    void remove(const std::string& reference, bool purge = false);
    // Installs the newest catalog version of an installed public pack.
    void update(const std::string& reference, const InstallOptions& options = {});

    // Picks the web index entry a pack ID refers to. Throws EntryNotFound.
    PdscTag resolve_pack_id(const PackIdentity& identity) const;

private:
    void install_reference(const std::string& reference, const InstallOptions& options);
    void remove_reference(const std::string& reference, bool purge);
    void update_reference(const std::string& reference, const InstallOptions& options);
    void install_pdsc(const PackIdentity& identity);
    void install_pack(const PackIdentity& identity, PackageIndex& index, const InstallOptions& options);
    void remove_extracted(const PdscTag& tag) const;
    void purge_downloads(const PdscTag& tag) const;

    PackageIndex& web_index_;
    PackageIndex& local_index_;
    const CancellationToken& token_;
    PackFetcher fetcher_;
};

// <root>/Vendor/Name/Version
fs::path pack_install_dir(const std::string& vendor, const std::string& name, const std::string& version);
