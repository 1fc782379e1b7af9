#pragma once

#include "cancellation.hpp"
#include "installer.hpp"
#include "package_index.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Session root: owns the web and local indices under the pack root and runs
// install/uninstall batches through one InstallationCoordinator.
class PackManager {
public:
    PackManager(const CancellationToken& token, PackFetcher fetcher);

    // Sets up the pack root layout and loads both indices.
    // Throws IndexCorrupt or FileSystem; both are fatal for the session.
    void init(const std::string& pack_root);
    // Writes both indices and touches pack.idx.
    void save();

    // Each reference is handled on its own; failures are logged and the batch
    // goes on, except for cancellation and a corrupt index which are rethrown.
    // Returns true if every reference succeeded.
    bool install(const std::vector<std::string>& references, const InstallOptions& options = {});
    bool uninstall(const std::vector<std::string>& references, bool purge = false);
    // Moves each installed public pack (all of them when `references` is empty)
    // to the newest catalog version.
    bool update(const std::vector<std::string>& references, const InstallOptions& options = {});

    // Local packs plus public packs that are extracted under the pack root
    // (every public entry with `include_public`). Filter words must all appear, case-insensitive.
    std::vector<PdscTag> list_installed(const std::string& filter = "", bool include_public = false) const;
    // Pack files kept in .Download/, sorted by key.
    std::vector<PdscTag> list_cached(const std::string& filter = "") const;
    // Replaces the web index with the pidx at `source` (URL or local path).
    void update_public_index(const std::string& source);
    // Logs a warning and returns false when the web index is stale.
    bool check_staleness() const;

    PackageIndex& web_index() { return *web_index_; }
    PackageIndex& local_index() { return *local_index_; }

private:
    bool run_each(const std::vector<std::string>& references, const std::function<void(const std::string&)>& operation);

    const CancellationToken& token_;
    PackFetcher fetcher_;
    std::unique_ptr<PackageIndex> web_index_;
    std::unique_ptr<PackageIndex> local_index_;
    std::unique_ptr<InstallationCoordinator> coordinator_;
};

// One reference per line; blank lines are skipped and whitespace is trimmed.
std::vector<std::string> read_packs_list(const std::filesystem::path& list_file);
