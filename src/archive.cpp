#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

std::string archive_error(struct archive* a, const char* fallback_key) {
    const char* err = archive_error_string(a);
    return err ? err : get_string(fallback_key);
}

ArchiveReadHandle open_archive(const fs::path& archive_path) {
    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw PackgetException(ErrorKind::ExtractionFailed,
            string_format("error.archive_open_failed", archive_path.string(), archive_error(a.get(), "error.unknown")));
    }
    return a;
}

// Returns false at the end of the archive.
bool next_entry(struct archive* a, struct archive_entry** entry, const fs::path& archive_path) {
    int r = archive_read_next_header(a, entry);
    if (r == ARCHIVE_EOF) return false;
    if (r < ARCHIVE_OK) {
        if (r < ARCHIVE_WARN) {
            throw PackgetException(ErrorKind::ExtractionFailed,
                string_format("error.extract_failed", archive_path.string(), archive_error(a, "error.fatal_read")));
        }
        log_warning(archive_error(a, "error.unknown"));
    }
    return true;
}

[[noreturn]] void malicious_entry(const std::string& name) {
    throw PackgetException(ErrorKind::ExtractionFailed, string_format("error.malicious_path_in_archive", name));
}

std::string entry_name(struct archive_entry* entry) {
    const char* raw = archive_entry_pathname(entry);
    if (!raw) return "";
    std::string name = raw;
    if (name.find("../") != std::string::npos || name.find("..\\") != std::string::npos || name == "..") {
        malicious_entry(name);
    }
    while (name.starts_with("./")) name = name.substr(2);
    return name;
}

fs::path safe_destination(const std::string& name, const fs::path& output_dir) {
    try {
        return validate_path(name, output_dir);
    } catch (const PackgetException&) {
        malicious_entry(name);
    }
}

} // anonymous namespace

size_t ArchiveEntryReader::read(char* buffer, size_t size) {
    la_ssize_t n = archive_read_data(a_, buffer, size);
    if (n < 0) {
        throw PackgetException(ErrorKind::ExtractionFailed,
            string_format("error.archive_read_failed", archive_error(a_, "error.data_block_read")));
    }
    return static_cast<size_t>(n);
}

std::vector<std::string> list_archive_entries(const fs::path& archive_path) {
    auto a = open_archive(archive_path);
    std::vector<std::string> names;
    struct archive_entry* entry;
    while (next_entry(a.get(), &entry, archive_path)) {
        std::string name = entry_name(entry);
        if (!name.empty()) {
            if (archive_entry_filetype(entry) == AE_IFDIR && !name.ends_with("/")) name += "/";
            names.push_back(name);
        }
        archive_read_data_skip(a.get());
    }
    return names;
}

void for_each_archive_entry(const fs::path& archive_path,
                            const std::function<void(const std::string& name, ArchiveEntryReader& reader)>& visit) {
    auto a = open_archive(archive_path);
    struct archive_entry* entry;
    while (next_entry(a.get(), &entry, archive_path)) {
        std::string name = entry_name(entry);
        if (name.empty() || archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(a.get());
            continue;
        }
        ArchiveEntryReader reader(a.get());
        visit(name, reader);
    }
}

std::vector<fs::path> extract_archive(const fs::path& archive_path, const fs::path& output_dir,
                                      const CancellationToken& token, const ExtractOptions& options) {
    ensure_dir_exists(output_dir);
    auto a = open_archive(archive_path);

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
        ARCHIVE_EXTRACT_UNLINK
    );

    std::string prefix = options.strip_prefix;
    if (!prefix.empty() && !prefix.ends_with("/")) prefix += "/";

    std::vector<fs::path> extracted;
    struct archive_entry* entry;
    char buffer[EXTRACT_CHUNK_SIZE];

    while (true) {
        token.cancellation_point();
        if (!next_entry(a.get(), &entry, archive_path)) break;

        std::string name = entry_name(entry);
        if (!prefix.empty()) {
            if (!name.starts_with(prefix)) {
                log_debug(string_format("debug.skipping_entry", name));
                archive_read_data_skip(a.get());
                continue;
            }
            name = name.substr(prefix.size());
        }
        if (name.empty()) {
            archive_read_data_skip(a.get());
            continue;
        }

        const fs::path dest_path = safe_destination(name, output_dir);
        archive_entry_set_pathname(entry, dest_path.c_str());

        if (const char* hardlink = archive_entry_hardlink(entry)) {
            std::string target = hardlink;
            while (target.starts_with("./")) target = target.substr(2);
            if (!prefix.empty() && target.starts_with(prefix)) target = target.substr(prefix.size());
            archive_entry_set_hardlink(entry, safe_destination(target, output_dir).c_str());
        }

        if (const char* symlink = archive_entry_symlink(entry)) {
            fs::path target(symlink);
            if (target.is_absolute()) malicious_entry(name + " -> " + symlink);
            fs::path resolved = (fs::path(name).parent_path() / target).lexically_normal();
            if (!resolved.empty() && *resolved.begin() == "..") malicious_entry(name + " -> " + symlink);
        }

        int r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw PackgetException(ErrorKind::ExtractionFailed,
                    string_format("error.extract_failed", archive_path.string(), archive_error(ext.get(), "error.fatal_write")));
            }
            log_warning(archive_error(ext.get(), "error.unknown"));
        }

        if (archive_entry_filetype(entry) == AE_IFREG) {
            ArchiveEntryReader reader(a.get());
            std::uint64_t total = 0;
            try {
                while (true) {
                    token.cancellation_point();
                    size_t n = reader.read(buffer, sizeof(buffer));
                    if (n == 0) break;
                    total += n;
                    if (total > options.max_entry_size) {
                        throw PackgetException(ErrorKind::ExtractionFailed,
                            string_format("error.archive_entry_too_large", name, options.max_entry_size));
                    }
                    if (archive_write_data(ext.get(), buffer, n) < 0) {
                        throw PackgetException(ErrorKind::ExtractionFailed,
                            string_format("error.extract_failed", archive_path.string(), archive_error(ext.get(), "error.data_block_write")));
                    }
                }
            } catch (const PackgetException&) {
                archive_write_finish_entry(ext.get());
                std::error_code ec;
                fs::remove(dest_path, ec);
                throw;
            }
        }

        if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
            throw PackgetException(ErrorKind::ExtractionFailed,
                string_format("error.extract_failed", archive_path.string(), archive_error(ext.get(), "error.fatal_write")));
        }
        extracted.push_back(dest_path);

        if (extracted.size() % 100 == 0) {
            log_debug(string_format("debug.extracting", extracted.size()));
        }
    }

    return extracted;
}

std::string extract_file_from_archive(const fs::path& archive_path, const std::string& internal_path, std::uint64_t max_size) {
    auto a = open_archive(archive_path);
    struct archive_entry* entry;
    while (next_entry(a.get(), &entry, archive_path)) {
        if (entry_name(entry) != internal_path || archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(a.get());
            continue;
        }

        ArchiveEntryReader reader(a.get());
        std::string content;
        char buffer[EXTRACT_CHUNK_SIZE];
        while (size_t n = reader.read(buffer, sizeof(buffer))) {
            if (content.size() + n > max_size) {
                throw PackgetException(ErrorKind::ExtractionFailed,
                    string_format("error.archive_entry_too_large", internal_path, max_size));
            }
            content.append(buffer, n);
        }
        return content;
    }

    throw PackgetException(ErrorKind::ExtractionFailed,
        string_format("error.archive_entry_missing", internal_path, archive_path.string()));
}
