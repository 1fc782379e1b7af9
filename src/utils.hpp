#pragma once

#include "exception.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_BLUE = "\033[1;34m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

enum class LogLevel {
    QUIET,
    NORMAL,
    VERBOSE
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

// Log functions
void log_debug(std::string_view msg);
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);
void log_progress_done();

// Exclusive lock on the pack root, released on destruction.
class PackRootLock {
public:
    PackRootLock();
    ~PackRootLock();
    PackRootLock(const PackRootLock&) = delete;
    PackRootLock& operator=(const PackRootLock&) = delete;
private:
    int lock_fd = -1;
};

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
void copy_file_atomic(const fs::path& from, const fs::path& to);
void write_file_atomic(const fs::path& path, std::string_view content);
std::string read_file(const fs::path& path);
// Removes empty directories from `start` upwards, stopping at `stop` (exclusive).
void remove_empty_parents(const fs::path& start, const fs::path& stop);

// Throws FileSystem if `path` is absolute or escapes `root`.
std::filesystem::path validate_path(const fs::path& path, const fs::path& root);

// Strings
std::string to_lower(std::string_view s);
bool is_url(std::string_view s);

// RFC3339 timestamps with nanosecond precision, always emitted in UTC.
using TimePoint = std::chrono::system_clock::time_point;
std::string format_timestamp(TimePoint tp);
std::optional<TimePoint> parse_timestamp(std::string_view text);
