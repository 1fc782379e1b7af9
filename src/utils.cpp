#include "utils.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    LogLevel log_level = LogLevel::NORMAL;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;
    bool progress_active = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        bool current_stream_is_tty = (&stream == &std::cout) ? is_stdout_tty : is_stderr_tty;
        if (progress_active && is_stdout_tty) {
            std::cout << std::endl;
            progress_active = false;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void set_log_level(LogLevel level) {
    log_level = level;
}

LogLevel get_log_level() {
    return log_level;
}

void log_debug(std::string_view msg) {
    if (log_level != LogLevel::VERBOSE) return;
    log_internal(get_string("debug.prefix") + " ", COLOR_BLUE, msg, std::cout);
}

void log_info(std::string_view msg) {
    if (log_level == LogLevel::QUIET) return;
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();
    if (!is_stdout_tty || log_level == LogLevel::QUIET) {
        return;
    }

    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << get_string("info.log_prefix") << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
    progress_active = true;
}

void log_progress_done() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (progress_active) {
        std::cout << std::endl;
        progress_active = false;
    }
}

PackRootLock::PackRootLock() {
    ensure_dir_exists(PACK_ROOT);
    lock_fd = open(LOCK_FILE.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (lock_fd < 0) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.create_file_failed", LOCK_FILE.string(), strerror(errno)));
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw PackgetException(ErrorKind::FileSystem, string_format("error.root_locked", PACK_ROOT.string()));
        }
        throw PackgetException(ErrorKind::FileSystem, string_format("error.root_lock_failed", PACK_ROOT.string(), strerror(err)));
    }
}

PackRootLock::~PackRootLock() {
    if (lock_fd != -1) {
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw PackgetException(ErrorKind::FileSystem, string_format("error.create_dir_failed", path.string(), ec.message()));
        }
    } else if (!fs::is_directory(path)) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.path_not_dir", path.string()));
    }
}

void copy_file_atomic(const fs::path& from, const fs::path& to) {
    ensure_dir_exists(to.parent_path());
    fs::path tmp_path = to;
    tmp_path += ".tmp";
    std::error_code ec;
    fs::copy_file(from, tmp_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.copy_failed", from.string(), to.string(), ec.message()));
    }
    fs::rename(tmp_path, to, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw PackgetException(ErrorKind::FileSystem, string_format("error.copy_failed", from.string(), to.string(), ec.message()));
    }
}

void write_file_atomic(const fs::path& path, std::string_view content) {
    if (path.has_parent_path()) ensure_dir_exists(path.parent_path());
    fs::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw PackgetException(ErrorKind::FileSystem, string_format("error.create_file_failed", tmp_path.string(), strerror(errno)));
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            throw PackgetException(ErrorKind::FileSystem, string_format("error.write_file_failed", tmp_path.string()));
        }
    }
    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw PackgetException(ErrorKind::FileSystem, string_format("error.write_file_failed", path.string()));
    }
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.open_file_failed", path.string()));
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void remove_empty_parents(const fs::path& start, const fs::path& stop) {
    auto trim = [](const fs::path& p) {
        fs::path n = p.lexically_normal();
        return n.has_filename() ? n : n.parent_path();
    };
    const fs::path limit = trim(stop);
    fs::path dir = trim(start);
    std::error_code ec;
    while (!dir.empty() && dir != limit) {
        const fs::path rel = dir.lexically_relative(limit);
        if (rel.empty() || *rel.begin() == "..") break;
        if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec)) break;
        if (!fs::remove(dir, ec)) break;
        dir = dir.parent_path();
    }
}

std::filesystem::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.path_absolute", path.string()));
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw PackgetException(ErrorKind::FileSystem, string_format("error.path_traversal", path.string()));
        }
    }
    return root / normalized;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

bool is_url(std::string_view s) {
    return s.starts_with("http://") || s.starts_with("https://");
}

std::string format_timestamp(TimePoint tp) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(9) << std::setfill('0') << nanos << 'Z';
    return ss.str();
}

std::optional<TimePoint> parse_timestamp(std::string_view text) {
    static const std::regex rfc3339(R"(^(\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?(?:([Zz])|([+-])(\d{2}):(\d{2}))$)");
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_match(text.begin(), text.end(), m, rfc3339)) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = std::stoi(m[1].str()) - 1900;
    tm.tm_mon = std::stoi(m[2].str()) - 1;
    tm.tm_mday = std::stoi(m[3].str());
    tm.tm_hour = std::stoi(m[4].str());
    tm.tm_min = std::stoi(m[5].str());
    tm.tm_sec = std::stoi(m[6].str());
    if (tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }
    std::time_t t = timegm(&tm);

    long long nanos = 0;
    if (m[7].matched) {
        std::string frac = m[7].str();
        frac.resize(9, '0');
        nanos = std::stoll(frac);
    }
    if (m[9].matched) {
        int offset = std::stoi(m[10].str()) * 3600 + std::stoi(m[11].str()) * 60;
        t += (m[9].str() == "+") ? -offset : offset;
    }

    return std::chrono::system_clock::from_time_t(t) +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos));
}
