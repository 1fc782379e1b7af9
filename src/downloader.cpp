#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <unistd.h>

namespace {

struct TransferState {
    std::ofstream out;
    const CancellationToken* token = nullptr;
    bool show_progress = false;
    std::uint64_t max_size = MAX_DOWNLOAD_SIZE;
    std::uint64_t written = 0;
    bool too_large = false;
};

size_t write_data(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t bytes = size * nmemb;
    if (state->token->is_cancelled()) {
        return 0;
    }
    if (state->written + bytes > state->max_size) {
        state->too_large = true;
        return 0;
    }
    state->out.write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
    state->written += bytes;
    return state->out.good() ? bytes : 0;
}

// Download progress bar callback; a non-zero return aborts the transfer.
int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
    auto* state = static_cast<TransferState*>(clientp);
    if (state->token->is_cancelled()) {
        return 1;
    }
    if (state->show_progress && dltotal > 0) {
        double percentage = static_cast<double>(dlnow) / static_cast<double>(dltotal) * 100.0;
        log_progress(get_string("info.downloading"), percentage);
    }
    return 0;
}

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

// Last path segment, without query or fragment. Empty for "https://host/" and "https://host".
std::string url_file_name(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    size_t scheme = path.find("://");
    size_t host_end = path.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (host_end == std::string::npos) return "";
    return path.substr(path.find_last_of('/') + 1);
}

} // anonymous namespace

CurlGlobalInitializer::CurlGlobalInitializer() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

void download_file(const std::string& url, const fs::path& output_path, const CancellationToken& token,
                   bool show_progress, std::uint64_t max_size) {
    token.cancellation_point();

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw PackgetException(ErrorKind::FetchFailed, string_format("error.download_failed", url, get_string("error.curl_init_failed")));
    }

    const fs::path part_path = output_path.string() + ".part";
    TransferState state;
    state.token = &token;
    state.show_progress = show_progress && isatty(STDOUT_FILENO);
    state.max_size = max_size;
    state.out.open(part_path, std::ios::binary | std::ios::trunc);
    if (!state.out) {
        throw PackgetException(ErrorKind::FileSystem, string_format("error.create_file_failed", part_path.string(), std::strerror(errno)));
    }

    log_info(string_format("info.downloading_url", url));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_data);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);

    CURLcode res = curl_easy_perform(curl.get());
    if (state.show_progress) {
        log_progress_done();
    }
    state.out.close();

    if (res != CURLE_OK || !state.out) {
        std::error_code ec;
        fs::remove(part_path, ec);
        if (token.is_cancelled()) {
            throw PackgetException(ErrorKind::Cancelled, get_string("error.cancelled"));
        }
        if (state.too_large) {
            throw PackgetException(ErrorKind::FetchFailed, string_format("error.download_too_large", url, max_size));
        }
        const std::string reason = res != CURLE_OK ? curl_easy_strerror(res) : get_string("error.write_failed");
        throw PackgetException(ErrorKind::FetchFailed, string_format("error.download_failed", url, reason));
    }

    std::error_code ec;
    fs::rename(part_path, output_path, ec);
    if (ec) {
        fs::remove(part_path, ec);
        throw PackgetException(ErrorKind::FileSystem, string_format("error.rename_failed", part_path.string(), output_path.string()));
    }
    log_debug(string_format("debug.download_complete", output_path.string(), state.written));
}

fs::path fetch_pack(const std::string& url, const fs::path& cache_dir, const CancellationToken& token) {
    const std::string file_name = url_file_name(url);
    if (file_name.empty()) {
        throw PackgetException(ErrorKind::FetchFailed, string_format("error.download_failed", url, get_string("error.url_no_file")));
    }
    const fs::path destination = cache_dir / file_name;
    if (fs::exists(destination)) {
        log_debug(string_format("debug.download_cached", destination.string()));
        return destination;
    }
    ensure_dir_exists(cache_dir);
    download_file(url, destination, token, get_log_level() != LogLevel::QUIET);
    return destination;
}
