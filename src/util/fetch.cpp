#include <depman/fetch.hpp>
#include <depman/log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;

namespace depman {

namespace {

constexpr char kUserAgent[] = "depman/0.1";

size_t write_to_stream(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* stream = static_cast<std::ofstream*>(userdata);
    size_t total = size * nmemb;
    stream->write(ptr, static_cast<std::streamsize>(total));
    return *stream ? total : 0;
}

std::once_flag g_curl_init;
CURLcode g_curl_init_code = CURLE_OK;

} // namespace

CurlFetcher::CurlFetcher() {
    std::call_once(g_curl_init, [] {
        g_curl_init_code = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

Status CurlFetcher::fetch(const std::string& url,
                          const fs::path& destination,
                          const FetchOptions& options) {
    if (g_curl_init_code != CURLE_OK) {
        return DepmanError{DepmanError::Network,
            std::string("curl_global_init failed: ") + curl_easy_strerror(g_curl_init_code)};
    }
    if (options.timeout_seconds <= 0) {
        return DepmanError{DepmanError::InvalidArg,
            "download of " + url + " has no timeout configured"};
    }

    std::error_code ec;
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            return DepmanError{DepmanError::IO,
                "cannot create " + destination.parent_path().string() + ": " + ec.message()};
        }
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return DepmanError{DepmanError::IO, "cannot write " + destination.string()};
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(),
                                                                &curl_easy_cleanup);
    if (!handle) {
        return DepmanError{DepmanError::Network, "curl_easy_init failed"};
    }

    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(options.timeout_seconds));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(std::min(options.connect_timeout_seconds,
                                                options.timeout_seconds)));

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);

    CURLcode rc = curl_easy_perform(h);
    out.close();

    if (rc != CURLE_OK) {
        fs::remove(destination, ec);
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        if (rc == CURLE_OPERATION_TIMEDOUT) {
            return DepmanError{DepmanError::Timeout,
                "download of " + url + " timed out after " +
                std::to_string(options.timeout_seconds) + "s"};
        }
        return DepmanError{DepmanError::Network,
            "download of " + url + " failed: " + detail};
    }
    if (!out) {
        fs::remove(destination, ec);
        return DepmanError{DepmanError::IO, "failed writing " + destination.string()};
    }
    return ok_status();
}

Status fetch_with_retry(Fetcher& fetcher,
                        const std::string& url,
                        const fs::path& destination,
                        const FetchOptions& options,
                        int retries,
                        int backoff_ms) {
    int attempts = 1 + std::clamp(retries, 0, kMaxDownloadRetries);

    for (int attempt = 1;; ++attempt) {
        auto st = fetcher.fetch(url, destination, options);
        if (st.is_ok()) return st;

        auto code = st.error().code;
        bool transient = code == DepmanError::Network || code == DepmanError::Timeout;
        if (!transient || attempt >= attempts) return st;

        int delay_ms = retry_delay_ms(backoff_ms, attempt);
        log::warn("download attempt %d/%d failed: %s; retrying in %dms",
                  attempt, attempts, st.error().message.c_str(), delay_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
}

int retry_delay_ms(int backoff_ms, int attempt) {
    long long delay = std::clamp(backoff_ms, 0, kMaxRetryDelayMs);
    for (int i = 1; i < attempt && delay < kMaxRetryDelayMs; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min<long long>(delay, kMaxRetryDelayMs));
}

std::string url_file_name(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    size_t scheme = path.find("://");
    if (scheme != std::string::npos) {
        size_t slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? "" : path.substr(slash);
    }
    while (!path.empty() && path.back() == '/') path.pop_back();

    size_t last = path.find_last_of('/');
    std::string name = last == std::string::npos ? path : path.substr(last + 1);
    if (name.empty() || name == "." || name == "..") return "artifact";
    return name;
}

} // namespace depman
