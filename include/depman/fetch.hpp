#pragma once

#include <depman/result.hpp>
#include <filesystem>
#include <string>

namespace depman {

// Hard ceiling on extra download attempts, whatever the configuration says.
constexpr int kMaxDownloadRetries = 5;
constexpr int kMaxRetryDelayMs = 5 * 60 * 1000;

struct FetchOptions {
    int timeout_seconds = 300;          // whole transfer
    int connect_timeout_seconds = 30;
};

// Seam for network access; tests substitute an in-memory implementation.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Writes the resource at `url` to `destination`, replacing any existing
    // file. Timeout on expiry, Network for any other transfer failure.
    virtual Status fetch(const std::string& url,
                         const std::filesystem::path& destination,
                         const FetchOptions& options) = 0;
};

// libcurl-backed fetcher (http, https, ftp, file).
class CurlFetcher : public Fetcher {
public:
    CurlFetcher();

    Status fetch(const std::string& url,
                 const std::filesystem::path& destination,
                 const FetchOptions& options) override;
};

// Delay before retry number `attempt` (1-based): backoff_ms doubled per
// attempt, saturating at kMaxRetryDelayMs.
int retry_delay_ms(int backoff_ms, int attempt);

// Calls fetcher.fetch() up to 1 + min(retries, kMaxDownloadRetries) times,
// sleeping retry_delay_ms() between attempts. Only Network and Timeout
// failures are retried.
Status fetch_with_retry(Fetcher& fetcher,
                        const std::string& url,
                        const std::filesystem::path& destination,
                        const FetchOptions& options,
                        int retries,
                        int backoff_ms);

// Last path segment of a URL without query/fragment ("artifact" if none).
std::string url_file_name(const std::string& url);

} // namespace depman
