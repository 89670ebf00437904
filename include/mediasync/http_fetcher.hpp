#pragma once

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <vector>

namespace mediasync {

struct HttpFetcherConfig {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds request_timeout{120000};
    size_t max_response_size = 512ULL * 1024 * 1024;  // 0 = unlimited
    std::string user_agent = "mediasync/1.0";
    bool verify_ssl = true;
    bool verbose = false;
};

struct FetchResult {
    bool success = false;
    bool cancelled = false;
    long status_code = 0;
    std::vector<uint8_t> body;
    std::string content_type;
    std::string error_message;
};

/// Blocking HTTP GET over libcurl, used to pull media bytes from remote origins.
/// Cancellation is checked from the transfer progress callback.
class HttpFetcher {
public:
    explicit HttpFetcher(HttpFetcherConfig config = {});

    /// GET `url`. A non-empty `bearer_token` is sent as an Authorization header.
    /// Non-2xx responses are reported as failures with the status code set.
    FetchResult get(const std::string& url,
                    const std::string& bearer_token,
                    std::stop_token stop = {}) const;

    const HttpFetcherConfig& config() const { return config_; }

private:
    HttpFetcherConfig config_;
};

}  // namespace mediasync
