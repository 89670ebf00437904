#include "mediasync/http_fetcher.hpp"
#include "mediasync/log.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace mediasync {

namespace {

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    // Check if adding this data would exceed the limit
    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Return 0 to signal error and abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(clientp);
    // Return non-zero to abort
    return stop->stop_requested() ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

HttpFetcher::HttpFetcher(HttpFetcherConfig config) : config_(std::move(config)) {
    // Initialize CURL globally (thread-safe)
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

FetchResult HttpFetcher::get(const std::string& url,
                             const std::string& bearer_token,
                             std::stop_token stop) const {
    FetchResult result;
    if (stop.stop_requested()) {
        result.cancelled = true;
        result.error_message = "Request cancelled";
        return result;
    }

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        result.error_message = "Failed to create CURL handle";
        return result;
    }

    std::unique_ptr<curl_slist, SlistDeleter> headers;
    if (!bearer_token.empty()) {
        auto auth = "Authorization: Bearer " + bearer_token;
        headers.reset(curl_slist_append(nullptr, auth.c_str()));
    }

    WriteCallbackContext write_ctx{&result.body, config_.max_response_size, 0, false};

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, config_.user_agent.c_str());
    if (headers) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    }
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &write_ctx);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connect_timeout.count()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(config_.request_timeout.count()));
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    if (config_.verify_ssl) {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    } else {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (config_.verbose) {
        curl_easy_setopt(h, CURLOPT_VERBOSE, 1L);
    }

    CURLcode res = curl_easy_perform(h);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        result.cancelled = true;
        result.error_message = "Request cancelled";
        result.body.clear();
        return result;
    }
    if (write_ctx.size_exceeded) {
        result.error_message = "Response body exceeded maximum size limit of " +
                               std::to_string(config_.max_response_size) + " bytes";
        result.body.clear();
        return result;
    }
    if (res != CURLE_OK) {
        result.error_message = curl_easy_strerror(res);
        result.body.clear();
        log_debug("GET %s failed: %s", url.c_str(), result.error_message.c_str());
        return result;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &result.status_code);
    char* ct = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        result.content_type = ct;
    }

    if (result.status_code < 200 || result.status_code >= 300) {
        result.error_message = "HTTP " + std::to_string(result.status_code);
        result.body.clear();
        return result;
    }

    result.success = true;
    return result;
}

}  // namespace mediasync
