#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace {

// Custom deleter for the CURL handle
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct TransferContext {
    const TransferWriteFn* write;
    const TransferProgressFn* progress;
};

size_t write_callback(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t bytes = size * nmemb;
    if (!(*ctx->write)(static_cast<const char*>(ptr), bytes)) {
        return 0; // makes curl fail with CURLE_WRITE_ERROR
    }
    return bytes;
}

int xferinfo_callback(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx->progress || !*ctx->progress) return 0;
    const auto done = dlnow > 0 ? static_cast<std::uint64_t>(dlnow) : 0;
    const auto total = dltotal > 0 ? static_cast<std::uint64_t>(dltotal) : 0;
    return (*ctx->progress)(done, total) ? 0 : 1;
}

} // anonymous namespace

TransferStatus classify_transfer_failure(CURLcode res, long http_status) {
    TransferStatus status;
    status.ok = false;
    status.http_status = http_status;
    status.message = curl_easy_strerror(res);

    switch (res) {
        case CURLE_HTTP_RETURNED_ERROR:
            status.message += " (HTTP " + std::to_string(http_status) + ")";
            if (http_status == 404 || http_status == 410) {
                status.kind = ErrorKind::NotFound;
            } else if (http_status == 408 || http_status == 429 || http_status >= 500) {
                status.transient = true;
            }
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            status.transient = true;
            break;
        case CURLE_FILE_COULDNT_READ_FILE:
        case CURLE_REMOTE_FILE_NOT_FOUND:
            status.kind = ErrorKind::NotFound;
            break;
        case CURLE_WRITE_ERROR:
            status.kind = ErrorKind::Disk;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            status.kind = ErrorKind::Cancelled;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            status.kind = ErrorKind::InvalidArgument;
            break;
        default:
            break;
    }
    return status;
}

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

TransferStatus perform_transfer(const std::string& url, const TransferOptions& options,
                                const TransferWriteFn& write, const TransferProgressFn& progress) {
    ensure_curl_initialized();
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw RtmException(ErrorKind::Network, string_format("error.download_failed", url));
    }

    TransferContext ctx{&write, &progress};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "rtm/" RTM_VERSION);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options.low_speed_timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options.transfer_timeout_s);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OK) {
        return {};
    }
    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    TransferStatus status = classify_transfer_failure(res, http_status);
    status.message = string_format("error.download_failed", url) + ": " + status.message;
    return status;
}
