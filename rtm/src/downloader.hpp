#pragma once

#include "exception.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

struct TransferOptions {
    long connect_timeout_s = 15;
    // Abort when the transfer stays below 1 byte/s for this long.
    long low_speed_timeout_s = 30;
    // Upper bound on a whole attempt, 0 disables it.
    long transfer_timeout_s = 1800;
};

struct TransferStatus {
    bool ok = true;
    bool transient = false;
    ErrorKind kind = ErrorKind::Network;
    long http_status = 0;
    std::string message;
};

// Return false from either callback to abort the transfer.
using TransferWriteFn = std::function<bool(const char* data, std::size_t size)>;
using TransferProgressFn = std::function<bool(std::uint64_t done, std::uint64_t total)>;

void ensure_curl_initialized();

// Maps a failed curl result to an error kind. HTTP 5xx, 408, 429 and connection level
// failures (timeouts included) are transient; 404 and 410 are NotFound.
TransferStatus classify_transfer_failure(CURLcode res, long http_status);

// Streams `url` (http, https or file) through `write`. Transfer failures are reported in the
// returned status, classified as transient (worth retrying) or terminal.
TransferStatus perform_transfer(const std::string& url, const TransferOptions& options,
                                const TransferWriteFn& write, const TransferProgressFn& progress);
