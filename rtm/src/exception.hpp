#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

// Failure categories surfaced by the runtime manager.
enum class ErrorKind {
    Network,            // transient transport failure, retried by the fetcher
    Integrity,          // digest or size mismatch
    NotFound,           // version or asset absent
    Disk,               // space, permission or rename failure
    Cancelled,
    Busy,               // eviction blocked by active users
    RuntimeUnavailable, // every fallback tier exhausted
    AlreadyInstalling,
    InvalidState,
    InvalidArgument,
    Config
};

std::string_view error_kind_name(ErrorKind kind);

class RtmException : public std::runtime_error {
public:
    RtmException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};
