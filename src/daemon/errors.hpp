#pragma once

#include <expected>
#include <string>
#include <string_view>

enum class ErrorKind {
    Configuration,
    NotInitialized,
    NotFound,
    UnsupportedOption,
    EmptyResult,
    DownloadCancelled,
    TransientIO,
    AlreadyRunning,
    InvalidRequest,
};

struct Error {
    ErrorKind kind;
    std::string message;
    // Set for UnsupportedOption: the option the runtime rejected, if it said.
    std::string option = {};
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::NotInitialized: return "NotInitialized";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::UnsupportedOption: return "UnsupportedOption";
        case ErrorKind::EmptyResult: return "EmptyResult";
        case ErrorKind::DownloadCancelled: return "DownloadCancelled";
        case ErrorKind::TransientIO: return "TransientIOError";
        case ErrorKind::AlreadyRunning: return "AlreadyRunning";
        case ErrorKind::InvalidRequest: return "InvalidRequest";
    }
    return "Unknown";
}
