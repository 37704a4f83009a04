#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace dsm {

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidIdentifier,
    DuplicateSite,
    NotFound,
    PortRangeExhausted,
    MissingVariable,
    DatabaseBootstrapFailed,
    ProcessStartTimeout,
    ProcessStopTimeout,
    InvalidArgument,
    IOError,
    PermissionDenied,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidIdentifier: return "Invalid site identifier";
        case ErrorCode::DuplicateSite: return "Site already exists";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::PortRangeExhausted: return "Port range exhausted";
        case ErrorCode::MissingVariable: return "Missing template variable";
        case ErrorCode::DatabaseBootstrapFailed: return "Database bootstrap failed";
        case ErrorCode::ProcessStartTimeout: return "Process start timed out";
        case ErrorCode::ProcessStopTimeout: return "Process stop timed out";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Validation errors are detected before any side effect.
constexpr bool isValidationError(ErrorCode error) {
    return error == ErrorCode::InvalidIdentifier || error == ErrorCode::DuplicateSite ||
           error == ErrorCode::NotFound || error == ErrorCode::InvalidArgument;
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace dsm

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<dsm::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext> auto format(dsm::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", dsm::errorToString(error));
    }
};
