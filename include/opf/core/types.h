#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace opf {

using Bytes = std::vector<uint8_t>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error codes shared by every layer. Codes that cross the wire map to a
// protocol error code in protocol/envelope.h.
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidAddress,
    InvalidData,
    InvalidState,
    ProtocolViolation,
    ResourceExhausted,
    Unauthenticated,
    NotFound,
    NotImplemented,
    NotSupported,
    FileNotFound,
    PermissionDenied,
    SerializationError,
    RemoteError,
    NetworkError,
    StreamClosed,
    OperationCancelled,
    Timeout,
    InternalError,
    Unknown
};

constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidAddress: return "Invalid address";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::ProtocolViolation: return "Protocol violation";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::Unauthenticated: return "Unauthenticated";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotImplemented: return "Not implemented";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::SerializationError: return "Serialization error";
        case ErrorCode::RemoteError: return "Remote error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::StreamClosed: return "Stream closed";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Failure detail carried by Result. The message is what ends up on the wire
// and in logs, so it should name the operation that failed.
struct Error {
    ErrorCode code{ErrorCode::Success};
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
};

namespace detail {
[[noreturn]] inline void throwBadResultAccess(const Error& error) {
    throw std::runtime_error(std::string("Result holds error: ") + error.message);
}
[[noreturn]] inline void throwNoError() {
    throw std::runtime_error("Result holds a value, not an error");
}
} // namespace detail

// Value-or-error return used across the library instead of exceptions.
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        check();
        return *std::get_if<T>(&data_);
    }
    T& value() & {
        check();
        return *std::get_if<T>(&data_);
    }
    T&& value() && {
        check();
        return std::move(*std::get_if<T>(&data_));
    }

    const Error& error() const {
        if (has_value()) {
            detail::throwNoError();
        }
        return *std::get_if<Error>(&data_);
    }

private:
    void check() const {
        if (!has_value()) {
            detail::throwBadResultAccess(*std::get_if<Error>(&data_));
        }
    }

    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            detail::throwBadResultAccess(error_);
        }
    }

    const Error& error() const {
        if (has_value()) {
            detail::throwNoError();
        }
        return error_;
    }

private:
    Error error_;
};

} // namespace opf

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<opf::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext> auto format(opf::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", opf::errorToString(error));
    }
};
#endif

namespace opf {

// Protocol defaults
inline constexpr size_t DEFAULT_MAX_CONNECTIONS = 100;
inline constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 10 * 1024 * 1024; // 10 MiB
inline constexpr std::chrono::minutes DEFAULT_IDLE_TIMEOUT{5};
inline constexpr std::chrono::seconds DEFAULT_WRITE_TIMEOUT{30};

} // namespace opf
