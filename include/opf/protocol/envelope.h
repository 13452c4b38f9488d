#pragma once

#include <opf/core/types.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace opf::protocol {

// ============================================================================
// Envelope Payloads
// ============================================================================

struct RegisterMessage {
    std::string name;
    std::string version;

    bool operator==(const RegisterMessage&) const = default;
};

struct RpcCall {
    std::string requestId;
    std::string method;
    Bytes payload;

    bool operator==(const RpcCall&) const = default;
};

struct RpcResponse {
    std::string requestId;
    Bytes payload;

    bool operator==(const RpcResponse&) const = default;
};

struct ErrorMessage {
    std::string code;
    std::string message;
    // Empty when the error is connection scoped rather than tied to a call.
    std::string requestId;

    bool operator==(const ErrorMessage&) const = default;
};

using EnvelopePayload = std::variant<RegisterMessage, RpcCall, RpcResponse, ErrorMessage>;

struct Envelope {
    EnvelopePayload payload;

    bool operator==(const Envelope&) const = default;

    bool isRegister() const noexcept { return std::holds_alternative<RegisterMessage>(payload); }
    bool isCall() const noexcept { return std::holds_alternative<RpcCall>(payload); }
    bool isResponse() const noexcept { return std::holds_alternative<RpcResponse>(payload); }
    bool isError() const noexcept { return std::holds_alternative<ErrorMessage>(payload); }

    const RegisterMessage* asRegister() const noexcept {
        return std::get_if<RegisterMessage>(&payload);
    }
    const RpcCall* asCall() const noexcept { return std::get_if<RpcCall>(&payload); }
    const RpcResponse* asResponse() const noexcept { return std::get_if<RpcResponse>(&payload); }
    const ErrorMessage* asError() const noexcept { return std::get_if<ErrorMessage>(&payload); }
};

// Human-readable payload kind, for logs.
const char* envelopeKind(const Envelope& env) noexcept;

inline Envelope makeRegister(std::string name, std::string version) {
    return Envelope{RegisterMessage{std::move(name), std::move(version)}};
}

inline Envelope makeCall(std::string requestId, std::string method, Bytes payload) {
    return Envelope{RpcCall{std::move(requestId), std::move(method), std::move(payload)}};
}

inline Envelope makeResponse(std::string requestId, Bytes payload) {
    return Envelope{RpcResponse{std::move(requestId), std::move(payload)}};
}

inline Envelope makeError(std::string code, std::string message, std::string requestId = {}) {
    return Envelope{ErrorMessage{std::move(code), std::move(message), std::move(requestId)}};
}

// ============================================================================
// Wire error codes
// ============================================================================

namespace wire {
inline constexpr std::string_view kRpcError = "RPC_ERROR";
inline constexpr std::string_view kMarshalError = "MARSHAL_ERROR";
inline constexpr std::string_view kUnimplemented = "Unimplemented";
inline constexpr std::string_view kInvalidArgument = "INVALID_ARGUMENT";
inline constexpr std::string_view kResourceExhausted = "RESOURCE_EXHAUSTED";
inline constexpr std::string_view kUnauthenticated = "UNAUTHENTICATED";
// Call dropped by the plugin without running its handler.
inline constexpr std::string_view kCancelled = "CANCELLED";
} // namespace wire

// Map an in-band Error envelope to a local Error.
Error errorFromWire(const ErrorMessage& msg);

// Pick the wire code used to report a local handler failure.
std::string_view wireCodeFor(ErrorCode code) noexcept;

} // namespace opf::protocol
