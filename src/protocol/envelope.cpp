#include <opf/protocol/envelope.h>

#include <string>

namespace opf::protocol {

const char* envelopeKind(const Envelope& env) noexcept {
    if (env.isRegister())
        return "Register";
    if (env.isCall())
        return "RpcCall";
    if (env.isResponse())
        return "RpcResponse";
    if (env.isError())
        return "Error";
    return "Unknown";
}

Error errorFromWire(const ErrorMessage& msg) {
    if (msg.code == wire::kRpcError) {
        return Error{ErrorCode::RemoteError, msg.message};
    }
    if (msg.code == wire::kMarshalError) {
        return Error{ErrorCode::SerializationError, msg.message};
    }
    if (msg.code == wire::kUnimplemented) {
        return Error{ErrorCode::NotImplemented, msg.message};
    }
    if (msg.code == wire::kCancelled) {
        return Error{ErrorCode::OperationCancelled, msg.message};
    }
    return Error{ErrorCode::RemoteError, msg.code + ": " + msg.message};
}

std::string_view wireCodeFor(ErrorCode code) noexcept {
    return code == ErrorCode::SerializationError ? wire::kMarshalError : wire::kRpcError;
}

} // namespace opf::protocol
