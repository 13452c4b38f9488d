#include <opf/auth/token_provider.h>
#include <opf/config/config_helpers.h>

#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <system_error>

namespace opf::auth {

Result<std::string> StaticTokenProvider::getToken() {
    if (token_.empty()) {
        return Error{ErrorCode::InvalidArgument, "static token is empty"};
    }
    return token_;
}

Result<std::string> FileTokenProvider::getToken() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return Error{ErrorCode::FileNotFound, "token file not found: " + path_.string()};
    }

    std::ifstream file(path_);
    if (!file) {
        return Error{ErrorCode::PermissionDenied, "cannot read token file: " + path_.string()};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string token = buffer.str();
    config::rtrim(token);
    if (token.empty()) {
        return Error{ErrorCode::InvalidData, "token file is empty: " + path_.string()};
    }
    return token;
}

Result<protocol::Metadata> bearerMetadata(ITokenProvider& provider) {
    auto token = provider.getToken();
    if (!token) {
        spdlog::warn("TokenProvider: failed to obtain token: {}", token.error().message);
        return token.error();
    }
    return protocol::Metadata{{kAuthorizationKey, std::string(kBearerPrefix) + token.value()}};
}

Result<std::string> bearerToken(const protocol::Metadata& metadata) {
    auto it = metadata.find(kAuthorizationKey);
    if (it == metadata.end()) {
        return Error{ErrorCode::Unauthenticated, "missing authorization metadata"};
    }
    const std::string_view value = it->second;
    const std::string_view prefix = kBearerPrefix;
    if (!value.starts_with(prefix) || value.size() == prefix.size()) {
        return Error{ErrorCode::Unauthenticated, "authorization is not a bearer token"};
    }
    return std::string(value.substr(prefix.size()));
}

} // namespace opf::auth
