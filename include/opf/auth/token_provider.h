#pragma once

#include <opf/core/types.h>
#include <opf/protocol/envelope_codec.h>

#include <filesystem>
#include <memory>
#include <string>

namespace opf::auth {

inline constexpr const char* kAuthorizationKey = "authorization";
inline constexpr const char* kBearerPrefix = "Bearer ";
inline constexpr const char* kServiceAccountTokenPath =
    "/var/run/secrets/kubernetes.io/serviceaccount/token";

// Source of the bearer token presented when a plugin connects.
class ITokenProvider {
public:
    virtual ~ITokenProvider() = default;
    virtual Result<std::string> getToken() = 0;
};

class StaticTokenProvider final : public ITokenProvider {
public:
    explicit StaticTokenProvider(std::string token) : token_(std::move(token)) {}

    Result<std::string> getToken() override;

private:
    std::string token_;
};

/**
 * Reads the token from a file on every call, so rotated tokens are picked up.
 * Trailing whitespace is trimmed.
 */
class FileTokenProvider final : public ITokenProvider {
public:
    explicit FileTokenProvider(std::filesystem::path path = kServiceAccountTokenPath)
        : path_(std::move(path)) {}

    Result<std::string> getToken() override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// {"authorization": "Bearer <token>"}
Result<protocol::Metadata> bearerMetadata(ITokenProvider& provider);

// Extract the token from handshake metadata; Unauthenticated when absent or malformed.
Result<std::string> bearerToken(const protocol::Metadata& metadata);

} // namespace opf::auth
