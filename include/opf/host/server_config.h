#pragma once

#include <opf/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace opf::host {

struct ServerConfig {
    // Validates the bearer token presented in the socket handshake.
    using TokenValidator = std::function<Result<void>(const std::string& token)>;

    std::string listenAddress = "unix:///tmp/opf.sock";
    size_t maxConnections = DEFAULT_MAX_CONNECTIONS;
    std::chrono::milliseconds idleTimeout = DEFAULT_IDLE_TIMEOUT;
    std::chrono::milliseconds idleCheckInterval = std::chrono::seconds(30);
    size_t maxMessageSize = DEFAULT_MAX_MESSAGE_SIZE;
    // Bound on one blocking socket write to a plugin.
    std::chrono::milliseconds writeTimeout = DEFAULT_WRITE_TIMEOUT;
    size_t ioThreads = 2;
    // Empty: connections are not authenticated.
    TokenValidator tokenValidator;

    /**
     * Read the [server] section of a flat TOML file on top of the defaults.
     * A missing file yields the defaults.
     */
    static ServerConfig fromFile(const std::filesystem::path& path);

    // Defaults, then the resolved config file (if any), then environment overrides.
    static ServerConfig load();

    void applyEnvOverrides();
};

} // namespace opf::host
