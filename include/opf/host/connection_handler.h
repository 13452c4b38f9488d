#pragma once

#include <opf/core/types.h>

#include <string>

namespace opf::host {

/**
 * Lifecycle hooks for plugin connections.
 *
 * onConnect runs after admission accepts a registration; a failure rejects the
 * connection and onDisconnect is not called for it. onDisconnect runs once the
 * connection's entry has been removed; its error is only logged.
 * Both are called outside the registry lock.
 */
class IConnectionHandler {
public:
    virtual ~IConnectionHandler() = default;

    virtual Result<void> onConnect(const std::string& pluginName) = 0;
    virtual Result<void> onDisconnect(const std::string& pluginName) = 0;
};

class NoOpConnectionHandler final : public IConnectionHandler {
public:
    Result<void> onConnect(const std::string&) override { return Result<void>(); }
    Result<void> onDisconnect(const std::string&) override { return Result<void>(); }
};

} // namespace opf::host
