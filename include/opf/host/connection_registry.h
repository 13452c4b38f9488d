#pragma once

#include <opf/core/context.h>
#include <opf/core/types.h>
#include <opf/host/connection_handler.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace opf::host {

struct ConnectionInfo {
    std::string name;
    TimePoint connectedAt;
    TimePoint lastMessageAt;
    std::chrono::milliseconds uptime{0};
};

/**
 * Named set of attached plugins, bounded by maxConnections.
 *
 * attach() admits and inserts in one critical section, so concurrent
 * registrations can never overshoot the bound. A second registration under an
 * existing name replaces the entry; the replaced connection keeps running but
 * no longer owns the entry, and its detach neither removes the newer entry
 * nor fires onDisconnect.
 *
 * Thread-safe.
 */
class ConnectionRegistry {
public:
    explicit ConnectionRegistry(size_t maxConnections = DEFAULT_MAX_CONNECTIONS,
                                std::shared_ptr<IConnectionHandler> handler = nullptr);

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * Admit name and hold the entry until lifetime is done.
     *
     * Fails immediately with ResourceExhausted at capacity, or with the
     * handler's error when onConnect rejects the plugin. Otherwise runs
     * onAttached, blocks until lifetime is cancelled or expires, removes the
     * entry and returns lifetime's ending condition.
     */
    Result<void> attach(const Context& lifetime, const std::string& name,
                        std::function<void()> onAttached = {});

    bool isAttached(const std::string& name) const;
    std::vector<std::string> list() const;
    size_t count() const;
    std::optional<ConnectionInfo> info(const std::string& name) const;

    // Record activity; unknown names are ignored.
    void touch(const std::string& name);

    // Names with no activity for longer than idleTimeout.
    std::vector<std::string> idleConnections(std::chrono::milliseconds idleTimeout) const;

    // Cancelled when the entry is removed.
    std::optional<Context> closeSignal(const std::string& name) const;

    size_t maxConnections() const noexcept { return maxConnections_; }

private:
    struct Entry {
        TimePoint connectedAt;
        TimePoint lastMessageAt;
        Context closeSignal;
        uint64_t generation = 0;
    };

    Result<uint64_t> insert(const std::string& name);
    bool remove(const std::string& name, uint64_t generation);

    const size_t maxConnections_;
    std::shared_ptr<IConnectionHandler> handler_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t nextGeneration_ = 1;
};

} // namespace opf::host
