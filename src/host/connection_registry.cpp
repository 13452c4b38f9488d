#include <opf/host/connection_registry.h>

#include <spdlog/spdlog.h>
#include <condition_variable>
#include <mutex>

namespace opf::host {

ConnectionRegistry::ConnectionRegistry(size_t maxConnections,
                                       std::shared_ptr<IConnectionHandler> handler)
    : maxConnections_(maxConnections),
      handler_(handler ? std::move(handler) : std::make_shared<NoOpConnectionHandler>()) {}

Result<uint64_t> ConnectionRegistry::insert(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Capacity is checked before replacement, so re-registering a name at
    // capacity is rejected as well.
    if (entries_.size() >= maxConnections_) {
        return Error{ErrorCode::ResourceExhausted, "max plugin connections reached"};
    }

    const auto now = std::chrono::system_clock::now();
    const uint64_t generation = nextGeneration_++;
    auto [it, inserted] = entries_.insert_or_assign(name, Entry{now, now, Context{}, generation});
    if (!inserted) {
        spdlog::warn("ConnectionRegistry: plugin '{}' re-registered, replacing previous entry",
                     name);
    }
    return generation;
}

bool ConnectionRegistry::remove(const std::string& name, uint64_t generation) {
    std::optional<Context> signal;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end() || it->second.generation != generation) {
            return false;
        }
        signal = it->second.closeSignal;
        entries_.erase(it);
    }
    signal->cancel();
    return true;
}

Result<void> ConnectionRegistry::attach(const Context& lifetime, const std::string& name,
                                        std::function<void()> onAttached) {
    if (lifetime.done()) {
        return lifetime.err();
    }

    auto generation = insert(name);
    if (!generation) {
        spdlog::warn("ConnectionRegistry: rejected plugin '{}': {}", name,
                     generation.error().message);
        return generation.error();
    }

    auto connected = handler_->onConnect(name);
    if (!connected) {
        remove(name, generation.value());
        spdlog::warn("ConnectionRegistry: onConnect rejected plugin '{}': {}", name,
                     connected.error().message);
        return connected.error();
    }

    spdlog::info("ConnectionRegistry: plugin '{}' attached ({} connected)", name, count());

    if (onAttached) {
        onAttached();
    }

    {
        std::mutex waitMutex;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(waitMutex);
        lifetime.wait(cv, lock, [] { return false; });
    }

    if (remove(name, generation.value())) {
        auto disconnected = handler_->onDisconnect(name);
        if (!disconnected) {
            spdlog::warn("ConnectionRegistry: onDisconnect for '{}' failed: {}", name,
                         disconnected.error().message);
        }
        spdlog::info("ConnectionRegistry: plugin '{}' detached ({} connected)", name, count());
    } else {
        spdlog::debug("ConnectionRegistry: stale connection for '{}' ended", name);
    }

    return lifetime.err();
}

bool ConnectionRegistry::isAttached(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.find(name) != entries_.end();
}

std::vector<std::string> ConnectionRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        names.push_back(name);
    }
    return names;
}

size_t ConnectionRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::optional<ConnectionInfo> ConnectionRegistry::info(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const auto& entry = it->second;
    return ConnectionInfo{name, entry.connectedAt, entry.lastMessageAt,
                          std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::system_clock::now() - entry.connectedAt)};
}

void ConnectionRegistry::touch(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it != entries_.end()) {
        it->second.lastMessageAt = std::chrono::system_clock::now();
    }
}

std::vector<std::string>
ConnectionRegistry::idleConnections(std::chrono::milliseconds idleTimeout) const {
    const auto cutoff = std::chrono::system_clock::now() - idleTimeout;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> idle;
    for (const auto& [name, entry] : entries_) {
        if (entry.lastMessageAt < cutoff) {
            idle.push_back(name);
        }
    }
    return idle;
}

std::optional<Context> ConnectionRegistry::closeSignal(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.closeSignal;
}

} // namespace opf::host
