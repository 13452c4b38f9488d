#pragma once

#include <opf/core/types.h>

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace opf::host {

// Application-defined descriptor for a plugin the host knows how to use.
class IPluginProvider {
public:
    virtual ~IPluginProvider() = default;
    virtual std::string name() const = 0;
};

/**
 * Name to provider map for application code. Independent of which plugins are
 * currently connected (see ConnectionRegistry). Thread-safe.
 */
class PluginRegistry {
public:
    // Replaces any provider already registered under name.
    void registerPlugin(const std::string& name, std::shared_ptr<IPluginProvider> provider);
    void unregisterPlugin(const std::string& name);

    Result<std::shared_ptr<IPluginProvider>> get(const std::string& name) const;
    std::map<std::string, std::shared_ptr<IPluginProvider>> getAll() const;
    std::vector<std::string> list() const;
    size_t count() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<IPluginProvider>> plugins_;
};

} // namespace opf::host
