#include <opf/host/plugin_registry.h>

#include <spdlog/spdlog.h>
#include <mutex>

namespace opf::host {

void PluginRegistry::registerPlugin(const std::string& name,
                                    std::shared_ptr<IPluginProvider> provider) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    spdlog::info("PluginRegistry: registering plugin '{}'", name);
    plugins_[name] = std::move(provider);
}

void PluginRegistry::unregisterPlugin(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    spdlog::info("PluginRegistry: unregistering plugin '{}'", name);
    plugins_.erase(name);
}

Result<std::shared_ptr<IPluginProvider>> PluginRegistry::get(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = plugins_.find(name);
    if (it == plugins_.end()) {
        return Error{ErrorCode::NotFound, "plugin not found: " + name};
    }
    return it->second;
}

std::map<std::string, std::shared_ptr<IPluginProvider>> PluginRegistry::getAll() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return plugins_;
}

std::vector<std::string> PluginRegistry::list() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(plugins_.size());
    for (const auto& [name, provider] : plugins_) {
        names.push_back(name);
    }
    return names;
}

size_t PluginRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return plugins_.size();
}

} // namespace opf::host
