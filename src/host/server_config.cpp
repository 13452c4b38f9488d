#include <opf/config/config_helpers.h>
#include <opf/host/server_config.h>

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <map>
#include <optional>

namespace opf::host {

namespace {

std::optional<unsigned long long> positive(const std::string& key, const std::string& raw) {
    auto v = config::parseUnsigned(raw);
    if (!v || *v == 0) {
        spdlog::warn("[ServerConfig] Invalid {} value '{}', keeping default", key, raw);
        return std::nullopt;
    }
    return v;
}

void applyValues(ServerConfig& cfg, const std::map<std::string, std::string>& kv,
                 const std::string& prefix) {
    auto get = [&](const char* key) -> const std::string* {
        auto it = kv.find(prefix + key);
        return it != kv.end() && !it->second.empty() ? &it->second : nullptr;
    };

    if (const auto* v = get("listen_address")) {
        cfg.listenAddress = *v;
    }
    if (const auto* v = get("max_connections")) {
        if (auto n = positive(prefix + "max_connections", *v))
            cfg.maxConnections = static_cast<size_t>(*n);
    }
    if (const auto* v = get("idle_timeout_ms")) {
        if (auto n = positive(prefix + "idle_timeout_ms", *v))
            cfg.idleTimeout = std::chrono::milliseconds(*n);
    }
    if (const auto* v = get("idle_check_interval_ms")) {
        if (auto n = positive(prefix + "idle_check_interval_ms", *v))
            cfg.idleCheckInterval = std::chrono::milliseconds(*n);
    }
    if (const auto* v = get("write_timeout_ms")) {
        if (auto n = positive(prefix + "write_timeout_ms", *v))
            cfg.writeTimeout = std::chrono::milliseconds(*n);
    }
    if (const auto* v = get("max_message_size")) {
        if (auto n = positive(prefix + "max_message_size", *v))
            cfg.maxMessageSize = static_cast<size_t>(*n);
    }
    if (const auto* v = get("io_threads")) {
        if (auto n = positive(prefix + "io_threads", *v))
            cfg.ioThreads = static_cast<size_t>(*n);
    }
}

} // namespace

ServerConfig ServerConfig::fromFile(const std::filesystem::path& path) {
    ServerConfig cfg;
    auto kv = config::parseSimpleTomlFlat(path);
    if (kv.empty()) {
        spdlog::debug("[ServerConfig] No settings read from {}", path.string());
        return cfg;
    }
    applyValues(cfg, kv, "server.");
    return cfg;
}

ServerConfig ServerConfig::load() {
    ServerConfig cfg;
    auto path = config::resolveDefaultConfigPath();
    if (!path.empty()) {
        spdlog::info("[ServerConfig] Using config file {}", path.string());
        cfg = fromFile(path);
    }
    cfg.applyEnvOverrides();
    return cfg;
}

void ServerConfig::applyEnvOverrides() {
    std::map<std::string, std::string> kv;
    auto take = [&kv](const char* env, const char* key) {
        if (const char* v = std::getenv(env)) {
            kv[key] = v;
        }
    };
    take("OPF_LISTEN_ADDRESS", "listen_address");
    take("OPF_MAX_CONNECTIONS", "max_connections");
    take("OPF_IDLE_TIMEOUT_MS", "idle_timeout_ms");
    take("OPF_MAX_MESSAGE_SIZE", "max_message_size");
    take("OPF_WRITE_TIMEOUT_MS", "write_timeout_ms");
    applyValues(*this, kv, "");
}

} // namespace opf::host
