#include <opf/config/config_helpers.h>

#include <charconv>
#include <cstdlib>
#include <fstream>

namespace opf::config {

std::optional<unsigned long long> parseUnsigned(std::string_view s) {
    std::string tmp(s);
    trim(tmp);
    if (tmp.empty()) {
        return std::nullopt;
    }
    unsigned long long out = 0;
    const char* first = tmp.data();
    const char* last = tmp.data() + tmp.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return out;
}

std::map<std::string, std::string> parseSimpleTomlFlat(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file)
        return config;

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        auto comment = line.find('#');
        if (comment != std::string::npos)
            line = line.substr(0, comment);
        trim(line);
        if (line.empty())
            continue;

        if (line.front() == '[' && line.back() == ']') {
            currentSection = line.substr(1, line.size() - 2);
            trim(currentSection);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = line.substr(0, eq);
        trim(key);
        std::string value = unquote(line.substr(eq + 1));
        if (!currentSection.empty()) {
            config[currentSection + "." + key] = value;
        } else {
            config[key] = value;
        }
    }
    return config;
}

std::filesystem::path resolveDefaultConfigPath() {
    if (const char* explicitPath = std::getenv("OPF_CONFIG_PATH")) {
        std::filesystem::path p{explicitPath};
        if (std::filesystem::exists(p))
            return p;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        std::filesystem::path p = std::filesystem::path(xdg) / "opf" / "config.toml";
        if (std::filesystem::exists(p))
            return p;
    }
    if (const char* home = std::getenv("HOME")) {
        std::filesystem::path p = std::filesystem::path(home) / ".config" / "opf" / "config.toml";
        if (std::filesystem::exists(p))
            return p;
    }
    return {};
}

} // namespace opf::config
