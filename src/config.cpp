#include "config.hpp"
#include "exception.hpp"
#include "utils.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>

#ifndef PLUGUP_CACHE_DIR
#define PLUGUP_CACHE_DIR "/var/cache/plugup"
#endif

namespace fs = std::filesystem;

namespace {

template <typename T>
T parse_positive(const std::string& key, const std::string& value) {
    T result{};
    const std::string v = trim(value);
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), result);
    if (ec != std::errc{} || ptr != v.data() + v.size() || result <= 0) {
        throw ConfigError(std::format("Option '{}' must be a positive integer, got '{}'", key, value));
    }
    return result;
}

bool parse_bool(const std::string& key, const std::string& value) {
    const std::string v = to_lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError(std::format("Option '{}' must be a boolean, got '{}'", key, value));
}

} // anonymous namespace

Config make_config(const std::map<std::string, std::string>& options) {
    Config config;
    for (const auto& [key, value] : options) {
        if (key == "auth") {
            config.auth = trim(value);
        } else if (key == "slug") {
            config.slug = trim(value);
        } else if (key == "prefer_json") {
            config.prefer_json = parse_bool(key, value);
        } else if (key == "cache_duration") {
            config.cache_duration = parse_positive<long long>(key, value);
        } else if (key == "timeout") {
            config.timeout = parse_positive<long>(key, value);
        } else if (key == "max_file_size") {
            config.max_file_size = parse_positive<std::uintmax_t>(key, value);
        } else if (key == "api_base_url") {
            std::string url = trim(value);
            while (!url.empty() && url.back() == '/') url.pop_back();
            if (url.empty()) {
                throw ConfigError("Option 'api_base_url' must not be empty");
            }
            config.api_base_url = url;
        } else {
            throw ConfigError(std::format("Unknown configuration option '{}'", key));
        }
    }
    return config;
}

std::map<std::string, std::string> load_config_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(std::format("Failed to open configuration file: {}", path.string()));
    }

    std::map<std::string, std::string> options;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped.front() == '#') continue;
        const auto pos = stripped.find('=');
        if (pos == std::string::npos) {
            throw ConfigError(std::format("{}:{}: expected 'key = value'", path.string(), line_no));
        }
        options[trim(std::string_view(stripped).substr(0, pos))] = trim(std::string_view(stripped).substr(pos + 1));
    }
    return options;
}

Identity make_identity(const std::string& plugin, const std::string& repository, const Config& config) {
    if (plugin.empty() || repository.empty()) {
        throw ConfigError("Both the plugin file and the repository are required");
    }

    const auto slash = repository.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == repository.size()
        || repository.find('/', slash + 1) != std::string::npos) {
        throw ConfigError(std::format("Repository must have the form 'owner/repo', got '{}'", repository));
    }

    Identity identity{plugin, repository, config.slug};
    if (identity.slug.empty()) {
        const fs::path p(plugin);
        identity.slug = p.has_parent_path() ? p.parent_path().filename().string() : p.stem().string();
    }
    if (identity.slug.empty()) {
        throw ConfigError(std::format("Cannot derive a slug from '{}'", plugin));
    }
    return identity;
}

fs::path default_cache_dir() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "plugup";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".cache" / "plugup";
    }
    return PLUGUP_CACHE_DIR;
}
