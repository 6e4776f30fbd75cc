#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

// Update target: which installed plugin file is checked against which repository.
struct Identity {
    std::string plugin;      // package-file-reference, e.g. "my-plugin/my-plugin.php"
    std::string repository;  // "owner/repo"
    std::string slug;        // cache namespace
};

struct Config {
    std::string auth;        // bearer token, empty when anonymous
    std::string slug;        // overrides the slug derived from the plugin path
    bool prefer_json = true;
    long long cache_duration = 21600;
    long timeout = 30;
    std::uintmax_t max_file_size = 52428800;
    std::string api_base_url = "https://api.github.com";
};

// Builds a Config from loose options. Unknown keys or bad values throw ConfigError.
Config make_config(const std::map<std::string, std::string>& options);

// Reads "key = value" lines ('#' comments allowed) into an options map.
std::map<std::string, std::string> load_config_file(const std::filesystem::path& path);

// Validates the references and derives the slug. Throws ConfigError.
Identity make_identity(const std::string& plugin, const std::string& repository, const Config& config = {});

std::filesystem::path default_cache_dir();
