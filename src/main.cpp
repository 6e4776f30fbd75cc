#include "archive.hpp"
#include "cache.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "metadata.hpp"
#include "mime.hpp"
#include "sanitizer.hpp"
#include "updater.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <format>
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace {

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << "Commands:" << std::endl;
    std::cerr << "  check        Report whether a newer release is available" << std::endl;
    std::cerr << "  info         Show the plugin details record" << std::endl;
    std::cerr << "  resolve      Print the resolved metadata of the latest release" << std::endl;
    std::cerr << "  clear-cache  Drop cached release and metadata entries" << std::endl;
}

std::string required_option(const cxxopts::ParseResult& result, const std::string& name) {
    if (!result.count(name)) {
        throw ConfigError(std::format("Missing required option --{}", name));
    }
    return result[name].as<std::string>();
}

Config build_config(const cxxopts::ParseResult& result) {
    std::map<std::string, std::string> options;
    if (result.count("config")) {
        options = load_config_file(result["config"].as<std::string>());
    }
    if (result.count("token")) {
        options["auth"] = result["token"].as<std::string>();
    }
    if (result.count("slug")) {
        options["slug"] = result["slug"].as<std::string>();
    }
    if (result["prefer-archive"].as<bool>()) {
        options["prefer_json"] = "false";
    }
    return make_config(options);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        cxxopts::Options options(argv[0]);
        options.custom_help("[options] <check|info|resolve|clear-cache>");
        options.set_width(100);

        options.add_options()
            ("h,help", "Show this help")
            ("plugin", "Plugin file reference, e.g. my-plugin/my-plugin.php", cxxopts::value<std::string>())
            ("repo", "Repository as owner/repo", cxxopts::value<std::string>())
            ("installed", "Installed plugin version", cxxopts::value<std::string>()->default_value("0.0.0"))
            ("host-version", "Host application version", cxxopts::value<std::string>()->default_value(""))
            ("token", "Access token for private repositories", cxxopts::value<std::string>())
            ("slug", "Override the slug derived from --plugin", cxxopts::value<std::string>())
            ("config", "Read options from a key = value file", cxxopts::value<std::string>())
            ("cache-dir", "Cache directory", cxxopts::value<std::string>())
            ("prefer-archive", "Parse the release archive before plugin.json", cxxopts::value<bool>()->default_value("false"))
            ("v,verbose", "Log debug output", cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result["verbose"].as<bool>()) {
            set_log_level(LogLevel::DEBUG);
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }
        const std::string& command = result["command"].as<std::string>();

        const Config config = build_config(result);
        const Identity identity = make_identity(required_option(result, "plugin"), required_option(result, "repo"), config);

        const fs::path cache_dir = result.count("cache-dir") ? fs::path(result["cache-dir"].as<std::string>()) : default_cache_dir();
        FileCacheStore cache(cache_dir);
        CurlHttpClient http;
        ZipExtractor extractor;
        AllowlistSanitizer sanitizer;
        std::unique_ptr<MimeSniffer> sniffer = make_default_sniffer();

        UpdaterRegistry registry({http, cache, extractor, sanitizer, sniffer.get()});
        Updater& updater = registry.get_or_create(identity, config);

        if (command == "check") {
            const std::string installed = result["installed"].as<std::string>();
            auto decision = updater.check_for_update(installed, result["host-version"].as<std::string>());
            if (!decision) {
                std::cout << std::format("{} {} is up to date", identity.slug, installed) << std::endl;
                return 0;
            }
            std::cout << to_json(*decision).dump(2) << std::endl;
        } else if (command == "info") {
            auto info = updater.plugin_information(identity.slug);
            if (!info) {
                throw PlugupException(std::format("No plugin information available for {}", identity.repository));
            }
            std::cout << encode_metadata(*info).dump(2) << std::endl;
        } else if (command == "resolve") {
            auto metadata = updater.resolve_metadata();
            if (!metadata) {
                throw PlugupException(std::format("Failed to resolve metadata for {}", identity.repository));
            }
            std::cout << encode_metadata(*metadata).dump(2) << std::endl;
        } else if (command == "clear-cache") {
            registry.on_update_applied({identity.plugin});
            std::cout << std::format("Cleared cache for {}", identity.slug) << std::endl;
        } else {
            print_usage(options);
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(std::format("Failed to parse command line: {}", e.what()));
        return 1;
    } catch (const PlugupException& e) {
        log_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        log_error(std::format("Unexpected error: {}", e.what()));
        return 1;
    }

    return 0;
}
