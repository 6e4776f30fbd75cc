#include "metadata.hpp"
#include "archive.hpp"
#include "archive_validator.hpp"
#include "cache.hpp"
#include "downloader.hpp"
#include "hash.hpp"
#include "plugin_header.hpp"
#include "sanitizer.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <format>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Section name -> candidate file names, tried in order.
const std::vector<std::pair<std::string, std::vector<std::string>>> SECTION_FILES = {
    {"description", {"description.md", "description.txt", "README.md"}},
    {"installation", {"installation.md", "installation.txt"}},
    {"faq", {"faq.md", "faq.txt"}},
    {"screenshots", {"screenshots.md", "screenshots.txt"}},
    {"changelog", {"changelog.md", "changelog.txt", "CHANGELOG.md"}},
    {"reviews", {"reviews.md", "reviews.txt"}},
};

constexpr std::array<const char*, 3> REQUIRED_SIDECAR_FIELDS = {"name", "version", "slug"};

std::string string_field(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

StringMap map_field(const json& doc, const char* key) {
    StringMap out;
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_object()) return out;
    for (const auto& [k, v] : it->items()) {
        if (v.is_string()) out[k] = v.get<std::string>();
    }
    return out;
}

json asset_names(const RawRelease& release) {
    json names = json::array();
    for (const auto& asset : release.assets) names.push_back(asset.name);
    return names;
}

} // anonymous namespace

json encode_metadata(const ResolvedMetadata& m) {
    return json{
        {"name", m.name},
        {"slug", m.slug},
        {"version", m.version},
        {"tested", m.tested_up_to},
        {"requires", m.minimum_host_version},
        {"requires_php", m.minimum_runtime_version},
        {"author", m.author},
        {"author_profile", m.author_profile_url},
        {"last_updated", m.last_updated},
        {"download_link", m.download_url},
        {"trunk", m.trunk_url},
        {"sections", m.sections},
        {"banners", m.banners},
        {"icons", m.icons},
        {"upgrade_notice", m.upgrade_notice},
    };
}

ResolvedMetadata decode_metadata(const json& doc) {
    ResolvedMetadata m;
    if (!doc.is_object()) return m;
    m.name = string_field(doc, "name");
    m.slug = string_field(doc, "slug");
    m.version = string_field(doc, "version");
    m.tested_up_to = string_field(doc, "tested");
    m.minimum_host_version = string_field(doc, "requires");
    m.minimum_runtime_version = string_field(doc, "requires_php");
    m.author = string_field(doc, "author");
    m.author_profile_url = string_field(doc, "author_profile");
    m.last_updated = string_field(doc, "last_updated");
    m.download_url = string_field(doc, "download_link");
    m.trunk_url = string_field(doc, "trunk");
    m.sections = map_field(doc, "sections");
    m.banners = map_field(doc, "banners");
    m.icons = map_field(doc, "icons");
    m.upgrade_notice = string_field(doc, "upgrade_notice");
    return m;
}

MetadataResolver::MetadataResolver(ResolverServices services, fs::path temp_root)
    : services_(services), fetcher_(services.http, services.cache), temp_root_(std::move(temp_root)) {}

std::optional<RawRelease> MetadataResolver::latest_release(const Identity& identity, const Config& config) {
    try {
        return fetcher_.fetch_latest_release(identity, config);
    } catch (const FetchError& e) {
        json context = to_json_context(e.failure());
        context["repository"] = identity.repository;
        context["plugin"] = identity.plugin;
        log_error(e.what(), context);
    } catch (const std::exception& e) {
        log_error("Release lookup failed", {{"repository", identity.repository}, {"error", e.what()}});
    }
    return std::nullopt;
}

std::optional<ResolvedMetadata> MetadataResolver::resolve_metadata(const Identity& identity, const Config& config) {
    auto release = latest_release(identity, config);
    if (!release) {
        log_error("No release data available", {{"repository", identity.repository}});
        return std::nullopt;
    }

    if (config.prefer_json) {
        log_debug("Attempting JSON metadata", {{"slug", identity.slug}});
        if (auto metadata = json_metadata(identity, config, *release)) {
            log_info("Resolved metadata from plugin.json", {{"version", metadata->version}});
            return metadata;
        }
        log_info("JSON metadata not available, falling back to archive parsing", {{"slug", identity.slug}});
    }

    if (auto metadata = archive_metadata(identity, config, *release)) {
        metadata->last_updated = release->published_at;
        log_info("Resolved metadata from release archive", {{"version", metadata->version}});
        return metadata;
    }

    // Archive-first configurations still get the sidecar as a last resort.
    if (!config.prefer_json) {
        log_debug("Attempting JSON metadata as last resort", {{"slug", identity.slug}});
        if (auto metadata = json_metadata(identity, config, *release)) {
            log_info("Resolved metadata from plugin.json on fallback", {{"version", metadata->version}});
            return metadata;
        }
    }

    log_error("All metadata retrieval methods failed", {
        {"repository", identity.repository},
        {"prefer_json", config.prefer_json},
    });
    return std::nullopt;
}

std::optional<ResolvedMetadata> MetadataResolver::cached_metadata(const std::string& key) {
    auto cached = services_.cache.get(key);
    if (!cached) return std::nullopt;
    try {
        json doc = json::parse(*cached);
        if (doc.is_object()) return decode_metadata(doc);
    } catch (const json::exception& e) {
        log_warning("Discarding unreadable cached metadata", {{"key", key}, {"error", e.what()}});
    }
    services_.cache.remove(key);
    return std::nullopt;
}

void MetadataResolver::store_metadata(const std::string& key, const ResolvedMetadata& metadata, const Config& config) {
    try {
        services_.cache.set(key, encode_metadata(metadata).dump(), std::chrono::seconds(config.cache_duration));
    } catch (const std::exception& e) {
        log_warning("Failed to cache metadata", {{"key", key}, {"error", e.what()}});
    }
}

std::optional<ResolvedMetadata> MetadataResolver::json_metadata(const Identity& identity, const Config& config, const RawRelease& release) {
    if (release.assets.empty()) {
        return std::nullopt;
    }

    const std::string key = cache_key(CacheEntry::JSON, identity.slug);
    if (auto cached = cached_metadata(key)) {
        return cached;
    }

    for (const auto& asset : release.assets) {
        if (!iequals(asset.name, "plugin.json")) continue;
        if (auto metadata = fetch_sidecar(asset, identity, config, release)) {
            store_metadata(key, *metadata, config);
            return metadata;
        }
    }

    log_warning("No valid plugin.json found in release assets", {{"available_assets", asset_names(release)}});
    return std::nullopt;
}

std::optional<ResolvedMetadata> MetadataResolver::fetch_sidecar(const Asset& asset, const Identity& identity, const Config& config, const RawRelease& release) {
    HttpResponse response;
    try {
        response = services_.http.get(asset.download_url, request_headers(config), config.timeout);
    } catch (const TransportError& e) {
        log_error("Failed to fetch plugin.json", {{"asset_url", asset.download_url}, {"error", e.what()}});
        return std::nullopt;
    }
    if (response.status != 200) {
        log_error("Failed to fetch plugin.json", {{"asset_url", asset.download_url}, {"response_code", response.status}});
        return std::nullopt;
    }

    json doc;
    try {
        doc = json::parse(response.body);
    } catch (const json::parse_error& e) {
        log_error("Invalid JSON format in plugin.json", {
            {"asset_url", asset.download_url},
            {"json_error", e.what()},
            {"raw_content", response.body.substr(0, 500)},
        });
        return std::nullopt;
    }

    if (!doc.is_object() || doc.empty()) {
        log_error("Empty JSON data in plugin.json", {{"asset_url", asset.download_url}});
        return std::nullopt;
    }

    json missing = json::array();
    for (const char* field : REQUIRED_SIDECAR_FIELDS) {
        if (string_field(doc, field).empty()) missing.push_back(field);
    }
    if (!missing.empty()) {
        json available = json::array();
        for (const auto& item : doc.items()) available.push_back(item.key());
        log_error("Missing required fields in plugin.json", {
            {"asset_url", asset.download_url},
            {"missing_fields", missing},
            {"available_fields", available},
        });
        return std::nullopt;
    }

    ResolvedMetadata metadata = decode_metadata(doc);
    if (metadata.last_updated.empty()) metadata.last_updated = release.published_at;
    if (metadata.download_url.empty()) metadata.download_url = resolve_download_link(release, identity.slug);
    for (auto& [section, html] : metadata.sections) {
        html = services_.sanitizer.sanitize(html);
    }

    log_info("Loaded metadata from plugin.json", {{"asset_url", asset.download_url}, {"plugin_version", metadata.version}});
    return metadata;
}

std::optional<ResolvedMetadata> MetadataResolver::archive_metadata(const Identity& identity, const Config& config, const RawRelease& release) {
    const std::string key = cache_key(CacheEntry::ARCHIVE, identity.slug);
    if (auto cached = cached_metadata(key)) {
        return cached;
    }

    const Asset* asset = resolve_download_asset(release, identity.slug);
    if (!asset) {
        log_error("No download link found in release", {{"available_assets", asset_names(release)}});
        return std::nullopt;
    }

    std::optional<ResolvedMetadata> metadata;
    try {
        metadata = parse_archive(*asset, identity, config);
    } catch (const std::exception& e) {
        log_error("Archive parsing failed", {{"download_link", asset->download_url}, {"error", e.what()}});
        return std::nullopt;
    }
    if (!metadata) {
        log_error("Archive parsing failed", {{"download_link", asset->download_url}});
        return std::nullopt;
    }

    store_metadata(key, *metadata, config);
    return metadata;
}

// Every temporary path is owned by a ScopedPath, so each return (or throw)
// below leaves nothing behind.
std::optional<ResolvedMetadata> MetadataResolver::parse_archive(const Asset& asset, const Identity& identity, const Config& config) {
    ScopedPath archive_file(make_unique_tmp_path("plugup_download", temp_root_).concat(".zip"));

    try {
        HttpResponse response = services_.http.download(asset.download_url, request_headers(config, "application/octet-stream"),
                                                        archive_file.path(), config.timeout, config.max_file_size);
        if (response.status != 200) {
            log_error("Failed to download plugin archive", {{"download_link", asset.download_url}, {"http_code", response.status}});
            return std::nullopt;
        }
    } catch (const SizeLimitError& e) {
        log_error("Archive validation failed", {
            {"download_link", asset.download_url},
            {"validation_error", std::string(to_string(ArchiveErrorKind::FILE_TOO_LARGE))},
            {"message", e.what()},
        });
        return std::nullopt;
    } catch (const PlugupException& e) {
        log_error("Failed to download plugin archive", {{"download_link", asset.download_url}, {"error", e.what()}});
        return std::nullopt;
    }

    if (asset.digest.starts_with("sha256:")) {
        const std::string expected = to_lower(asset.digest.substr(7));
        const std::string actual = calculate_sha256(archive_file.path());
        if (actual != expected) {
            log_error("Archive checksum mismatch", {{"download_link", asset.download_url}, {"expected", expected}, {"actual", actual}});
            return std::nullopt;
        }
    }

    try {
        validate_archive(archive_file.path(), config.max_file_size, services_.sniffer, &services_.extractor);
    } catch (const ArchiveError& e) {
        log_error("Archive validation failed", {
            {"download_link", asset.download_url},
            {"validation_error", std::string(to_string(e.kind()))},
            {"message", e.what()},
        });
        return std::nullopt;
    }

    ScopedPath extract_dir(make_unique_tmp_path("plugup_extract", temp_root_));
    try {
        ensure_dir_exists(extract_dir.path());
        services_.extractor.extract(archive_file.path(), extract_dir.path());
    } catch (const PlugupException& e) {
        log_error("Failed to extract archive", {
            {"download_link", asset.download_url},
            {"temp_dir", extract_dir.path().string()},
            {"error", e.what()},
        });
        return std::nullopt;
    }
    archive_file.remove();

    fs::path plugin_file;
    try {
        plugin_file = validate_path(identity.plugin, extract_dir.path());
    } catch (const PlugupException& e) {
        log_error("Plugin path is not a safe relative path", {{"plugin", identity.plugin}, {"error", e.what()}});
        return std::nullopt;
    }
    if (!fs::is_regular_file(plugin_file)) {
        log_error("Plugin file not found in extracted archive", {
            {"expected_plugin_file", identity.plugin},
            {"temp_dir", extract_dir.path().string()},
            {"extracted_files", list_entry_names(extract_dir.path())},
        });
        return std::nullopt;
    }

    const PluginHeader header = read_plugin_header(plugin_file);
    ResolvedMetadata metadata;
    metadata.slug = identity.slug;
    metadata.name = header.name;
    metadata.version = header.version;
    metadata.tested_up_to = header.tested_up_to;
    metadata.minimum_host_version = header.requires_at_least;
    metadata.minimum_runtime_version = header.requires_php;
    metadata.author = header.author;
    metadata.author_profile_url = header.author_uri.empty() ? header.plugin_uri : header.author_uri;
    metadata.download_url = asset.download_url;
    metadata.sections = read_sections(plugin_file.parent_path());

    extract_dir.remove();
    return metadata;
}

StringMap MetadataResolver::read_sections(const fs::path& package_dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(package_dir, ec)) {
        if (entry.is_regular_file()) files.push_back(entry.path());
    }

    StringMap sections;
    for (const auto& [section, candidates] : SECTION_FILES) {
        for (const auto& candidate : candidates) {
            auto match = std::ranges::find_if(files, [&](const fs::path& p) { return iequals(p.filename().string(), candidate); });
            if (match == files.end()) continue;
            const std::string content = read_file(*match);
            if (trim(content).empty()) continue;
            sections[section] = services_.sanitizer.sanitize(content);
            break;
        }
    }
    return sections;
}
