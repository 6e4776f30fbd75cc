#pragma once

#include "config.hpp"
#include "release.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

class ArchiveExtractor;
class CacheStore;
class HtmlSanitizer;
class HttpClient;
class MimeSniffer;

using StringMap = std::map<std::string, std::string>;

// Canonical description of the latest release. Optional fields are empty, never absent.
struct ResolvedMetadata {
    std::string name;
    std::string slug;
    std::string version;
    std::string tested_up_to;
    std::string minimum_host_version;
    std::string minimum_runtime_version;
    std::string author;
    std::string author_profile_url;
    std::string last_updated;
    std::string download_url;
    std::string trunk_url;
    StringMap sections;  // section name -> sanitized HTML
    StringMap banners;
    StringMap icons;
    std::string upgrade_notice;
};

// Sidecar (plugin.json) field names; also the cache representation.
nlohmann::json encode_metadata(const ResolvedMetadata& metadata);

// Lenient decoding: non-string scalars read as "", non-string map values are dropped.
ResolvedMetadata decode_metadata(const nlohmann::json& doc);

// Collaborators shared by every updater of a host.
struct ResolverServices {
    HttpClient& http;
    CacheStore& cache;
    ArchiveExtractor& extractor;
    HtmlSanitizer& sanitizer;
    MimeSniffer* sniffer = nullptr;  // optional MIME check in archive validation
};

class MetadataResolver {
public:
    explicit MetadataResolver(ResolverServices services, std::filesystem::path temp_root = {});

    // JSON sidecar first (or archive first when config.prefer_json is false),
    // then the other path. Failures are logged; nullopt when nothing resolved.
    std::optional<ResolvedMetadata> resolve_metadata(const Identity& identity, const Config& config);

    // Latest release via the cache-backed fetcher; nullopt (logged) on failure.
    std::optional<RawRelease> latest_release(const Identity& identity, const Config& config);

    std::optional<ResolvedMetadata> json_metadata(const Identity& identity, const Config& config, const RawRelease& release);
    std::optional<ResolvedMetadata> archive_metadata(const Identity& identity, const Config& config, const RawRelease& release);

private:
    std::optional<ResolvedMetadata> cached_metadata(const std::string& key);
    void store_metadata(const std::string& key, const ResolvedMetadata& metadata, const Config& config);
    std::optional<ResolvedMetadata> fetch_sidecar(const Asset& asset, const Identity& identity, const Config& config, const RawRelease& release);
    std::optional<ResolvedMetadata> parse_archive(const Asset& asset, const Identity& identity, const Config& config);
    StringMap read_sections(const std::filesystem::path& package_dir);

    ResolverServices services_;
    ReleaseFetcher fetcher_;
    std::filesystem::path temp_root_;
};
