#pragma once

#include "config.hpp"
#include "exception.hpp"
#include "downloader.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class CacheStore;

struct Asset {
    std::string name;
    std::string download_url;
    std::uintmax_t size = 0;
    std::string digest;  // "sha256:<hex>" when the provider publishes one
};

struct RawRelease {
    std::string tag_name;
    std::string published_at;
    std::string body;  // release notes (Markdown)
    std::vector<Asset> assets;
};

enum class FetchFailureKind {
    NETWORK_ERROR,
    HTTP_ERROR,
    EMPTY_BODY,
    MALFORMED_JSON
};

std::string_view to_string(FetchFailureKind kind);

struct FetchFailure {
    FetchFailureKind kind = FetchFailureKind::NETWORK_ERROR;
    long http_status = 0;
    std::string annotation;
    std::optional<std::string> rate_limit_remaining;
    std::string detail;
};

// Log context for a failure: kind, status, annotation, rate limit, detail.
nlohmann::json to_json_context(const FetchFailure& failure);

class FetchError : public PlugupException {
public:
    explicit FetchError(FetchFailure failure);

    const FetchFailure& failure() const { return failure_; }

private:
    FetchFailure failure_;
};

// Parses a provider "release" document. Throws FetchError (MALFORMED_JSON / EMPTY_BODY).
RawRelease parse_release(std::string_view json_text);

// Accept + optional bearer token, shared by every request made for an identity.
HttpHeaders request_headers(const Config& config, std::string_view accept = "application/json");

std::string latest_release_url(const Identity& identity, const Config& config);

// Case-insensitive lookup by file name.
const Asset* find_asset(const RawRelease& release, std::string_view name);

// Asset to download for a slug: "{slug}.zip", "latest.zip", "plugin.zip", then
// "{slug}-{version}.zip" and "{version}.zip" with the version taken from the tag,
// then "{slug}-{tag}.zip" and "{tag}.zip" with the whole tag name.
const Asset* resolve_download_asset(const RawRelease& release, std::string_view slug);

// URL of resolve_download_asset(), or "" when nothing matches.
std::string resolve_download_link(const RawRelease& release, std::string_view slug);

class ReleaseFetcher {
public:
    ReleaseFetcher(HttpClient& http, CacheStore& cache);

    // Latest release of identity.repository, from cache when fresh. A fresh
    // response is written through to the cache. Throws FetchError; never retries.
    RawRelease fetch_latest_release(const Identity& identity, const Config& config);

private:
    HttpClient& http_;
    CacheStore& cache_;
};
