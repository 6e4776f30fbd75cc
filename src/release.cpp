#include "release.hpp"
#include "cache.hpp"
#include "utils.hpp"
#include "version.hpp"

#include <chrono>
#include <format>
#include <vector>

using json = nlohmann::json;

namespace {

std::string string_or_empty(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

FetchError malformed(std::string detail) {
    FetchFailure failure;
    failure.kind = FetchFailureKind::MALFORMED_JSON;
    failure.detail = std::move(detail);
    return FetchError(std::move(failure));
}

std::string annotate_status(long status) {
    switch (status) {
        case 401: return "authentication failed";
        case 403: return "rate limit exceeded or insufficient permissions";
        case 404: return "repository not found or private";
        default: break;
    }
    if (status >= 500 && status < 600) return "upstream server error, transient";
    return "";
}

} // anonymous namespace

std::string_view to_string(FetchFailureKind kind) {
    switch (kind) {
        case FetchFailureKind::NETWORK_ERROR: return "network-error";
        case FetchFailureKind::HTTP_ERROR: return "http-error";
        case FetchFailureKind::EMPTY_BODY: return "empty-body";
        case FetchFailureKind::MALFORMED_JSON: return "malformed-json";
    }
    return "unknown";
}

json to_json_context(const FetchFailure& failure) {
    json context = {{"cause", std::string(to_string(failure.kind))}};
    if (failure.http_status != 0) context["http_code"] = failure.http_status;
    if (!failure.annotation.empty()) context["annotation"] = failure.annotation;
    if (failure.rate_limit_remaining) context["rate_limit_remaining"] = *failure.rate_limit_remaining;
    if (!failure.detail.empty()) context["detail"] = failure.detail;
    return context;
}

FetchError::FetchError(FetchFailure failure)
    : PlugupException([&] {
          std::string msg = "Release request failed: " + std::string(to_string(failure.kind));
          if (failure.http_status != 0) msg += std::format(" (HTTP {})", failure.http_status);
          if (!failure.annotation.empty()) msg += ": " + failure.annotation;
          return msg;
      }()),
      failure_(std::move(failure)) {}

RawRelease parse_release(std::string_view json_text) {
    if (trim(json_text).empty()) {
        FetchFailure failure;
        failure.kind = FetchFailureKind::EMPTY_BODY;
        throw FetchError(std::move(failure));
    }

    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw malformed(std::format("{} (excerpt: {})", e.what(), json_text.substr(0, 500)));
    }
    if (!doc.is_object() || doc.empty()) {
        throw malformed("release document is not a non-empty JSON object");
    }

    RawRelease release;
    release.tag_name = string_or_empty(doc, "tag_name");
    release.published_at = string_or_empty(doc, "published_at");
    release.body = string_or_empty(doc, "body");

    auto assets = doc.find("assets");
    if (assets != doc.end() && assets->is_array()) {
        for (const auto& item : *assets) {
            if (!item.is_object()) continue;
            Asset asset;
            asset.name = string_or_empty(item, "name");
            asset.download_url = string_or_empty(item, "browser_download_url");
            asset.digest = string_or_empty(item, "digest");
            if (auto size = item.find("size"); size != item.end() && size->is_number_unsigned()) {
                asset.size = size->get<std::uintmax_t>();
            }
            if (asset.name.empty() || asset.download_url.empty()) continue;
            release.assets.push_back(std::move(asset));
        }
    }
    return release;
}

HttpHeaders request_headers(const Config& config, std::string_view accept) {
    HttpHeaders headers = {{"Accept", std::string(accept)}};
    if (!config.auth.empty()) {
        headers["Authorization"] = "Bearer " + config.auth;
    }
    return headers;
}

std::string latest_release_url(const Identity& identity, const Config& config) {
    return std::format("{}/repos/{}/releases/latest", config.api_base_url, identity.repository);
}

const Asset* find_asset(const RawRelease& release, std::string_view name) {
    for (const auto& asset : release.assets) {
        if (iequals(asset.name, name)) return &asset;
    }
    return nullptr;
}

const Asset* resolve_download_asset(const RawRelease& release, std::string_view slug) {
    for (const std::string& name : {std::format("{}.zip", slug), std::string("latest.zip"), std::string("plugin.zip")}) {
        if (const Asset* asset = find_asset(release, name)) return asset;
    }

    std::vector<std::string> candidates;
    const std::string version = extract_version_token(release.tag_name);
    if (!version.empty()) {
        candidates.push_back(std::format("{}-{}.zip", slug, version));
        candidates.push_back(std::format("{}.zip", version));
    }
    if (!release.tag_name.empty() && release.tag_name != version) {
        candidates.push_back(std::format("{}-{}.zip", slug, release.tag_name));
        candidates.push_back(std::format("{}.zip", release.tag_name));
    }
    for (const auto& name : candidates) {
        if (const Asset* asset = find_asset(release, name)) return asset;
    }
    return nullptr;
}

std::string resolve_download_link(const RawRelease& release, std::string_view slug) {
    const Asset* asset = resolve_download_asset(release, slug);
    return asset ? asset->download_url : "";
}

ReleaseFetcher::ReleaseFetcher(HttpClient& http, CacheStore& cache) : http_(http), cache_(cache) {}

RawRelease ReleaseFetcher::fetch_latest_release(const Identity& identity, const Config& config) {
    const std::string key = cache_key(CacheEntry::RELEASE, identity.slug);
    if (auto cached = cache_.get(key)) {
        try {
            return parse_release(*cached);
        } catch (const FetchError& e) {
            log_warning("Discarding unreadable cached release", {{"key", key}, {"error", e.what()}});
            cache_.remove(key);
        }
    }

    const std::string url = latest_release_url(identity, config);
    HttpResponse response;
    try {
        response = http_.get(url, request_headers(config), config.timeout);
    } catch (const TransportError& e) {
        FetchFailure failure;
        failure.kind = FetchFailureKind::NETWORK_ERROR;
        failure.detail = e.what();
        throw FetchError(std::move(failure));
    }

    if (response.status != 200) {
        FetchFailure failure;
        failure.kind = FetchFailureKind::HTTP_ERROR;
        failure.http_status = response.status;
        failure.annotation = annotate_status(response.status);
        if (response.status == 403) {
            if (auto it = response.headers.find("x-ratelimit-remaining"); it != response.headers.end()) {
                failure.rate_limit_remaining = it->second;
            }
        }
        throw FetchError(std::move(failure));
    }

    RawRelease release = parse_release(response.body);

    try {
        cache_.set(key, response.body, std::chrono::seconds(config.cache_duration));
    } catch (const std::exception& e) {
        log_warning("Failed to cache release data", {{"key", key}, {"error", e.what()}});
    }
    return release;
}
