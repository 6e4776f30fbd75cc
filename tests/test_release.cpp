#include <gtest/gtest.h>
#include "../src/cache.hpp"
#include "../src/release.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const std::string RELEASE_URL = "https://api.test/repos/acme/my-plugin/releases/latest";

RawRelease release_with(std::string tag, std::vector<std::string> asset_names) {
    RawRelease release;
    release.tag_name = std::move(tag);
    for (auto& name : asset_names) {
        release.assets.push_back(Asset{name, "https://dl.test/" + name, 0, ""});
    }
    return release;
}

} // anonymous namespace

class ReleaseFetcherTest : public ::testing::Test {
protected:
    FakeHttpClient http;
    MemoryCacheStore cache;
    Identity identity{"my-plugin/my-plugin.php", "acme/my-plugin", "my-plugin"};
    Config config;

    void SetUp() override {
        config.api_base_url = "https://api.test";
    }

    FetchFailure failure_for(long status, HttpHeaders headers = {}) {
        http.route(RELEASE_URL, status, "{\"message\":\"nope\"}", std::move(headers));
        ReleaseFetcher fetcher(http, cache);
        try {
            fetcher.fetch_latest_release(identity, config);
        } catch (const FetchError& e) {
            return e.failure();
        }
        ADD_FAILURE() << "expected HTTP " << status << " to fail";
        return {};
    }
};

TEST_F(ReleaseFetcherTest, ParsesAndCachesRelease) {
    json body = {
        {"tag_name", "v1.3.0"},
        {"published_at", "2024-05-01T10:00:00Z"},
        {"body", "Notes"},
        {"assets", json::array({
            {{"name", "my-plugin.zip"}, {"browser_download_url", "https://dl.test/my-plugin.zip"}, {"size", 1234}, {"digest", "sha256:ab"}},
            {{"name", "broken"}},
        })},
    };
    http.route(RELEASE_URL, 200, body.dump());
    config.auth = "secret";

    ReleaseFetcher fetcher(http, cache);
    RawRelease release = fetcher.fetch_latest_release(identity, config);
    EXPECT_EQ(release.tag_name, "v1.3.0");
    EXPECT_EQ(release.published_at, "2024-05-01T10:00:00Z");
    EXPECT_EQ(release.body, "Notes");
    ASSERT_EQ(release.assets.size(), 1u);
    EXPECT_EQ(release.assets[0].size, 1234u);
    EXPECT_EQ(release.assets[0].digest, "sha256:ab");
    EXPECT_EQ(http.last_headers["Authorization"], "Bearer secret");
    EXPECT_EQ(http.last_timeout, 30);
    EXPECT_TRUE(cache.contains("release:my-plugin"));

    // Served from the cache the second time.
    RawRelease again = fetcher.fetch_latest_release(identity, config);
    EXPECT_EQ(again.tag_name, "v1.3.0");
    EXPECT_EQ(http.calls(RELEASE_URL), 1u);
}

TEST_F(ReleaseFetcherTest, AnnotatesHttpFailures) {
    FetchFailure unauthorized = failure_for(401);
    EXPECT_EQ(unauthorized.kind, FetchFailureKind::HTTP_ERROR);
    EXPECT_EQ(unauthorized.http_status, 401);
    EXPECT_EQ(unauthorized.annotation, "authentication failed");

    FetchFailure limited = failure_for(403, {{"x-ratelimit-remaining", "0"}});
    EXPECT_EQ(limited.annotation, "rate limit exceeded or insufficient permissions");
    ASSERT_TRUE(limited.rate_limit_remaining.has_value());
    EXPECT_EQ(*limited.rate_limit_remaining, "0");

    EXPECT_EQ(failure_for(404).annotation, "repository not found or private");
    EXPECT_EQ(failure_for(502).annotation, "upstream server error, transient");
    EXPECT_FALSE(cache.contains("release:my-plugin"));
}

TEST_F(ReleaseFetcherTest, TransportFailure) {
    http.fail(RELEASE_URL);
    ReleaseFetcher fetcher(http, cache);
    try {
        fetcher.fetch_latest_release(identity, config);
        FAIL() << "expected a network error";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.failure().kind, FetchFailureKind::NETWORK_ERROR);
        EXPECT_EQ(to_json_context(e.failure())["cause"], "network-error");
    }
}

TEST_F(ReleaseFetcherTest, EmptyAndMalformedBodies) {
    ReleaseFetcher fetcher(http, cache);

    http.route(RELEASE_URL, 200, "  ");
    try {
        fetcher.fetch_latest_release(identity, config);
        FAIL() << "expected an empty-body failure";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.failure().kind, FetchFailureKind::EMPTY_BODY);
    }

    http.route(RELEASE_URL, 200, "{not json");
    try {
        fetcher.fetch_latest_release(identity, config);
        FAIL() << "expected a malformed-json failure";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.failure().kind, FetchFailureKind::MALFORMED_JSON);
    }

    http.route(RELEASE_URL, 200, "{}");
    EXPECT_THROW(fetcher.fetch_latest_release(identity, config), FetchError);
    EXPECT_FALSE(cache.contains("release:my-plugin"));
}

TEST_F(ReleaseFetcherTest, UnreadableCacheEntryIsRefetched) {
    cache.set("release:my-plugin", "garbage", std::chrono::seconds(60));
    http.route(RELEASE_URL, 200, json{{"tag_name", "v2.0.0"}}.dump());
    ReleaseFetcher fetcher(http, cache);
    EXPECT_EQ(fetcher.fetch_latest_release(identity, config).tag_name, "v2.0.0");
    EXPECT_EQ(http.calls(RELEASE_URL), 1u);
}

TEST(DownloadLinkTest, DirectNamesInOrder) {
    EXPECT_EQ(resolve_download_link(release_with("v1.0.0", {"plugin.zip", "latest.zip", "My-Plugin.ZIP"}), "my-plugin"),
              "https://dl.test/My-Plugin.ZIP");
    EXPECT_EQ(resolve_download_link(release_with("v1.0.0", {"plugin.zip", "latest.zip"}), "my-plugin"),
              "https://dl.test/latest.zip");
}

TEST(DownloadLinkTest, TagVersionNames) {
    EXPECT_EQ(resolve_download_link(release_with("v2.1.0", {"my-plugin-2.1.0.zip"}), "my-plugin"),
              "https://dl.test/my-plugin-2.1.0.zip");
    EXPECT_EQ(resolve_download_link(release_with("release-2.1.0", {"2.1.0.zip", "notes.txt"}), "my-plugin"),
              "https://dl.test/2.1.0.zip");
    EXPECT_EQ(resolve_download_link(release_with("nightly", {"my-plugin-2.1.0.zip"}), "my-plugin"), "");
    EXPECT_EQ(resolve_download_link(release_with("v2.1.0", {}), "my-plugin"), "");
}

TEST(DownloadLinkTest, WholeTagNames) {
    EXPECT_EQ(resolve_download_link(release_with("v2.1.0", {"v2.1.0.zip"}), "my-plugin"),
              "https://dl.test/v2.1.0.zip");
    EXPECT_EQ(resolve_download_link(release_with("v2.1.0", {"My-Plugin-v2.1.0.zip"}), "my-plugin"),
              "https://dl.test/My-Plugin-v2.1.0.zip");
    EXPECT_EQ(resolve_download_link(release_with("nightly", {"nightly.zip"}), "my-plugin"),
              "https://dl.test/nightly.zip");
    // The version token is preferred over the whole tag.
    EXPECT_EQ(resolve_download_link(release_with("v2.1.0", {"v2.1.0.zip", "2.1.0.zip"}), "my-plugin"),
              "https://dl.test/2.1.0.zip");
}
