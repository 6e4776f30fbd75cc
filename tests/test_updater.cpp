#include <gtest/gtest.h>
#include "../src/archive.hpp"
#include "../src/cache.hpp"
#include "../src/sanitizer.hpp"
#include "../src/updater.hpp"
#include "../src/utils.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

const std::string RELEASE_URL = "https://api.test/repos/acme/my-plugin/releases/latest";
const std::string JSON_URL = "https://dl.test/plugin.json";

} // anonymous namespace

class UpdaterTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;
    FakeHttpClient http;
    MemoryCacheStore cache;
    ZipExtractor extractor;
    AllowlistSanitizer sanitizer;
    Identity identity{"my-plugin/my-plugin.php", "acme/my-plugin", "my-plugin"};
    Config config;

    void SetUp() override {
        suite_work_dir = fs::absolute("tmp_updater_test");
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(suite_work_dir);
        config.api_base_url = "https://api.test";
        set_log_level(LogLevel::SILENT);
    }

    void TearDown() override {
        set_log_level(LogLevel::WARNING);
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }

    ResolverServices services() {
        return {http, cache, extractor, sanitizer, nullptr};
    }

    void serve(const std::string& version, const std::string& requires_host = "", const std::string& notes = "") {
        http.route(RELEASE_URL, 200, json{
            {"tag_name", "v" + version},
            {"published_at", "2024-05-01T10:00:00Z"},
            {"body", notes},
            {"assets", json::array({
                {{"name", "plugin.json"}, {"browser_download_url", JSON_URL}},
            })},
        }.dump());
        http.route(JSON_URL, 200, json{
            {"name", "My Plugin"},
            {"slug", "my-plugin"},
            {"version", version},
            {"requires", requires_host},
            {"download_link", "https://dl.test/my-plugin.zip"},
        }.dump());
    }
};

TEST_F(UpdaterTest, CheckForUpdate) {
    serve("1.3.0");
    Updater updater(identity, config, services(), suite_work_dir);

    auto decision = updater.check_for_update("1.2.9", "6.6");
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->new_version, "1.3.0");
    EXPECT_EQ(decision->package_url, "https://dl.test/my-plugin.zip");

    EXPECT_FALSE(updater.check_for_update("1.3.0", "6.6").has_value());
}

TEST_F(UpdaterTest, HostGate) {
    serve("1.3.0", "6.5");
    Updater updater(identity, config, services(), suite_work_dir);
    EXPECT_FALSE(updater.check_for_update("1.2.9", "6.3").has_value());
    EXPECT_TRUE(updater.check_for_update("1.2.9", "6.5").has_value());
}

TEST_F(UpdaterTest, NothingResolvedMeansNoDecision) {
    http.fail(RELEASE_URL);
    Updater updater(identity, config, services(), suite_work_dir);
    EXPECT_FALSE(updater.check_for_update("1.0.0", "6.6").has_value());
}

TEST_F(UpdaterTest, NonMatchingInvalidationLeavesEntries) {
    serve("1.3.0");
    Updater updater(identity, config, services(), suite_work_dir);
    ASSERT_TRUE(updater.resolve_metadata().has_value());
    ASSERT_TRUE(cache.contains("release:my-plugin"));
    ASSERT_TRUE(cache.contains("json:my-plugin"));
    cache.set("archive:my-plugin", "{}", 60s);

    EXPECT_FALSE(updater.on_update_applied("other-plugin/other-plugin.php"));
    EXPECT_FALSE(updater.on_update_applied(std::vector<std::string>{"a/a.php", "b/b.php"}));
    EXPECT_EQ(cache.size(), 3u);

    EXPECT_TRUE(updater.on_update_applied(std::vector<std::string>{"a/a.php", "my-plugin/my-plugin.php"}));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(UpdaterTest, InvalidationForcesRefetch) {
    serve("1.3.0");
    Updater updater(identity, config, services(), suite_work_dir);
    ASSERT_TRUE(updater.resolve_metadata().has_value());

    serve("1.4.0");
    EXPECT_EQ(updater.resolve_metadata()->version, "1.3.0");

    updater.on_update_applied("my-plugin/my-plugin.php");
    EXPECT_EQ(updater.resolve_metadata()->version, "1.4.0");
}

TEST_F(UpdaterTest, PluginInformation) {
    serve("1.3.0", "", "## Changes\n<script>x()</script>Fixed <b>bugs</b>");
    Updater updater(identity, config, services(), suite_work_dir);

    EXPECT_FALSE(updater.plugin_information("someone-else").has_value());
    EXPECT_EQ(http.total_calls(), 0u);

    auto info = updater.plugin_information("my-plugin");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->slug, "my-plugin");
    EXPECT_EQ(info->version, "1.3.0");
    EXPECT_EQ(info->last_updated, "2024-05-01T10:00:00Z");
    EXPECT_EQ(info->sections["other_notes"], "## Changes\nFixed <b>bugs</b>");
    EXPECT_EQ(http.calls(RELEASE_URL), 1u);
}

TEST_F(UpdaterTest, PluginInformationWithoutNotes) {
    serve("1.3.0");
    Updater updater(identity, config, services(), suite_work_dir);
    auto info = updater.plugin_information("my-plugin");
    ASSERT_TRUE(info.has_value());
    EXPECT_FALSE(info->sections.contains("other_notes"));
}

TEST_F(UpdaterTest, RegistryKeepsOneUpdaterPerPlugin) {
    UpdaterRegistry registry(services(), suite_work_dir);
    Updater& first = registry.get_or_create(identity, config);

    Config other = config;
    other.timeout = 5;
    Updater& second = registry.get_or_create(identity, other);
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(second.config().timeout, 30);
    EXPECT_EQ(registry.size(), 1u);

    Identity another{"other/other.php", "acme/other", "other"};
    Updater& third = registry.get_or_create(another, other);
    EXPECT_NE(&first, &third);
    EXPECT_EQ(registry.find("other/other.php"), &third);
    EXPECT_EQ(registry.find("missing/missing.php"), nullptr);
    EXPECT_EQ(registry.size(), 2u);

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(UpdaterTest, RegistryFansOutInvalidation) {
    UpdaterRegistry registry(services(), suite_work_dir);
    registry.get_or_create(identity, config);
    registry.get_or_create(Identity{"other/other.php", "acme/other", "other"}, config);
    cache.set("release:my-plugin", "x", 60s);
    cache.set("release:other", "x", 60s);

    EXPECT_EQ(registry.on_update_applied({"other/other.php"}), 1u);
    EXPECT_TRUE(cache.contains("release:my-plugin"));
    EXPECT_FALSE(cache.contains("release:other"));
}
