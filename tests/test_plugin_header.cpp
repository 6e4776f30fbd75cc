#include <gtest/gtest.h>
#include "../src/plugin_header.hpp"
#include "../src/exception.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(PluginHeaderTest, ParsesStandardHeader) {
    const std::string content =
        "<?php\n"
        "/**\n"
        " * Plugin Name:       My Plugin\n"
        " * Plugin URI:        https://example.com/my-plugin\n"
        " * Description:       Does things.\n"
        " * Version:           1.3.0\n"
        " * Requires at least: 6.5\n"
        " * Requires PHP:      8.1\n"
        " * Tested up to:      6.6\n"
        " * Author:            Acme\n"
        " * Author URI:        https://acme.example\n"
        " */\n";
    PluginHeader header = parse_plugin_header(content);
    EXPECT_EQ(header.name, "My Plugin");
    EXPECT_EQ(header.plugin_uri, "https://example.com/my-plugin");
    EXPECT_EQ(header.description, "Does things.");
    EXPECT_EQ(header.version, "1.3.0");
    EXPECT_EQ(header.requires_at_least, "6.5");
    EXPECT_EQ(header.requires_php, "8.1");
    EXPECT_EQ(header.tested_up_to, "6.6");
    EXPECT_EQ(header.author, "Acme");
    EXPECT_EQ(header.author_uri, "https://acme.example");
}

TEST(PluginHeaderTest, KeysAreCaseInsensitiveAndFirstWins) {
    PluginHeader header = parse_plugin_header("/*\nplugin name: First\nVERSION: 2.0 */\nPlugin Name: Second\n");
    EXPECT_EQ(header.name, "First");
    EXPECT_EQ(header.version, "2.0");
}

TEST(PluginHeaderTest, MissingFieldsStayEmpty) {
    PluginHeader header = parse_plugin_header("<?php\n// Plugin Name: Bare\n");
    EXPECT_EQ(header.name, "Bare");
    EXPECT_TRUE(header.version.empty());
    EXPECT_TRUE(header.author_uri.empty());
}

TEST(PluginHeaderTest, OnlyScansTheFileHead) {
    std::string content(9000, ' ');
    content += "\nVersion: 9.9.9\n";
    EXPECT_TRUE(parse_plugin_header(content).version.empty());
}

TEST(PluginHeaderTest, ReadFromFile) {
    const fs::path path = fs::absolute("tmp_plugin_header.php");
    {
        std::ofstream f(path);
        f << "<?php\n/*\n * Plugin Name: From Disk\n * Version: 0.4.1\n */\n";
    }
    PluginHeader header = read_plugin_header(path);
    fs::remove(path);
    EXPECT_EQ(header.name, "From Disk");
    EXPECT_EQ(header.version, "0.4.1");
    EXPECT_THROW(read_plugin_header(path), PlugupException);
}
