#pragma once

#include <filesystem>
#include <string>
#include <string_view>

// Fields of the comment header at the top of a plugin's main file:
//   /**
//    * Plugin Name: My Plugin
//    * Version: 1.2.0
//    */
struct PluginHeader {
    std::string name;
    std::string plugin_uri;
    std::string version;
    std::string description;
    std::string author;
    std::string author_uri;
    std::string requires_at_least;
    std::string requires_php;
    std::string tested_up_to;
};

// Only the first 8 KiB are scanned. Absent fields stay empty.
PluginHeader parse_plugin_header(std::string_view content);

// Throws PlugupException when the file cannot be read.
PluginHeader read_plugin_header(const std::filesystem::path& path);
