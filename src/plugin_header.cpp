#include "plugin_header.hpp"
#include "exception.hpp"
#include "utils.hpp"

#include <array>
#include <format>
#include <fstream>
#include <utility>

namespace {

constexpr size_t HEADER_SCAN_BYTES = 8192;

// Strips the comment decoration before a header name: spaces, tabs, '/', '*', '#', '@'.
std::string_view strip_decoration(std::string_view line) {
    const size_t start = line.find_first_not_of(" \t/*#@");
    return start == std::string_view::npos ? std::string_view{} : line.substr(start);
}

std::string clean_value(std::string_view value) {
    // A header on the comment's last line may carry the terminator: "Version: 1.0 */"
    if (const size_t end = value.find("*/"); end != std::string_view::npos) {
        value = value.substr(0, end);
    }
    return trim(value);
}

} // anonymous namespace

PluginHeader parse_plugin_header(std::string_view content) {
    content = content.substr(0, HEADER_SCAN_BYTES);

    PluginHeader header;
    const std::array<std::pair<std::string_view, std::string*>, 9> fields = {{
        {"plugin name", &header.name},
        {"plugin uri", &header.plugin_uri},
        {"version", &header.version},
        {"description", &header.description},
        {"author", &header.author},
        {"author uri", &header.author_uri},
        {"requires at least", &header.requires_at_least},
        {"requires php", &header.requires_php},
        {"tested up to", &header.tested_up_to},
    }};

    size_t pos = 0;
    while (pos < content.size()) {
        size_t eol = content.find_first_of("\r\n", pos);
        if (eol == std::string_view::npos) eol = content.size();
        const std::string_view line = strip_decoration(content.substr(pos, eol - pos));
        pos = eol + 1;

        const size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        const std::string key = to_lower(trim(line.substr(0, colon)));
        for (const auto& [name, target] : fields) {
            // First occurrence wins.
            if (key == name && target->empty()) {
                *target = clean_value(line.substr(colon + 1));
                break;
            }
        }
    }
    return header;
}

PluginHeader read_plugin_header(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw PlugupException(std::format("Failed to open plugin file: {}", path.string()));
    }
    std::string buffer(HEADER_SCAN_BYTES, '\0');
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    buffer.resize(static_cast<size_t>(file.gcount()));
    return parse_plugin_header(buffer);
}
