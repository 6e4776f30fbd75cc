#pragma once

#include "exception.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_CYAN = "\033[1;36m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    SILENT
};

// Replaces console output. An empty sink restores it.
using LogSink = std::function<void(LogLevel, std::string_view)>;

void set_log_level(LogLevel level);
LogLevel get_log_level();
void set_log_sink(LogSink sink);

// Log functions. A non-empty context is appended as " - Context: {json}".
void log_debug(std::string_view msg, const nlohmann::json& context = {});
void log_info(std::string_view msg, const nlohmann::json& context = {});
void log_warning(std::string_view msg, const nlohmann::json& context = {});
void log_error(std::string_view msg, const nlohmann::json& context = {});

// String helpers
std::string to_lower(std::string_view s);
bool iequals(std::string_view a, std::string_view b);
std::string trim(std::string_view s);

// Filesystem utilities
void ensure_dir_exists(const fs::path& path);
std::string read_file(const fs::path& path);
// Unused path below root (the system temp directory when root is empty).
fs::path make_unique_tmp_path(std::string_view prefix, const fs::path& root = {});
std::vector<std::string> list_entry_names(const fs::path& dir);
std::filesystem::path validate_path(const fs::path& path, const fs::path& root);

// Removes a file or directory tree when it goes out of scope.
class ScopedPath {
public:
    explicit ScopedPath(fs::path path);
    ~ScopedPath();
    ScopedPath(const ScopedPath&) = delete;
    ScopedPath& operator=(const ScopedPath&) = delete;

    const fs::path& path() const { return path_; }

    // Removes now. Returns false (and logs) when removal failed.
    bool remove();

private:
    fs::path path_;
    bool removed_ = false;
};
