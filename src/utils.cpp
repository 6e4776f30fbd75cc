#include "utils.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <random>

namespace {
    LogLevel log_level = LogLevel::WARNING;
    LogSink log_sink;
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    std::string_view level_prefix(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "[DEBUG] ";
            case LogLevel::INFO: return "==> ";
            case LogLevel::WARNING: return "Warning: ";
            case LogLevel::ERROR: return "Error: ";
            default: return "";
        }
    }

    std::string_view level_color(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return COLOR_CYAN;
            case LogLevel::INFO: return COLOR_GREEN;
            case LogLevel::WARNING: return COLOR_YELLOW;
            default: return COLOR_RED;
        }
    }

    void log_internal(LogLevel level, std::string_view msg, const nlohmann::json& context) {
        std::unique_lock<std::mutex> lock(log_mutex);
        if (level < log_level) {
            return;
        }

        std::string line(msg);
        if (!context.is_null() && !context.empty()) {
            // Invalid UTF-8 is replaced.
            line += " - Context: " + context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        // The sink runs unlocked so it may log itself.
        if (log_sink) {
            LogSink sink = log_sink;
            lock.unlock();
            sink(level, line);
            return;
        }

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        const bool to_stderr = level >= LogLevel::WARNING;
        std::ostream& stream = to_stderr ? std::cerr : std::cout;
        const bool tty = to_stderr ? is_stderr_tty : is_stdout_tty;

        if (tty) {
            stream << level_color(level) << level_prefix(level) << COLOR_WHITE << line << COLOR_RESET << std::endl;
        } else {
            stream << level_prefix(level) << line << std::endl;
        }
    }
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_level = level;
}

LogLevel get_log_level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_level;
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_sink = std::move(sink);
}

void log_debug(std::string_view msg, const nlohmann::json& context) {
    log_internal(LogLevel::DEBUG, msg, context);
}

void log_info(std::string_view msg, const nlohmann::json& context) {
    log_internal(LogLevel::INFO, msg, context);
}

void log_warning(std::string_view msg, const nlohmann::json& context) {
    log_internal(LogLevel::WARNING, msg, context);
}

void log_error(std::string_view msg, const nlohmann::json& context) {
    log_internal(LogLevel::ERROR, msg, context);
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw PlugupException(std::format("Failed to create directory {}: {}", path.string(), ec.message()));
        }
    }
    else if (!fs::is_directory(path)) {
        throw PlugupException(std::format("Path exists but is not a directory: {}", path.string()));
    }
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw PlugupException(std::format("Failed to open file: {}", path.string()));
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

fs::path make_unique_tmp_path(std::string_view prefix, const fs::path& root) {
    static std::atomic<unsigned> counter{0};
    static const unsigned salt = std::random_device{}();
    const unsigned n = counter.fetch_add(1);
    const fs::path base = root.empty() ? fs::temp_directory_path() : root;
    return base / std::format("{}_{}_{:x}_{}", prefix, getpid(), salt, n);
}

std::vector<std::string> list_entry_names(const fs::path& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        names.push_back(entry.path().filename().string());
    }
    std::ranges::sort(names);
    return names;
}

std::filesystem::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
         throw PlugupException("Security Violation: Path must be relative: " + path.string());
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
             throw PlugupException("Security Violation: Path traversal detected: " + path.string());
        }
    }
    return root / normalized;
}

ScopedPath::ScopedPath(fs::path path) : path_(std::move(path)) {}

ScopedPath::~ScopedPath() {
    remove();
}

bool ScopedPath::remove() {
    if (removed_ || path_.empty()) return true;
    removed_ = true;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log_warning("Failed to remove temporary path", {{"path", path_.string()}, {"error", ec.message()}});
        return false;
    }
    return true;
}
