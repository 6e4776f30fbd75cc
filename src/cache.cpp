#include "cache.hpp"
#include "exception.hpp"
#include "hash.hpp"
#include "utils.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using std::chrono::system_clock;

namespace {

CacheClock or_system_clock(CacheClock clock) {
    if (clock) return clock;
    return [] { return system_clock::now(); };
}

} // anonymous namespace

MemoryCacheStore::MemoryCacheStore(CacheClock clock) : clock_(or_system_clock(std::move(clock))) {}

std::optional<std::string> MemoryCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (clock_() >= it->second.expires) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void MemoryCacheStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_[key] = Entry{value, clock_() + ttl};
}

void MemoryCacheStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.erase(key);
}

bool MemoryCacheStore::contains(const std::string& key) {
    return get(key).has_value();
}

size_t MemoryCacheStore::size() {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.size();
}

FileCacheStore::FileCacheStore(fs::path dir, CacheClock clock)
    : dir_(std::move(dir)), clock_(or_system_clock(std::move(clock))) {
    ensure_dir_exists(dir_);
}

fs::path FileCacheStore::entry_path(const std::string& key) const {
    // Keys contain ':' and user-chosen slugs, so they are hashed into file names.
    return dir_ / (sha256_hex(key) + ".entry");
}

// Entry layout: line 1 expiry (unix seconds), line 2 key, remainder value.
std::optional<std::string> FileCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    const fs::path path = entry_path(key);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;

    std::string expiry_line, stored_key;
    if (!std::getline(file, expiry_line) || !std::getline(file, stored_key) || stored_key != key) {
        log_warning("Discarding unreadable cache entry", {{"key", key}, {"path", path.string()}});
        file.close();
        std::error_code ec;
        fs::remove(path, ec);
        return std::nullopt;
    }

    long long expires = 0;
    const auto parsed = std::from_chars(expiry_line.data(), expiry_line.data() + expiry_line.size(), expires);
    if (parsed.ec != std::errc{}) {
        log_warning("Discarding cache entry with corrupt expiry", {{"key", key}});
        file.close();
        std::error_code rm_ec;
        fs::remove(path, rm_ec);
        return std::nullopt;
    }

    const long long now = std::chrono::duration_cast<std::chrono::seconds>(clock_().time_since_epoch()).count();
    if (now >= expires) {
        file.close();
        std::error_code rm_ec;
        fs::remove(path, rm_ec);
        return std::nullopt;
    }

    std::ostringstream value;
    value << file.rdbuf();
    return value.str();
}

void FileCacheStore::set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mtx_);
    const fs::path path = entry_path(key);
    const fs::path tmp_path = path.string() + ".tmp";
    const long long expires = std::chrono::duration_cast<std::chrono::seconds>((clock_() + ttl).time_since_epoch()).count();
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw PlugupException(std::format("Failed to create cache file: {}", tmp_path.string()));
        }
        file << expires << '\n' << key << '\n' << value;
        if (!file) {
            throw PlugupException(std::format("Failed to write cache file: {}", tmp_path.string()));
        }
    }
    fs::rename(tmp_path, path);
}

void FileCacheStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::error_code ec;
    fs::remove(entry_path(key), ec);
}

std::string cache_key(CacheEntry kind, std::string_view slug) {
    switch (kind) {
        case CacheEntry::RELEASE: return std::format("release:{}", slug);
        case CacheEntry::JSON: return std::format("json:{}", slug);
        case CacheEntry::ARCHIVE: return std::format("archive:{}", slug);
    }
    return std::string(slug);
}

void purge_cache(CacheStore& store, std::string_view slug) {
    for (CacheEntry kind : {CacheEntry::RELEASE, CacheEntry::JSON, CacheEntry::ARCHIVE}) {
        store.remove(cache_key(kind, slug));
    }
}
