#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

using CacheClock = std::function<std::chrono::system_clock::time_point()>;

// Key/value store with per-entry expiry. get/set/remove are atomic per key.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
    virtual void remove(const std::string& key) = 0;
};

class MemoryCacheStore : public CacheStore {
public:
    explicit MemoryCacheStore(CacheClock clock = {});

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    void remove(const std::string& key) override;

    bool contains(const std::string& key);
    size_t size();

private:
    struct Entry {
        std::string value;
        std::chrono::system_clock::time_point expires;
    };

    CacheClock clock_;
    std::map<std::string, Entry, std::less<>> entries_;
    std::mutex mtx_;
};

// One file per key under a directory; writes go through a temp file and rename.
class FileCacheStore : public CacheStore {
public:
    explicit FileCacheStore(std::filesystem::path dir, CacheClock clock = {});

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    void remove(const std::string& key) override;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path entry_path(const std::string& key) const;

    std::filesystem::path dir_;
    CacheClock clock_;
    std::mutex mtx_;
};

enum class CacheEntry {
    RELEASE,
    JSON,
    ARCHIVE
};

std::string cache_key(CacheEntry kind, std::string_view slug);

// Deletes the release, json and archive entries of a slug.
void purge_cache(CacheStore& store, std::string_view slug);
