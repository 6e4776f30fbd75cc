#pragma once

#include "../src/downloader.hpp"
#include "../src/exception.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Serves canned responses by URL and counts every request.
class FakeHttpClient : public HttpClient {
public:
    struct Route {
        long status = 200;
        std::string body;
        HttpHeaders headers;
        bool transport_error = false;
    };

    void route(const std::string& url, long status, std::string body, HttpHeaders headers = {}) {
        routes_[url] = Route{status, std::move(body), std::move(headers), false};
    }

    void fail(const std::string& url) {
        routes_[url] = Route{0, "", {}, true};
    }

    HttpResponse get(const std::string& url, const HttpHeaders& headers, long timeout_seconds) override {
        last_headers = headers;
        last_timeout = timeout_seconds;
        return respond(url);
    }

    HttpResponse download(const std::string& url, const HttpHeaders& headers,
                          const fs::path& output_path, long timeout_seconds,
                          std::uintmax_t max_bytes) override {
        last_headers = headers;
        last_timeout = timeout_seconds;
        last_max_bytes = max_bytes;
        HttpResponse response = respond(url);
        if (max_bytes > 0 && response.body.size() > max_bytes) {
            throw SizeLimitError("Download from " + url + " exceeds limit");
        }
        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        out << response.body;
        response.body.clear();
        return response;
    }

    size_t calls(const std::string& url) const {
        auto it = counts_.find(url);
        return it == counts_.end() ? 0 : it->second;
    }

    size_t total_calls() const {
        size_t total = 0;
        for (const auto& [url, n] : counts_) total += n;
        return total;
    }

    HttpHeaders last_headers;
    long last_timeout = 0;
    std::uintmax_t last_max_bytes = 0;

private:
    HttpResponse respond(const std::string& url) {
        ++counts_[url];
        auto it = routes_.find(url);
        if (it == routes_.end()) {
            return HttpResponse{404, {}, "Not Found"};
        }
        if (it->second.transport_error) {
            throw TransportError("Could not resolve host");
        }
        return HttpResponse{it->second.status, it->second.headers, it->second.body};
    }

    std::map<std::string, Route> routes_;
    std::map<std::string, size_t> counts_;
};

// Writes a zip archive with the given entries (path -> content).
inline void write_zip(const fs::path& path, const std::map<std::string, std::string>& entries) {
    struct archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    if (archive_write_open_filename(a, path.c_str()) != ARCHIVE_OK) {
        archive_write_free(a);
        throw std::runtime_error("cannot create test zip " + path.string());
    }
    for (const auto& [name, content] : entries) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, name.c_str());
        archive_entry_set_size(entry, static_cast<la_int64_t>(content.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_write_header(a, entry);
        archive_write_data(a, content.data(), content.size());
        archive_entry_free(entry);
    }
    archive_write_close(a);
    archive_write_free(a);
}

inline std::string read_binary(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_text(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}
