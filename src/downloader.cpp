#include "downloader.hpp"
#include "exception.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstdint>
#include <format>
#include <fstream>
#include <memory>
#include <ostream>

#ifndef PLUGUP_VERSION
#define PLUGUP_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

namespace {

struct DownloadSink {
    std::ostream* out = nullptr;
    std::uintmax_t written = 0;
    std::uintmax_t limit = 0;
    bool exceeded = false;
};

// Returning short aborts the transfer with CURLE_WRITE_ERROR.
size_t write_to_sink(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<DownloadSink*>(userdata);
    size_t bytes = size * nmemb;
    if (sink->limit > 0 && sink->written + bytes > sink->limit) {
        sink->exceeded = true;
        return 0;
    }
    sink->out->write(static_cast<char*>(ptr), bytes);
    sink->written += bytes;
    return sink->out->good() ? bytes : 0;
}

size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

// Collects "Name: value" lines; a new status line (after a redirect) starts over.
size_t collect_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    std::string_view line(buffer, size * nitems);
    if (line.starts_with("HTTP/")) {
        headers->clear();
    } else if (auto pos = line.find(':'); pos != std::string_view::npos) {
        (*headers)[to_lower(trim(line.substr(0, pos)))] = trim(line.substr(pos + 1));
    }
    return size * nitems;
}

// Custom deleters for the CURL handle and header list
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

CurlHeaderList build_header_list(const HttpHeaders& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers) {
        const std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(list, line.c_str());
        if (!appended) {
            curl_slist_free_all(list);
            throw TransportError("Failed to allocate HTTP header list");
        }
        list = appended;
    }
    return CurlHeaderList(list);
}

CurlHandle prepare(const std::string& url, curl_slist* header_list, HttpHeaders* response_headers, long timeout_seconds) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw TransportError(std::format("Unable to allocate curl handle for {}", url));
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, std::min(timeout_seconds, 10L));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "plugup/" PLUGUP_VERSION);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, collect_header);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, response_headers);
    return curl;
}

long perform(CURL* curl, const std::string& url) {
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw TransportError(std::format("Request to {} failed: {}", url, curl_easy_strerror(res)));
    }
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    return status;
}

} // anonymous namespace

HttpResponse CurlHttpClient::get(const std::string& url, const HttpHeaders& headers, long timeout_seconds) {
    HttpResponse response;
    CurlHeaderList header_list = build_header_list(headers);
    CurlHandle curl = prepare(url, header_list.get(), &response.headers, timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    response.status = perform(curl.get(), url);
    return response;
}

HttpResponse CurlHttpClient::download(const std::string& url, const HttpHeaders& headers,
                                      const fs::path& output_path, long timeout_seconds,
                                      std::uintmax_t max_bytes) {
    std::ofstream ofile(output_path, std::ios::binary | std::ios::trunc);
    if (!ofile) {
        throw PlugupException(std::format("Failed to create file: {}", output_path.string()));
    }

    HttpResponse response;
    CurlHeaderList header_list = build_header_list(headers);
    CurlHandle curl = prepare(url, header_list.get(), &response.headers, timeout_seconds);
    DownloadSink sink{&ofile, 0, max_bytes, false};
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_sink);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
    if (max_bytes > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(max_bytes));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (sink.exceeded || res == CURLE_FILESIZE_EXCEEDED) {
        throw SizeLimitError(std::format("Download from {} exceeds {} bytes", url, max_bytes));
    }
    if (res != CURLE_OK) {
        throw TransportError(std::format("Request to {} failed: {}", url, curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    ofile.flush();
    if (!ofile) {
        throw PlugupException(std::format("Failed to write file: {}", output_path.string()));
    }
    return response;
}

CurlGlobalInitializer::CurlGlobalInitializer() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}
