#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    long status = 0;
    HttpHeaders headers;  // names lower-cased
    std::string body;
};

// Blocking HTTP GET. Both calls throw TransportError when no HTTP response
// was received; any received status (including 4xx/5xx) is returned.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers, long timeout_seconds) = 0;

    // Streams the body into output_path; the returned body is empty.
    // Throws SizeLimitError once more than max_bytes arrive (0 means unlimited).
    virtual HttpResponse download(const std::string& url, const HttpHeaders& headers,
                                  const std::filesystem::path& output_path, long timeout_seconds,
                                  std::uintmax_t max_bytes) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url, const HttpHeaders& headers, long timeout_seconds) override;
    HttpResponse download(const std::string& url, const HttpHeaders& headers,
                          const std::filesystem::path& output_path, long timeout_seconds,
                          std::uintmax_t max_bytes) override;
};

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};
