#include "mime.hpp"
#include "exception.hpp"
#include "utils.hpp"

#include <magic.h>

#include <format>

LibmagicSniffer::LibmagicSniffer() {
    cookie_ = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!cookie_) {
        throw PlugupException("Failed to initialize libmagic");
    }
    if (magic_load(cookie_, nullptr) != 0) {
        std::string error = magic_error(cookie_) ? magic_error(cookie_) : "unknown error";
        magic_close(cookie_);
        cookie_ = nullptr;
        throw PlugupException("Failed to load magic database: " + error);
    }
}

LibmagicSniffer::~LibmagicSniffer() {
    if (cookie_) {
        magic_close(cookie_);
    }
}

std::string LibmagicSniffer::sniff(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mtx_);
    const char* mime = magic_file(cookie_, path.c_str());
    if (!mime) {
        const char* err = magic_error(cookie_);
        throw PlugupException(std::format("libmagic detection failed for {}: {}", path.string(), err ? err : "unknown error"));
    }
    return mime;
}

std::unique_ptr<MimeSniffer> make_default_sniffer() {
    try {
        return std::make_unique<LibmagicSniffer>();
    } catch (const PlugupException& e) {
        log_debug("MIME sniffing unavailable", {{"error", e.what()}});
        return nullptr;
    }
}
