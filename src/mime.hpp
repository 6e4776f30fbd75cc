#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

class MimeSniffer {
public:
    virtual ~MimeSniffer() = default;

    // MIME type of the file content, e.g. "application/zip". Throws PlugupException.
    virtual std::string sniff(const std::filesystem::path& path) = 0;
};

class LibmagicSniffer : public MimeSniffer {
public:
    // Throws PlugupException when the magic database cannot be loaded.
    LibmagicSniffer();
    ~LibmagicSniffer() override;
    LibmagicSniffer(const LibmagicSniffer&) = delete;
    LibmagicSniffer& operator=(const LibmagicSniffer&) = delete;

    std::string sniff(const std::filesystem::path& path) override;

private:
    struct magic_set* cookie_ = nullptr;
    std::mutex mtx_;  // libmagic handles are not thread-safe
};

// A libmagic sniffer, or nullptr when libmagic is unusable on this system.
std::unique_ptr<MimeSniffer> make_default_sniffer();
