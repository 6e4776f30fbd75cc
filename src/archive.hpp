#pragma once

#include <filesystem>

class ArchiveExtractor {
public:
    virtual ~ArchiveExtractor() = default;

    // Unpacks archive_path below output_dir. Throws PlugupException on failure,
    // including entries whose path would leave output_dir.
    virtual void extract(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir) = 0;

    // Reads every entry to the end, verifying checksums. Throws PlugupException on damage.
    virtual void check_integrity(const std::filesystem::path& archive_path) = 0;
};

class ZipExtractor : public ArchiveExtractor {
public:
    void extract(const std::filesystem::path& archive_path, const std::filesystem::path& output_dir) override;
    void check_integrity(const std::filesystem::path& archive_path) override;
};
