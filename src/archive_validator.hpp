#pragma once

#include "exception.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>

class ArchiveExtractor;
class MimeSniffer;

enum class ArchiveErrorKind {
    FILE_NOT_FOUND,
    FILE_TOO_LARGE,
    INVALID_FILE_TYPE,
    FILE_READ_ERROR,
    INVALID_ZIP_SIGNATURE,
    ZIP_INTEGRITY_FAILED
};

std::string_view to_string(ArchiveErrorKind kind);

class ArchiveError : public PlugupException {
public:
    ArchiveError(ArchiveErrorKind kind, const std::string& message)
        : PlugupException(message), kind_(kind) {}

    ArchiveErrorKind kind() const { return kind_; }

private:
    ArchiveErrorKind kind_;
};

// Layered checks on a downloaded archive, in order: existence, size limit,
// MIME type (when a sniffer is given), zip signature, structural integrity
// (when a checker is given). Throws ArchiveError for the first failing check.
void validate_archive(const std::filesystem::path& file_path, std::uintmax_t max_bytes,
                      MimeSniffer* sniffer = nullptr, ArchiveExtractor* integrity_checker = nullptr);
