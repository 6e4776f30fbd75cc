#include "archive_validator.hpp"
#include "archive.hpp"
#include "mime.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace {

// Local file header, end of central directory (empty archive), spanning marker.
constexpr std::array<std::array<char, 4>, 3> ZIP_SIGNATURES = {{
    {'P', 'K', '\x03', '\x04'},
    {'P', 'K', '\x05', '\x06'},
    {'P', 'K', '\x07', '\x08'},
}};

constexpr std::array<std::string_view, 2> ZIP_MIME_TYPES = {
    "application/zip",
    "application/x-zip-compressed",
};

} // anonymous namespace

std::string_view to_string(ArchiveErrorKind kind) {
    switch (kind) {
        case ArchiveErrorKind::FILE_NOT_FOUND: return "file_not_found";
        case ArchiveErrorKind::FILE_TOO_LARGE: return "file_too_large";
        case ArchiveErrorKind::INVALID_FILE_TYPE: return "invalid_file_type";
        case ArchiveErrorKind::FILE_READ_ERROR: return "file_read_error";
        case ArchiveErrorKind::INVALID_ZIP_SIGNATURE: return "invalid_zip_signature";
        case ArchiveErrorKind::ZIP_INTEGRITY_FAILED: return "zip_integrity_failed";
    }
    return "unknown";
}

void validate_archive(const fs::path& file_path, std::uintmax_t max_bytes,
                      MimeSniffer* sniffer, ArchiveExtractor* integrity_checker) {
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec)) {
        throw ArchiveError(ArchiveErrorKind::FILE_NOT_FOUND, std::format("Archive not found: {}", file_path.string()));
    }

    const std::uintmax_t size = fs::file_size(file_path, ec);
    if (ec) {
        throw ArchiveError(ArchiveErrorKind::FILE_READ_ERROR, std::format("Cannot stat archive {}: {}", file_path.string(), ec.message()));
    }
    if (size > max_bytes) {
        throw ArchiveError(ArchiveErrorKind::FILE_TOO_LARGE,
            std::format("Archive is {} bytes and exceeds the size limit of {} bytes ({:.1f} MB)",
                        size, max_bytes, static_cast<double>(max_bytes) / 1024.0 / 1024.0));
    }

    if (sniffer) {
        std::string mime;
        try {
            mime = sniffer->sniff(file_path);
        } catch (const PlugupException& e) {
            throw ArchiveError(ArchiveErrorKind::INVALID_FILE_TYPE, std::format("Cannot determine archive type: {}", e.what()));
        }
        if (std::ranges::find(ZIP_MIME_TYPES, mime) == ZIP_MIME_TYPES.end()) {
            throw ArchiveError(ArchiveErrorKind::INVALID_FILE_TYPE, std::format("File is not a ZIP archive (detected {})", mime));
        }
    }

    // Magic bytes are checked whether or not a sniffer ran.
    std::array<char, 4> signature{};
    {
        std::ifstream file(file_path, std::ios::binary);
        if (!file) {
            throw ArchiveError(ArchiveErrorKind::FILE_READ_ERROR, std::format("Could not read archive: {}", file_path.string()));
        }
        file.read(signature.data(), signature.size());
        if (file.gcount() != static_cast<std::streamsize>(signature.size())) {
            throw ArchiveError(ArchiveErrorKind::INVALID_ZIP_SIGNATURE, "File is too short to be a ZIP archive");
        }
    }
    if (std::ranges::find(ZIP_SIGNATURES, signature) == ZIP_SIGNATURES.end()) {
        throw ArchiveError(ArchiveErrorKind::INVALID_ZIP_SIGNATURE, "File does not have a valid ZIP signature");
    }

    if (integrity_checker) {
        try {
            integrity_checker->check_integrity(file_path);
        } catch (const PlugupException& e) {
            throw ArchiveError(ArchiveErrorKind::ZIP_INTEGRITY_FAILED, std::format("ZIP integrity check failed: {}", e.what()));
        }
    }
}
