#include "archive.hpp"
#include "exception.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <format>
#include <memory>

namespace fs = std::filesystem;

namespace {

// Custom deleters for libarchive handles
struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

std::string archive_error(struct archive* a, std::string_view fallback) {
    const char* err = archive_error_string(a);
    return err ? err : std::string(fallback);
}

ArchiveReadHandle open_zip(const fs::path& archive_path) {
    ArchiveReadHandle a(archive_read_new());
    if (!a) {
        throw PlugupException("Failed to allocate archive reader");
    }
    archive_read_support_format_zip(a.get());

    if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
        throw PlugupException(std::format("Failed to open archive {}: {}", archive_path.string(), archive_error(a.get(), "unknown error")));
    }
    return a;
}

} // anonymous namespace

void ZipExtractor::extract(const fs::path& archive_path, const fs::path& output_dir) {
    ArchiveReadHandle a = open_zip(archive_path);

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT
    );

    const auto fail = [&](struct archive* handle, std::string_view fallback) {
        return PlugupException(std::format("Failed to extract {}: {}", archive_path.string(), archive_error(handle, fallback)));
    };

    struct archive_entry* entry;
    int r = ARCHIVE_OK;
    long long count = 0;
    while (true) {
        r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw fail(a.get(), "fatal read error");
            }
            log_warning(archive_error(a.get(), "archive read warning"));
        }

        const char* current_path = archive_entry_pathname(entry);
        if (!current_path) continue;

        // Link entries are not extracted.
        if (archive_entry_hardlink(entry) || archive_entry_symlink(entry)) {
            log_debug("Skipping link entry in archive", {{"entry", current_path}});
            continue;
        }

        // SECURITY: Path traversal vulnerability mitigation.
        fs::path dest_path;
        try {
            dest_path = validate_path(current_path, output_dir);
        } catch (const PlugupException&) {
            throw PlugupException(std::format("Malicious path in archive {}: {}", archive_path.string(), current_path));
        }
        archive_entry_set_pathname(entry, dest_path.c_str());

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            if (r < ARCHIVE_WARN) {
                throw fail(ext.get(), "fatal write error");
            }
            log_warning(archive_error(ext.get(), "archive write warning"));
        } else {
            const void* buff;
            size_t size;
            la_int64_t offset;
            while (true) {
                r = archive_read_data_block(a.get(), &buff, &size, &offset);
                if (r == ARCHIVE_EOF) break;
                if (r < ARCHIVE_OK) {
                    if (r < ARCHIVE_WARN) {
                        throw fail(a.get(), "data block read error");
                    }
                    log_warning(archive_error(a.get(), "data block read warning"));
                    break;
                }

                if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                    throw fail(ext.get(), "data block write error");
                }
            }
            if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
                throw fail(ext.get(), "finish entry error");
            }
        }
        ++count;
    }

    log_debug(std::format("Extracted {} entries", count), {{"archive", archive_path.string()}, {"destination", output_dir.string()}});
}

void ZipExtractor::check_integrity(const fs::path& archive_path) {
    ArchiveReadHandle a = open_zip(archive_path);

    struct archive_entry* entry;
    while (true) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK) {
            throw PlugupException(std::format("Corrupt archive header: {}", archive_error(a.get(), "unknown error")));
        }

        // Reading to the end of each entry makes libarchive verify its CRC-32;
        // a mismatch surfaces as ARCHIVE_WARN.
        const void* buff;
        size_t size;
        la_int64_t offset;
        while (true) {
            r = archive_read_data_block(a.get(), &buff, &size, &offset);
            if (r == ARCHIVE_EOF) break;
            if (r != ARCHIVE_OK) {
                const char* name = archive_entry_pathname(entry);
                throw PlugupException(std::format("Corrupt archive entry {}: {}", name ? name : "?", archive_error(a.get(), "unknown error")));
            }
        }
    }
}
