#include "archive_builder.hpp"

#include <crow/logging.h>
#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <array>
#include <ctime>
#include <fstream>
#include <memory>
#include <system_error>

namespace arbundle {

namespace {

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_free(a);
        }
    }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* entry) const {
        if (entry) {
            archive_entry_free(entry);
        }
    }
};

using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveEntryHandle = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

std::string archiveError(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

constexpr std::size_t COPY_BUFFER_SIZE = 64 * 1024;

} // anonymous namespace

Result<std::vector<std::string>> ArchiveBuilder::collectEntries(const std::filesystem::path& source_dir) {
    std::vector<std::string> entries;
    std::error_code ec;

    std::filesystem::recursive_directory_iterator it(source_dir, ec);
    if (ec) {
        return Error::Storage("Internal server error",
                              "cannot list " + source_dir.string() + ": " + ec.message());
    }

    for (const auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return Error::Storage("Internal server error",
                                  "directory walk failed below " + source_dir.string() + ": " + ec.message());
        }
        // symlink_status: a link is never followed out of the tree
        auto status = it->symlink_status(ec);
        if (ec) {
            return Error::Storage("Internal server error",
                                  "cannot stat " + it->path().string() + ": " + ec.message());
        }
        if (!std::filesystem::is_regular_file(status)) {
            continue;
        }
        auto relative = it->path().lexically_relative(source_dir);
        entries.push_back(relative.generic_string());
    }
    if (ec) {
        return Error::Storage("Internal server error",
                              "directory walk failed below " + source_dir.string() + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

Result<ArchiveSummary> ArchiveBuilder::build(const std::filesystem::path& source_dir,
                                             const std::filesystem::path& archive_path) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(source_dir, ec)) {
        return Error::Storage("Internal server error",
                              "archive source " + source_dir.string() + " is not a directory");
    }

    ArchiveSummary summary;
    summary.archive_path = archive_path;
    auto entries = collectEntries(source_dir);
    if (!entries) {
        return entries.error();
    }
    summary.entries = std::move(*entries);

    std::filesystem::path partial_path = archive_path;
    partial_path += PARTIAL_SUFFIX;

    ArchiveWriteHandle writer(archive_write_new());
    if (!writer) {
        return Error::Storage("Internal server error", "archive_write_new failed");
    }

    if (archive_write_set_format_zip(writer.get()) != ARCHIVE_OK) {
        return Error::Storage("Internal server error", "zip format unavailable: " + archiveError(writer.get()));
    }
    if (archive_write_set_format_option(writer.get(), "zip", "compression", "deflate") != ARCHIVE_OK) {
        CROW_LOG_WARNING << "libarchive rejected zip deflate option: " << archiveError(writer.get());
    }
    if (archive_write_set_format_option(writer.get(), "zip", "compression-level", "9") != ARCHIVE_OK) {
        CROW_LOG_WARNING << "libarchive rejected zip compression level: " << archiveError(writer.get());
    }

    if (archive_write_open_filename(writer.get(), partial_path.c_str()) != ARCHIVE_OK) {
        std::string detail = archiveError(writer.get());
        removeQuietly(partial_path);
        return Error::Storage("Internal server error", "cannot open archive: " + detail);
    }

    auto fail = [&](const std::string& detail) -> Error {
        writer.reset();
        removeQuietly(partial_path);
        return Error::Storage("Internal server error", detail);
    };

    std::array<char, COPY_BUFFER_SIZE> buffer{};

    for (const auto& relative : summary.entries) {
        std::filesystem::path file_path = source_dir / relative;

        auto file_size = std::filesystem::file_size(file_path, ec);
        if (ec) {
            return fail("cannot stat " + relative + ": " + ec.message());
        }

        std::ifstream input(file_path, std::ios::binary);
        if (!input.is_open()) {
            return fail("cannot open " + relative);
        }

        ArchiveEntryHandle entry(archive_entry_new());
        archive_entry_set_pathname(entry.get(), relative.c_str());
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(file_size));
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);

        if (archive_write_header(writer.get(), entry.get()) != ARCHIVE_OK) {
            return fail("cannot write header for " + relative + ": " + archiveError(writer.get()));
        }

        std::uintmax_t written = 0;
        while (input) {
            input.read(buffer.data(), buffer.size());
            std::streamsize got = input.gcount();
            if (got <= 0) {
                break;
            }
            la_ssize_t rc = archive_write_data(writer.get(), buffer.data(), static_cast<size_t>(got));
            if (rc < 0) {
                return fail("cannot write data for " + relative + ": " + archiveError(writer.get()));
            }
            written += static_cast<std::uintmax_t>(got);
        }

        if (input.bad() || written != file_size) {
            return fail("short read on " + relative);
        }

        if (archive_write_finish_entry(writer.get()) != ARCHIVE_OK) {
            return fail("cannot finish entry " + relative + ": " + archiveError(writer.get()));
        }
        summary.input_bytes += written;
    }

    // Only a clean close means the central directory reached disk
    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return fail("cannot close archive: " + archiveError(writer.get()));
    }
    writer.reset();

    std::filesystem::rename(partial_path, archive_path, ec);
    if (ec) {
        removeQuietly(partial_path);
        return Error::Storage("Internal server error", "cannot publish archive: " + ec.message());
    }

    summary.archive_bytes = std::filesystem::file_size(archive_path, ec);
    if (ec) {
        summary.archive_bytes = 0;
    }

    CROW_LOG_INFO << "Archive built with " << summary.entries.size() << " entries, "
                  << summary.input_bytes << " bytes in, " << summary.archive_bytes << " bytes out";
    return summary;
}

void ArchiveBuilder::removeQuietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        CROW_LOG_WARNING << "Failed to remove " << path.string() << ": " << ec.message();
    }
}

} // namespace arbundle
