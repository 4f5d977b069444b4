#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "error.hpp"

namespace arbundle {

struct ArchiveSummary {
    std::filesystem::path archive_path;
    std::vector<std::string> entries;   // relative, '/'-separated
    std::uintmax_t input_bytes = 0;
    std::uintmax_t archive_bytes = 0;
};

/**
 * Streams a directory tree into one ZIP archive (deflate, maximum level).
 *
 * The archive is written next to its destination as "<name>.partial" and
 * renamed into place only after libarchive closed it cleanly. On any
 * failure the partial file is removed, so a half-written archive is never
 * visible at the destination path.
 */
class ArchiveBuilder {
public:
    static constexpr const char* PARTIAL_SUFFIX = ".partial";

    ArchiveBuilder() = default;

    Result<ArchiveSummary> build(const std::filesystem::path& source_dir,
                                 const std::filesystem::path& archive_path) const;

    /**
     * Regular files below source_dir as sorted '/'-separated relative paths.
     * Symlinks and special files are not followed or included. A walk that
     * cannot be completed is a Storage error, never a shorter list.
     */
    static Result<std::vector<std::string>> collectEntries(const std::filesystem::path& source_dir);

private:
    static void removeQuietly(const std::filesystem::path& path);
};

} // namespace arbundle
