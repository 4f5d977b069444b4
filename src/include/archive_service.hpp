#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "archive_builder.hpp"
#include "content_validator.hpp"
#include "error.hpp"
#include "path_sanitizer.hpp"
#include "payload_decoder.hpp"
#include "server_config.hpp"
#include "session_lifecycle.hpp"
#include "session_registry.hpp"

namespace arbundle {

struct ArchiveResult {
    std::string download_url;
    std::size_t files_written = 0;
    std::size_t files_skipped = 0;
    ArchiveSummary summary;
};

struct StoredImage {
    std::string relative_path;  // below the output directory
    std::string mime_type;
    std::size_t size = 0;
};

/**
 * Materializes client files into a session sandbox and bundles them.
 *
 * Individual bad entries (unsafe path, disallowed extension, undecodable or
 * oversized payload) are logged and skipped; the rest of the batch still
 * goes through. Storage failures abort the request and discard the sandbox.
 */
class ArchiveService {
public:
    ArchiveService(const ServerConfig& config,
                   const SessionRegistry& registry,
                   SessionLifecycle& lifecycle);

    Result<ArchiveResult> createArchive(const std::string& session_id,
                                        const std::vector<FileDescriptor>& files);

    /**
     * Store one client-pushed image under output/images/. Both the declared
     * type and the magic bytes must name an allowed image format.
     */
    Result<StoredImage> storeUploadedImage(const std::string& session_id,
                                           const std::string& filename,
                                           const std::string& declared_type,
                                           const std::string& bytes);

    std::string downloadUrlFor(const std::string& session_id) const;

private:
    const ServerConfig& config_;
    const SessionRegistry& registry_;
    SessionLifecycle& lifecycle_;
    PathSanitizer sanitizer_;
    PathSanitizer image_sanitizer_;
    PayloadDecoder decoder_;
    ContentValidator content_validator_;
    ArchiveBuilder archive_builder_;

    // true when written, false when skipped; errors are storage failures only
    Result<bool> writeEntry(const std::filesystem::path& output_dir, const FileDescriptor& file);

    static Result<bool> writeBytes(const std::filesystem::path& target, const std::string& bytes);
};

} // namespace arbundle
