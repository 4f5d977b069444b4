#include "archive_service.hpp"

#include <crow/logging.h>
#include <fstream>
#include <system_error>

namespace arbundle {

namespace {

PathSanitizer::Config sanitizerConfig(const ServerConfig& config) {
    PathSanitizer::Config sanitizer_config;
    sanitizer_config.max_path_length = config.limits.max_path_length;
    sanitizer_config.allowed_extensions = config.allowed_extensions;
    return sanitizer_config;
}

PathSanitizer::Config imageSanitizerConfig(const ServerConfig& config) {
    PathSanitizer::Config sanitizer_config;
    sanitizer_config.max_path_length = config.limits.max_path_length;
    sanitizer_config.allowed_extensions = {".png", ".jpg", ".jpeg", ".webp"};
    return sanitizer_config;
}

PayloadDecoder::Limits decoderLimits(const ServerConfig& config) {
    PayloadDecoder::Limits limits;
    limits.max_encoded_bytes = config.limits.max_encoded_bytes;
    limits.max_file_bytes = config.limits.max_file_bytes;
    return limits;
}

} // anonymous namespace

ArchiveService::ArchiveService(const ServerConfig& config,
                               const SessionRegistry& registry,
                               SessionLifecycle& lifecycle)
    : config_(config),
      registry_(registry),
      lifecycle_(lifecycle),
      sanitizer_(sanitizerConfig(config)),
      image_sanitizer_(imageSanitizerConfig(config)),
      decoder_(decoderLimits(config)),
      content_validator_(config.allowed_image_types) {
}

std::string ArchiveService::downloadUrlFor(const std::string& session_id) const {
    return "/download/" + session_id + "/" + config_.archive_name;
}

Result<ArchiveResult> ArchiveService::createArchive(const std::string& session_id,
                                                    const std::vector<FileDescriptor>& files) {
    if (!SessionRegistry::isValidSessionId(session_id)) {
        return Error::Validation("Invalid session ID");
    }
    if (files.empty()) {
        return Error::Validation("Invalid files array", "empty batch");
    }
    if (files.size() > config_.limits.max_files_per_batch) {
        return Error::Validation("Too many files", std::to_string(files.size()) + " entries");
    }

    CROW_LOG_INFO << "Creating archive for session " << session_id << " with " << files.size() << " file(s)";

    auto output_dir = registry_.ensureOutputDirectory(session_id);
    if (!output_dir) {
        return std::move(output_dir.error());
    }

    ArchiveResult result;
    for (const auto& file : files) {
        auto written = writeEntry(*output_dir, file);
        if (!written) {
            written.error().log("Writing session " + session_id);
            lifecycle_.discardNow(session_id);
            return std::move(written.error());
        }
        if (*written) {
            ++result.files_written;
        } else {
            ++result.files_skipped;
        }
    }

    auto archive_path = registry_.archivePathFor(session_id);
    if (!archive_path) {
        return std::move(archive_path.error());
    }

    auto summary = archive_builder_.build(*output_dir, *archive_path);
    if (!summary) {
        summary.error().log("Building archive for session " + session_id);
        lifecycle_.discardNow(session_id);
        return std::move(summary.error());
    }

    result.summary = std::move(*summary);
    result.download_url = downloadUrlFor(session_id);

    CROW_LOG_INFO << "Archive ready for session " << session_id << ": " << result.files_written
                  << " written, " << result.files_skipped << " skipped";
    return result;
}

Result<bool> ArchiveService::writeEntry(const std::filesystem::path& output_dir, const FileDescriptor& file) {
    auto sanitized = sanitizer_.Sanitize(file.path);
    if (!sanitized.valid) {
        CROW_LOG_WARNING << "Invalid file path skipped: " << sanitized.error_message;
        return false;
    }

    // Audited even when normalization already neutralized it
    if (PathSanitizer::ContainsTraversal(file.path)) {
        Error::Security("Path traversal attempt", "entry '" + file.path + "' normalized to '" +
                        sanitized.canonical_path + "'").log("Sanitized entry");
    }

    auto target = PathSanitizer::ResolveWithin(output_dir, sanitized.canonical_path);
    if (!target) {
        Error::Security("Path traversal attempt", "entry '" + file.path + "' escapes the output directory")
            .log("Skipping entry");
        return false;
    }

    if (!sanitizer_.IsAllowedExtension(sanitized.canonical_path)) {
        CROW_LOG_WARNING << "Invalid file extension skipped: " << sanitized.canonical_path;
        return false;
    }

    auto bytes = decoder_.decode(file.content, file.encoding);
    if (!bytes) {
        bytes.error().log("Skipping " + sanitized.canonical_path);
        return false;
    }

    auto written = writeBytes(*target, *bytes);
    if (!written) {
        return std::move(written.error());
    }

    CROW_LOG_DEBUG << "  Saved: " << sanitized.canonical_path << " (" << bytes->size() << " bytes, "
                   << PayloadDecoder::encodingName(file.encoding) << ")";
    return true;
}

Result<bool> ArchiveService::writeBytes(const std::filesystem::path& target, const std::string& bytes) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        return Error::Storage("Internal server error",
                              "cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Error::Storage("Internal server error", "cannot open " + target.string() + " for writing");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (out.fail()) {
        std::filesystem::remove(target, ec);
        return Error::Storage("Internal server error", "short write to " + target.string());
    }
    return true;
}

Result<StoredImage> ArchiveService::storeUploadedImage(const std::string& session_id,
                                                       const std::string& filename,
                                                       const std::string& declared_type,
                                                       const std::string& bytes) {
    if (!SessionRegistry::isValidSessionId(session_id)) {
        return Error::Validation("Invalid session ID");
    }

    if (!content_validator_.isAllowedDeclaredType(declared_type)) {
        return Error::Validation("Invalid file type. Only JPEG, PNG, and WebP are allowed.",
                                 "declared type '" + declared_type + "'");
    }

    if (!ContentValidator::checkSize(bytes.size(), config_.limits.max_image_bytes)) {
        return Error::TooLarge("File too large", std::to_string(bytes.size()) + " bytes uploaded");
    }

    auto classification = ContentValidator::classifyImage(bytes);
    if (!classification) {
        return Error::Validation("Invalid image file", "magic bytes do not match declared '" + declared_type + "'");
    }

    std::string name = PathSanitizer::SanitizeFilename(filename);
    if (name.empty() || name == "." || name == "..") {
        name = "image";
    }
    if (!image_sanitizer_.IsAllowedExtension(name)) {
        name += ContentValidator::extensionFor(classification->format);
    }

    auto sanitized = image_sanitizer_.Sanitize(config_.images_dir_name + "/" + name);
    if (!sanitized.valid) {
        return Error::Validation("Invalid filename", sanitized.error_message);
    }

    auto output_dir = registry_.ensureOutputDirectory(session_id);
    if (!output_dir) {
        return std::move(output_dir.error());
    }

    auto target = PathSanitizer::ResolveWithin(*output_dir, sanitized.canonical_path);
    if (!target) {
        return Error::Security("Invalid path", "upload '" + filename + "' escapes the output directory");
    }

    auto written = writeBytes(*target, bytes);
    if (!written) {
        return std::move(written.error());
    }

    CROW_LOG_INFO << "Stored " << ContentValidator::formatName(classification->format) << " upload "
                  << sanitized.canonical_path << " for session " << session_id;

    StoredImage stored;
    stored.relative_path = sanitized.canonical_path;
    stored.mime_type = classification->mime_type;
    stored.size = bytes.size();
    return stored;
}

} // namespace arbundle
