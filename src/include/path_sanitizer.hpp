#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace arbundle {

/**
 * Security-focused handling of client-supplied relative paths.
 *
 * This class provides:
 * - Lexical normalization with leading traversal segments stripped
 * - Segment-aware containment checks after symlink resolution
 * - Extension allow-listing for persisted output
 * - Filename whitelisting for download requests
 */
class PathSanitizer {
public:
    /**
     * Configuration for path sanitization.
     */
    struct Config {
        // Maximum length of a sanitized relative path
        std::size_t max_path_length = 255;

        // Allowed extensions (lowercase, including the dot)
        std::set<std::string> allowed_extensions = {".glb", ".mind", ".json"};
    };

    /**
     * Result of sanitization.
     */
    struct SanitizeResult {
        bool valid = false;
        std::string canonical_path;
        std::string error_message;

        static SanitizeResult Success(const std::string& path) {
            return {true, path, ""};
        }

        static SanitizeResult Failure(const std::string& error) {
            return {false, "", error};
        }
    };

    PathSanitizer();
    explicit PathSanitizer(const Config& config);

    /**
     * Normalize an untrusted relative path.
     *
     * Backslashes become '/', '.' and '..' segments are resolved lexically,
     * the leading run of '..' segments and any root are stripped.
     *
     * @param raw_path Client-supplied path
     * @return Canonical relative path, or failure for empty/overlong/NUL input
     */
    SanitizeResult Sanitize(const std::string& raw_path) const;

    /**
     * Check that candidate lies inside base, comparing whole path segments
     * after both are made absolute and symlink-resolved.
     */
    static bool ContainIn(const std::filesystem::path& base,
                          const std::filesystem::path& candidate);

    /**
     * Join a sanitized relative path onto base and verify containment.
     *
     * @return Absolute target path, or nullopt if it would escape base
     */
    static std::optional<std::filesystem::path> ResolveWithin(
        const std::filesystem::path& base,
        const std::string& relative);

    /**
     * Check the lowercase extension of path against the configured set.
     */
    bool IsAllowedExtension(const std::string& path) const;

    /**
     * Filenames accepted in download URLs: [A-Za-z0-9_.-]+, not "." or "..".
     */
    static bool IsValidFilename(const std::string& filename);

    /**
     * Replace every character outside [A-Za-z0-9_.-] with '_'.
     */
    static std::string SanitizeFilename(const std::string& filename);

    /**
     * Check if a path contains '..' segments in either separator style.
     */
    static bool ContainsTraversal(const std::string& path);

    const Config& GetConfig() const { return _config; }

private:
    Config _config;

    // Normalize path separators to forward slashes
    static std::string NormalizeSeparators(const std::string& path);

    // Lowercase extension including the dot, empty if none
    static std::string ExtensionOf(const std::string& path);
};

} // namespace arbundle
