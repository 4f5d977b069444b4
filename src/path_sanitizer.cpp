#include "path_sanitizer.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

namespace arbundle {

PathSanitizer::PathSanitizer() : _config() {}

PathSanitizer::PathSanitizer(const Config& config) : _config(config) {}

PathSanitizer::SanitizeResult PathSanitizer::Sanitize(const std::string& raw_path) const {
    if (raw_path.empty()) {
        return SanitizeResult::Failure("Path cannot be empty");
    }

    if (raw_path.find('\0') != std::string::npos) {
        return SanitizeResult::Failure("Path contains NUL byte");
    }

    std::string normalized = NormalizeSeparators(raw_path);

    // Resolve '.' and '..' lexically. A '..' that would climb above the
    // start of the path is dropped, which strips any leading traversal run.
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= normalized.size()) {
        size_t end = normalized.find('/', start);
        if (end == std::string::npos) {
            end = normalized.size();
        }
        std::string segment = normalized.substr(start, end - start);
        start = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(segment);
    }

    if (segments.empty()) {
        return SanitizeResult::Failure("Path resolves to nothing");
    }

    std::string canonical;
    for (const auto& segment : segments) {
        if (!canonical.empty()) {
            canonical += '/';
        }
        canonical += segment;
    }

    if (canonical.size() > _config.max_path_length) {
        return SanitizeResult::Failure("Path exceeds maximum length");
    }

    return SanitizeResult::Success(canonical);
}

bool PathSanitizer::ContainIn(const std::filesystem::path& base,
                              const std::filesystem::path& candidate) {
    std::error_code ec;

    // weakly_canonical resolves symlinks for the existing prefix and
    // normalizes the rest, so a symlinked directory cannot smuggle a write out
    auto resolved_base = std::filesystem::weakly_canonical(std::filesystem::absolute(base, ec), ec);
    if (ec) {
        return false;
    }
    auto resolved_candidate = std::filesystem::weakly_canonical(std::filesystem::absolute(candidate, ec), ec);
    if (ec) {
        return false;
    }

    // Compare segment by segment: /base-evil must not match /base
    auto cand_it = resolved_candidate.begin();
    for (const auto& part : resolved_base) {
        // A trailing separator shows up as an empty final element
        if (part.empty()) {
            break;
        }
        if (cand_it == resolved_candidate.end() || *cand_it != part) {
            return false;
        }
        ++cand_it;
    }
    return true;
}

std::optional<std::filesystem::path> PathSanitizer::ResolveWithin(
    const std::filesystem::path& base,
    const std::string& relative) {

    std::filesystem::path rel(relative);
    if (rel.is_absolute() || rel.has_root_name()) {
        return std::nullopt;
    }

    auto full = (base / rel).lexically_normal();
    if (!ContainIn(base, full)) {
        return std::nullopt;
    }
    return full;
}

bool PathSanitizer::IsAllowedExtension(const std::string& path) const {
    std::string ext = ExtensionOf(path);
    if (ext.empty()) {
        return false;
    }
    return _config.allowed_extensions.find(ext) != _config.allowed_extensions.end();
}

bool PathSanitizer::IsValidFilename(const std::string& filename) {
    if (filename.empty() || filename.size() > 255) {
        return false;
    }
    if (filename == "." || filename == "..") {
        return false;
    }
    return std::all_of(filename.begin(), filename.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::string PathSanitizer::SanitizeFilename(const std::string& filename) {
    std::string result = filename;
    std::replace_if(result.begin(), result.end(), [](unsigned char c) {
        return !(std::isalnum(c) || c == '_' || c == '-' || c == '.');
    }, '_');
    return result;
}

bool PathSanitizer::ContainsTraversal(const std::string& path) {
    std::string normalized = NormalizeSeparators(path);

    // Check for standalone '..'
    if (normalized == "..") {
        return true;
    }

    // Check for '../' at start
    if (normalized.length() >= 3 && normalized.substr(0, 3) == "../") {
        return true;
    }

    // '/..' followed by '/' or end of string; '/...file' is a plain name
    size_t pos = 0;
    while ((pos = normalized.find("/..", pos)) != std::string::npos) {
        size_t after_pos = pos + 3;
        if (after_pos >= normalized.length() || normalized[after_pos] == '/') {
            return true;
        }
        pos++;
    }

    return false;
}

std::string PathSanitizer::NormalizeSeparators(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string PathSanitizer::ExtensionOf(const std::string& path) {
    std::string normalized = NormalizeSeparators(path);
    size_t slash = normalized.rfind('/');
    std::string name = slash == std::string::npos ? normalized : normalized.substr(slash + 1);

    size_t dot = name.rfind('.');
    // Dotfiles like ".json" have no extension, matching common path semantics
    if (dot == std::string::npos || dot == 0) {
        return "";
    }

    std::string ext = name.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

} // namespace arbundle
