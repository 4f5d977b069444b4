#include "content_validator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace arbundle {

ContentValidator::ContentValidator(std::set<std::string> allowed_declared_types)
    : allowed_declared_types_(std::move(allowed_declared_types)) {
}

std::optional<ImageClassification> ContentValidator::classifyImage(const std::string& bytes) {
    auto at = [&bytes](size_t i) {
        return static_cast<unsigned char>(bytes[i]);
    };

    if (bytes.size() >= 4 && at(0) == 0x89 && at(1) == 0x50 && at(2) == 0x4E && at(3) == 0x47) {
        return ImageClassification{ImageFormat::Png, "image/png"};
    }

    if (bytes.size() >= 3 && at(0) == 0xFF && at(1) == 0xD8 && at(2) == 0xFF) {
        return ImageClassification{ImageFormat::Jpeg, "image/jpeg"};
    }

    // RIFF container header
    if (bytes.size() >= 4 && at(0) == 0x52 && at(1) == 0x49 && at(2) == 0x46 && at(3) == 0x46) {
        return ImageClassification{ImageFormat::Webp, "image/webp"};
    }

    return std::nullopt;
}

bool ContentValidator::isAllowedDeclaredType(const std::string& declared_type) const {
    std::string mime = declared_type.substr(0, declared_type.find(';'));
    mime.erase(0, mime.find_first_not_of(" \t"));
    auto last = mime.find_last_not_of(" \t");
    mime.erase(last == std::string::npos ? 0 : last + 1);
    std::transform(mime.begin(), mime.end(), mime.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return allowed_declared_types_.find(mime) != allowed_declared_types_.end();
}

std::string ContentValidator::formatName(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png:
            return "PNG";
        case ImageFormat::Jpeg:
            return "JPEG";
        case ImageFormat::Webp:
            return "WebP";
    }
    return "Unknown";
}

std::string ContentValidator::extensionFor(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png:
            return ".png";
        case ImageFormat::Jpeg:
            return ".jpg";
        case ImageFormat::Webp:
            return ".webp";
    }
    return "";
}

} // namespace arbundle
