#pragma once

#include <optional>
#include <set>
#include <string>

namespace arbundle {

enum class ImageFormat {
    Png,
    Jpeg,
    Webp
};

struct ImageClassification {
    ImageFormat format;
    std::string mime_type;
};

/**
 * Decides what a byte buffer really is, independent of any declared type.
 *
 * Only PNG, JPEG and WebP signatures are accepted. A transport-level
 * content type is adversarial input and is never the sole gate.
 */
class ContentValidator {
public:
    ContentValidator() = default;
    explicit ContentValidator(std::set<std::string> allowed_declared_types);

    /**
     * Inspect the leading bytes:
     *   89 50 4E 47 -> image/png
     *   FF D8 FF    -> image/jpeg
     *   52 49 46 46 -> image/webp
     * @return classification, or nullopt for anything else
     */
    static std::optional<ImageClassification> classifyImage(const std::string& bytes);

    static bool checkSize(std::size_t size, std::size_t limit) {
        return size <= limit;
    }

    /**
     * Pre-filter on a declared content type (e.g. a multipart part header).
     * Parameters such as "; charset=" are ignored. Callers must still run
     * classifyImage on the bytes.
     */
    bool isAllowedDeclaredType(const std::string& declared_type) const;

    static std::string formatName(ImageFormat format);

    /**
     * File extension matching a classified format, including the dot.
     */
    static std::string extensionFor(ImageFormat format);

private:
    std::set<std::string> allowed_declared_types_ = {"image/jpeg", "image/png", "image/webp"};
};

} // namespace arbundle
