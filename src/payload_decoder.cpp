#include "payload_decoder.hpp"
#include "content_validator.hpp"
#include "json_utils.hpp"

#include <cctype>

namespace arbundle {

ContentEncoding PayloadDecoder::parseEncoding(const std::string& type) {
    if (type == "base64") {
        return ContentEncoding::Base64;
    }
    if (type == "json") {
        return ContentEncoding::Json;
    }
    return ContentEncoding::Raw;
}

std::string PayloadDecoder::encodingName(ContentEncoding encoding) {
    switch (encoding) {
        case ContentEncoding::Raw:
            return "raw";
        case ContentEncoding::Base64:
            return "base64";
        case ContentEncoding::Json:
            return "json";
    }
    return "unknown";
}

Result<std::string> PayloadDecoder::decode(const crow::json::rvalue& content, ContentEncoding encoding) const {
    std::string bytes;

    switch (encoding) {
        case ContentEncoding::Base64: {
            if (!JsonUtils::isString(content)) {
                return Error::Validation("Invalid file content", "base64 content is not a string");
            }
            std::string encoded = JsonUtils::extractString(content);
            // Decoding shrinks the payload, but the encoded form is held in memory first
            if (!ContentValidator::checkSize(encoded.size(), limits_.max_encoded_bytes)) {
                return Error::TooLarge("Payload too large",
                                       "base64 content of " + std::to_string(encoded.size()) + " characters");
            }
            auto decoded = decodeBase64(encoded);
            if (!decoded) {
                return std::move(decoded.error());
            }
            bytes = std::move(*decoded);
            break;
        }
        case ContentEncoding::Json:
            bytes = JsonUtils::prettyPrint(content, 2);
            break;
        case ContentEncoding::Raw:
            if (!JsonUtils::isString(content)) {
                return Error::Validation("Invalid file content", "raw content is not a string");
            }
            bytes = JsonUtils::extractString(content);
            break;
    }

    if (!ContentValidator::checkSize(bytes.size(), limits_.max_file_bytes)) {
        return Error::TooLarge("Payload too large",
                               "decoded content of " + std::to_string(bytes.size()) + " bytes");
    }

    return bytes;
}

Result<std::string> PayloadDecoder::decodeBase64(const std::string& encoded) {
    std::string data = encoded;

    // data:image/png;base64,....
    if (data.compare(0, 5, "data:") == 0) {
        auto marker = data.find(";base64,");
        if (marker == std::string::npos) {
            return Error::Validation("Invalid file content", "data URL without base64 marker");
        }
        data.erase(0, marker + 8);
    }

    std::string cleaned;
    cleaned.reserve(data.size());
    for (unsigned char c : data) {
        if (std::isspace(c)) {
            continue;
        }
        if (!(std::isalnum(c) || c == '+' || c == '/' || c == '-' || c == '_' || c == '=')) {
            return Error::Validation("Invalid file content", "invalid base64 character");
        }
        cleaned += static_cast<char>(c);
    }

    auto padding = cleaned.find('=');
    if (padding != std::string::npos) {
        if (cleaned.find_first_not_of('=', padding) != std::string::npos ||
            cleaned.size() - padding > 2) {
            return Error::Validation("Invalid file content", "malformed base64 padding");
        }
        if (cleaned.size() % 4 != 0) {
            return Error::Validation("Invalid file content", "malformed base64 padding");
        }
    }

    // Unpadded input is accepted; one dangling character cannot encode a byte
    if (cleaned.size() % 4 == 1) {
        return Error::Validation("Invalid file content", "truncated base64 data");
    }
    while (cleaned.size() % 4 != 0) {
        cleaned += '=';
    }

    if (cleaned.empty()) {
        return std::string();
    }
    return crow::utility::base64decode(cleaned);
}

} // namespace arbundle
