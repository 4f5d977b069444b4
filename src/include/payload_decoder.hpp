#pragma once

#include <crow.h>
#include <string>

#include "error.hpp"

namespace arbundle {

enum class ContentEncoding {
    Raw,     // content is a string, written as-is
    Base64,  // content is a base64 string, optionally a data: URL
    Json     // content is any JSON value, written pretty-printed
};

/**
 * One client-supplied file: untrusted relative path plus payload.
 */
struct FileDescriptor {
    std::string path;
    ContentEncoding encoding = ContentEncoding::Raw;
    crow::json::rvalue content;  // borrows from the parsed request document
};

/**
 * Turns a FileDescriptor payload into the bytes to write, enforcing
 * size limits before decoding (encoded length) and after (decoded size).
 */
class PayloadDecoder {
public:
    struct Limits {
        std::size_t max_encoded_bytes = 20 * 1024 * 1024;
        std::size_t max_file_bytes = 20 * 1024 * 1024;
    };

    PayloadDecoder() = default;
    explicit PayloadDecoder(const Limits& limits) : limits_(limits) {}

    /**
     * Map the wire "type" field to an encoding. Anything other than
     * "base64" or "json" is treated as raw text.
     */
    static ContentEncoding parseEncoding(const std::string& type);

    static std::string encodingName(ContentEncoding encoding);

    Result<std::string> decode(const crow::json::rvalue& content, ContentEncoding encoding) const;

    /**
     * Strict base64 decode: whitespace ignored, a "data:...;base64," prefix
     * stripped, any other character outside the alphabet rejected.
     */
    static Result<std::string> decodeBase64(const std::string& encoded);

private:
    Limits limits_;
};

} // namespace arbundle
