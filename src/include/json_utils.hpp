#pragma once

#include <crow.h>
#include <string>
#include <optional>

namespace arbundle {

/**
 * Utility functions for common JSON operations.
 * Provides safe string extraction, type checking and pretty printing.
 */
class JsonUtils {
public:
    /**
     * Extract string from JSON value.
     * Returns the string value directly, or empty string if value is not a string.
     */
    static std::string extractString(const crow::json::rvalue& value) {
        if (value.t() != crow::json::type::String) {
            return "";
        }

        // For rvalue, .s() gives us the string directly
        return std::string(value.s());
    }

    /**
     * Extract optional string from JSON object by key.
     * Returns nullopt if key is missing or value is not a string.
     */
    static std::optional<std::string> extractOptionalString(
        const crow::json::rvalue& json,
        const std::string& key) {

        if (json.t() != crow::json::type::Object || !json.has(key)) {
            return std::nullopt;
        }

        auto value = json[key];
        if (value.t() != crow::json::type::String) {
            return std::nullopt;
        }

        return extractString(value);
    }

    static bool isString(const crow::json::rvalue& value) {
        return value.t() == crow::json::type::String;
    }

    static bool isObject(const crow::json::rvalue& value) {
        return value.t() == crow::json::type::Object;
    }

    static bool isArray(const crow::json::rvalue& value) {
        return value.t() == crow::json::type::List;
    }

    /**
     * Serialize a JSON value with two-space indentation, keeping member
     * order as parsed. Output matches the common browser formatting:
     * "key": value, empty containers as {} and [], no trailing newline.
     */
    static std::string prettyPrint(const crow::json::rvalue& value, int indent = 2);

    /**
     * Quote and escape a string for JSON output.
     */
    static std::string quote(const std::string& str);

private:
    static void prettyPrintInto(const crow::json::rvalue& value, int indent, int depth, std::string& out);
    static std::string formatNumber(const crow::json::rvalue& value);
};

} // namespace arbundle
