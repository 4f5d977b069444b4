#include "error.hpp"

namespace arbundle {

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::Validation:
            return "Validation";
        case ErrorCategory::PayloadTooLarge:
            return "PayloadTooLarge";
        case ErrorCategory::SecurityPolicy:
            return "SecurityPolicy";
        case ErrorCategory::Upstream:
            return "Upstream";
        case ErrorCategory::Timeout:
            return "Timeout";
        case ErrorCategory::Storage:
            return "Storage";
        case ErrorCategory::NotFound:
            return "NotFound";
        case ErrorCategory::Internal:
            return "Internal";
        default:
            return "Unknown";
    }
}

crow::response Error::toHttpResponse() const {
    return crow::response(http_status_code, toJson());
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["success"] = false;
    error_json["error"]["category"] = getCategoryName();
    error_json["error"]["message"] = message;
    return error_json;
}

void Error::log(const std::string& context) const {
    std::string detail_suffix = details.empty() ? "" : " (" + details + ")";

    if (isSecurityViolation()) {
        CROW_LOG_WARNING << "[audit] " << context << ": " << message << detail_suffix;
        return;
    }

    switch (category) {
        case ErrorCategory::Storage:
        case ErrorCategory::Internal:
            CROW_LOG_ERROR << context << ": " << message << detail_suffix;
            break;
        case ErrorCategory::Upstream:
        case ErrorCategory::Timeout:
            CROW_LOG_WARNING << context << ": " << message << detail_suffix;
            break;
        default:
            CROW_LOG_INFO << context << ": " << message << detail_suffix;
            break;
    }
}

} // namespace arbundle
