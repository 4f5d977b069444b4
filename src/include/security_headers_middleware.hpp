#pragma once

#include <crow.h>
#include <string>

#include "server_config.hpp"

namespace arbundle {

/**
 * Attaches the hardened response headers to every response and enforces
 * the CORS origin allow-list. Requests without an Origin header (same
 * origin, curl) pass through; a foreign Origin is refused with 403.
 */
class SecurityHeadersMiddleware {
public:
    static constexpr const char* CONTENT_SECURITY_POLICY =
        "default-src 'self'; "
        "script-src 'self' 'unsafe-inline' 'unsafe-eval' https://cdn.jsdelivr.net https://aframe.io; "
        "style-src 'self' 'unsafe-inline'; "
        "img-src 'self' data: blob: https:; "
        "connect-src 'self' https://drive.google.com https://lh3.googleusercontent.com; "
        "frame-src 'none'; "
        "object-src 'none'; "
        "base-uri 'self'; "
        "form-action 'self'";

    struct context {
        std::string origin;
        bool origin_allowed = false;
    };

    void setConfig(const ServerConfig* config);

    void before_handle(crow::request& req, crow::response& res, context& ctx);
    void after_handle(crow::request& req, crow::response& res, context& ctx);

    bool isAllowedOrigin(const std::string& origin) const;

    // Security headers are applied to every response, error responses included
    static void applySecurityHeaders(crow::response& res);

private:
    const ServerConfig* config = nullptr;

    void applyCorsHeaders(crow::response& res, const context& ctx) const;
};

} // namespace arbundle
