#include "security_headers_middleware.hpp"
#include "error.hpp"

#include <algorithm>

namespace arbundle {

void SecurityHeadersMiddleware::setConfig(const ServerConfig* config) {
    this->config = config;
}

bool SecurityHeadersMiddleware::isAllowedOrigin(const std::string& origin) const {
    if (!config) {
        return false;
    }
    return std::find(config->allowed_origins.begin(), config->allowed_origins.end(), origin) !=
           config->allowed_origins.end();
}

void SecurityHeadersMiddleware::before_handle(crow::request& req, crow::response& res, context& ctx) {
    ctx.origin = req.get_header_value("Origin");
    ctx.origin_allowed = !ctx.origin.empty() && isAllowedOrigin(ctx.origin);

    if (!ctx.origin.empty() && !ctx.origin_allowed) {
        Error error = Error::Security("Not allowed by CORS", "origin " + ctx.origin);
        error.log("cors");
        res = error.toHttpResponse();
        applySecurityHeaders(res);
        res.end();
        return;
    }

    if (req.method == crow::HTTPMethod::Options) {
        res.code = 204;
        applySecurityHeaders(res);
        applyCorsHeaders(res, ctx);
        res.end();
    }
}

void SecurityHeadersMiddleware::after_handle(crow::request& req, crow::response& res, context& ctx) {
    applySecurityHeaders(res);
    applyCorsHeaders(res, ctx);
}

void SecurityHeadersMiddleware::applySecurityHeaders(crow::response& res) {
    res.set_header("Content-Security-Policy", CONTENT_SECURITY_POLICY);
    res.set_header("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
    res.set_header("X-Content-Type-Options", "nosniff");
    res.set_header("X-Frame-Options", "DENY");
    res.set_header("Referrer-Policy", "no-referrer");
}

void SecurityHeadersMiddleware::applyCorsHeaders(crow::response& res, const context& ctx) const {
    if (!ctx.origin_allowed) {
        return;
    }
    res.set_header("Access-Control-Allow-Origin", ctx.origin);
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.set_header("Access-Control-Allow-Credentials", "true");
    res.set_header("Vary", "Origin");
}

} // namespace arbundle
