#include "rate_limit_middleware.hpp"

namespace arbundle {

void RateLimitMiddleware::setConfig(const ServerConfig* config) {
    this->config = config;
}

void RateLimitMiddleware::before_handle(crow::request& req, crow::response& res, context& ctx) {
    if (!config) return;

    std::string client_ip = req.remote_ip_address;
    const bool is_proxy = req.url == PROXY_PATH;

    std::lock_guard<std::mutex> lock(mutex);

    if (config->general_rate_limit.enabled &&
        !admit(general_contexts, client_ip, config->general_rate_limit, ctx)) {
        reject(res, "Too many requests from this IP, please try again later.");
        return;
    }

    if (is_proxy && config->proxy_rate_limit.enabled &&
        !admit(proxy_contexts, client_ip, config->proxy_rate_limit, ctx)) {
        reject(res, "Too many proxy requests, please slow down.");
        return;
    }

    const auto& rule = is_proxy && config->proxy_rate_limit.enabled ? config->proxy_rate_limit
                                                                    : config->general_rate_limit;
    if (rule.enabled) {
        res.add_header("X-RateLimit-Limit", std::to_string(rule.max));
        res.add_header("X-RateLimit-Remaining", std::to_string(ctx.remaining));
        res.add_header("X-RateLimit-Reset", std::to_string(std::chrono::duration_cast<std::chrono::seconds>(ctx.reset_time.time_since_epoch()).count()));
    }
}

void RateLimitMiddleware::after_handle(crow::request& req, crow::response& res, context& ctx) {
    // No action needed after handling the request
}

bool RateLimitMiddleware::admit(std::unordered_map<std::string, context>& contexts,
                                const std::string& client_ip,
                                const RateLimitRule& rule,
                                context& ctx) {
    auto now = std::chrono::steady_clock::now();

    auto known = contexts.find(client_ip);
    if (known == contexts.end() || now >= known->second.reset_time) {
        evictExpired(contexts, now);
    }

    auto& client_ctx = contexts[client_ip];

    if (now >= client_ctx.reset_time) {
        client_ctx.remaining = rule.max;
        client_ctx.reset_time = now + std::chrono::seconds(rule.interval);
    }

    if (client_ctx.remaining <= 0) {
        ctx = client_ctx;
        return false;
    }

    client_ctx.remaining--;
    ctx = client_ctx;
    return true;
}

void RateLimitMiddleware::evictExpired(std::unordered_map<std::string, context>& contexts,
                                       std::chrono::steady_clock::time_point now) {
    for (auto it = contexts.begin(); it != contexts.end();) {
        if (now >= it->second.reset_time) {
            it = contexts.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t RateLimitMiddleware::trackedClients() const {
    std::lock_guard<std::mutex> lock(mutex);
    return general_contexts.size() + proxy_contexts.size();
}

void RateLimitMiddleware::reject(crow::response& res, const std::string& message) {
    crow::json::wvalue body;
    body["success"] = false;
    body["error"]["category"] = "RateLimit";
    body["error"]["message"] = message;
    res.code = 429;
    res.set_header("Content-Type", "application/json");
    res.write(body.dump());
    res.end();
}

} // namespace arbundle
