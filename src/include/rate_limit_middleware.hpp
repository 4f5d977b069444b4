#pragma once

#include <crow.h>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

#include "server_config.hpp"

namespace arbundle {

/**
 * Fixed-window request admission per client IP. The remote-image proxy has
 * its own, stricter window on top of the general one.
 */
class RateLimitMiddleware {
public:
    static constexpr const char* PROXY_PATH = "/api/proxy-image";

    struct context {
        int remaining = 0;
        std::chrono::steady_clock::time_point reset_time;
    };

    void setConfig(const ServerConfig* config);

    void before_handle(crow::request& req, crow::response& res, context& ctx);
    void after_handle(crow::request& req, crow::response& res, context& ctx);

    // Window entries held across both rules
    std::size_t trackedClients() const;

private:
    const ServerConfig* config = nullptr;
    std::unordered_map<std::string, context> general_contexts;
    std::unordered_map<std::string, context> proxy_contexts;
    mutable std::mutex mutex;

    // Returns false when the client has no requests left in the window
    bool admit(std::unordered_map<std::string, context>& contexts,
               const std::string& client_ip,
               const RateLimitRule& rule,
               context& ctx);

    // Clients whose window has run out carry no state worth keeping
    static void evictExpired(std::unordered_map<std::string, context>& contexts,
                             std::chrono::steady_clock::time_point now);

    static void reject(crow::response& res, const std::string& message);
};

} // namespace arbundle
