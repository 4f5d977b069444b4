#include <catch2/catch_test_macros.hpp>
#include <crow/http_request.h>
#include <crow/http_response.h>
#include <thread>
#include <chrono>

#include "rate_limit_middleware.hpp"
#include "test_utils.hpp"

namespace arbundle {
namespace test {

class RateLimitTestHelper {
public:
    static ServerConfig createConfig(int general_max, int proxy_max, int interval = 60) {
        ServerConfig config;
        config.general_rate_limit = RateLimitRule{true, general_max, interval};
        config.proxy_rate_limit = RateLimitRule{true, proxy_max, interval};
        return config;
    }

    static crow::request createRequest(const std::string& url, const std::string& client_ip = "192.168.1.1") {
        crow::request req;
        req.url = url;
        req.remote_ip_address = client_ip;
        return req;
    }

    // Issue one request and return the response code
    static int hit(RateLimitMiddleware& middleware, const std::string& url, const std::string& client_ip = "192.168.1.1") {
        crow::request req = createRequest(url, client_ip);
        crow::response res;
        RateLimitMiddleware::context ctx;
        middleware.before_handle(req, res, ctx);
        return res.code;
    }
};

TEST_CASE("RateLimitMiddleware: rate limiting disabled", "[rate_limit]") {
    ServerConfig config;
    config.general_rate_limit.enabled = false;
    config.proxy_rate_limit.enabled = false;

    RateLimitMiddleware middleware;
    middleware.setConfig(&config);

    crow::request req = RateLimitTestHelper::createRequest("/api/create-zip");
    crow::response res;
    RateLimitMiddleware::context ctx;

    middleware.before_handle(req, res, ctx);

    REQUIRE(res.code == 200);
    REQUIRE(res.get_header_value("X-RateLimit-Limit").empty());
    REQUIRE(res.get_header_value("X-RateLimit-Remaining").empty());
}

TEST_CASE("RateLimitMiddleware: request under limit", "[rate_limit]") {
    auto config = RateLimitTestHelper::createConfig(10, 3);
    RateLimitMiddleware middleware;
    middleware.setConfig(&config);

    SECTION("First request returns success with headers") {
        crow::request req = RateLimitTestHelper::createRequest("/api/create-zip");
        crow::response res;
        RateLimitMiddleware::context ctx;

        middleware.before_handle(req, res, ctx);

        REQUIRE(res.code != 429);
        REQUIRE(res.get_header_value("X-RateLimit-Limit") == "10");
        REQUIRE(res.get_header_value("X-RateLimit-Remaining") == "9");
        REQUIRE_FALSE(res.get_header_value("X-RateLimit-Reset").empty());
        REQUIRE(ctx.remaining == 9);
    }

    SECTION("Multiple requests decrement remaining count") {
        crow::response res1, res2;
        RateLimitMiddleware::context ctx1, ctx2;

        auto req1 = RateLimitTestHelper::createRequest("/api/session");
        auto req2 = RateLimitTestHelper::createRequest("/download/x/y");

        middleware.before_handle(req1, res1, ctx1);
        middleware.before_handle(req2, res2, ctx2);

        REQUIRE(res1.get_header_value("X-RateLimit-Remaining") == "9");
        REQUIRE(res2.get_header_value("X-RateLimit-Remaining") == "8");
    }

    SECTION("Proxy requests report the proxy window") {
        crow::request req = RateLimitTestHelper::createRequest("/api/proxy-image");
        crow::response res;
        RateLimitMiddleware::context ctx;

        middleware.before_handle(req, res, ctx);

        REQUIRE(res.get_header_value("X-RateLimit-Limit") == "3");
        REQUIRE(res.get_header_value("X-RateLimit-Remaining") == "2");
    }
}

TEST_CASE("RateLimitMiddleware: request over limit", "[rate_limit]") {
    auto config = RateLimitTestHelper::createConfig(5, 2);
    RateLimitMiddleware middleware;
    middleware.setConfig(&config);

    SECTION("General limit answers 429 with a JSON body") {
        for (int i = 0; i < 5; i++) {
            REQUIRE(RateLimitTestHelper::hit(middleware, "/api/create-zip") != 429);
        }

        crow::request req = RateLimitTestHelper::createRequest("/api/create-zip");
        crow::response res;
        RateLimitMiddleware::context ctx;
        middleware.before_handle(req, res, ctx);

        REQUIRE(res.code == 429);
        REQUIRE(ctx.remaining <= 0);
        REQUIRE(res.body.find("\"success\":false") != std::string::npos);
        REQUIRE(res.body.find("Too many requests") != std::string::npos);
    }

    SECTION("Proxy limit is stricter than the general one") {
        REQUIRE(RateLimitTestHelper::hit(middleware, "/api/proxy-image") != 429);
        REQUIRE(RateLimitTestHelper::hit(middleware, "/api/proxy-image") != 429);
        REQUIRE(RateLimitTestHelper::hit(middleware, "/api/proxy-image") == 429);

        // Other routes still have general budget left
        REQUIRE(RateLimitTestHelper::hit(middleware, "/api/session") != 429);
    }

    SECTION("Clients are counted separately") {
        for (int i = 0; i < 5; i++) {
            RateLimitTestHelper::hit(middleware, "/api/session", "10.0.0.1");
        }
        REQUIRE(RateLimitTestHelper::hit(middleware, "/api/session", "10.0.0.1") == 429);
        REQUIRE(RateLimitTestHelper::hit(middleware, "/api/session", "10.0.0.2") != 429);
    }
}

TEST_CASE("RateLimitMiddleware: reset after interval", "[rate_limit]") {
    auto config = RateLimitTestHelper::createConfig(1, 1, 1);
    RateLimitMiddleware middleware;
    middleware.setConfig(&config);

    REQUIRE(RateLimitTestHelper::hit(middleware, "/api/session") != 429);
    REQUIRE(RateLimitTestHelper::hit(middleware, "/api/session") == 429);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    REQUIRE(RateLimitTestHelper::hit(middleware, "/api/session") != 429);
}

TEST_CASE("RateLimitMiddleware: expired windows are evicted", "[rate_limit]") {
    auto config = RateLimitTestHelper::createConfig(5, 5, 1);
    RateLimitMiddleware middleware;
    middleware.setConfig(&config);

    for (int i = 0; i < 20; i++) {
        RateLimitTestHelper::hit(middleware, "/api/session", "10.1.0." + std::to_string(i));
    }
    RateLimitTestHelper::hit(middleware, "/api/proxy-image", "10.1.0.0");
    REQUIRE(middleware.trackedClients() == 21);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    // One proxy request passes both windows and clears both
    REQUIRE(RateLimitTestHelper::hit(middleware, "/api/proxy-image", "10.2.0.1") != 429);
    REQUIRE(middleware.trackedClients() == 2);
}

} // namespace test
} // namespace arbundle
