#pragma once

#include <crow.h>
#include <crow/multipart.h>
#include <memory>
#include <string>

#include "archive_service.hpp"
#include "http_client.hpp"
#include "image_proxy_service.hpp"
#include "rate_limit_middleware.hpp"
#include "security_headers_middleware.hpp"
#include "server_config.hpp"
#include "session_lifecycle.hpp"
#include "session_registry.hpp"
#include "ssrf_guard.hpp"

namespace arbundle {

using ArbundleApp = crow::App<SecurityHeadersMiddleware, RateLimitMiddleware>;

class APIServer
{
public:
    APIServer(const ServerConfig& config,
              std::shared_ptr<IRemoteFetcher> fetcher,
              SsrfGuard::HostResolver resolver);
    ~APIServer();

    void run();
    void stop();

    // Route handlers, public so they can be exercised without a socket
    crow::response startSession();
    crow::response createArchive(const crow::request& req);
    crow::response uploadImage(const crow::request& req);
    crow::response proxyImage(const crow::request& req);
    void downloadFile(crow::response& res, const std::string& session_id, const std::string& filename);

    ArbundleApp& getApp() { return app; }
    SessionLifecycle& getLifecycle() { return lifecycle; }
    const SessionRegistry& getRegistry() const { return registry; }

private:
    void setupRoutes();

    static crow::response jsonResponse(int code, crow::json::wvalue&& body);
    static crow::response internalError(const std::string& context, const std::exception& e);

    const ServerConfig& config;
    ArbundleApp app;
    SessionRegistry registry;
    SessionLifecycle lifecycle;
    SsrfGuard ssrfGuard;
    std::shared_ptr<IRemoteFetcher> fetcher;
    ImageProxyService imageProxy;
    ArchiveService archiveService;
};

} // namespace arbundle
