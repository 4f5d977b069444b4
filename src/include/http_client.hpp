#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "error.hpp"
#include "ssrf_guard.hpp"

namespace arbundle {

/**
 * One outbound GET, already approved by SsrfGuard.
 */
struct FetchRequest {
    FetchTarget target;
    std::size_t max_body_bytes = 10 * 1024 * 1024;
};

/**
 * HTTP response data
 */
struct FetchResponse {
    int status_code = 0;                          // HTTP status (200, 302, 404, ...)
    std::string body;                             // Response body
    std::map<std::string, std::string> headers;   // Response headers, lowercase names
};

/**
 * Performs outbound fetches. Implementations never follow redirects on
 * their own: every hop goes back through SsrfGuard.
 */
class IRemoteFetcher {
public:
    virtual ~IRemoteFetcher() = default;

    /**
     * @return the response for any HTTP status, or
     *         Timeout when the time bound is exceeded,
     *         TooLarge when the body outgrows max_body_bytes,
     *         Upstream(502) for other transport failures
     */
    virtual Result<FetchResponse> fetch(const FetchRequest& request) = 0;
};

/**
 * libcurl implementation of IRemoteFetcher.
 */
class CurlRemoteFetcher : public IRemoteFetcher {
public:
    struct Options {
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds request_timeout{30};
        bool verify_ssl = true;
        std::string user_agent = "arbundle/1.0";
    };

    explicit CurlRemoteFetcher(const Options& options);
    static Options optionsFrom(const FetchConfig& config);

    Result<FetchResponse> fetch(const FetchRequest& request) override;

    /**
     * curl_global_init / curl_global_cleanup, once per process.
     */
    static void globalInit();
    static void globalCleanup();

private:
    Options options_;
};

} // namespace arbundle
