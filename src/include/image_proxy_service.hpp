#pragma once

#include <memory>
#include <string>

#include "content_validator.hpp"
#include "error.hpp"
#include "http_client.hpp"
#include "server_config.hpp"
#include "ssrf_guard.hpp"

namespace arbundle {

struct ProxiedImage {
    std::string bytes;
    std::string mime_type;
    std::string source_url;
};

/**
 * Remote image fetch on behalf of a browser: SsrfGuard approves every hop,
 * the fetcher retrieves it under a time bound, ContentValidator decides
 * what came back. The remote server's declared type is ignored.
 */
class ImageProxyService {
public:
    ImageProxyService(const ServerConfig& config,
                      const SsrfGuard& guard,
                      std::shared_ptr<IRemoteFetcher> fetcher);

    Result<ProxiedImage> fetchImage(const std::string& url) const;

private:
    const ServerConfig& config_;
    const SsrfGuard& guard_;
    std::shared_ptr<IRemoteFetcher> fetcher_;

    static bool isRedirect(int status_code);
};

} // namespace arbundle
