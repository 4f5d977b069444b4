#include "image_proxy_service.hpp"

#include <crow/logging.h>
#include <utility>

namespace arbundle {

ImageProxyService::ImageProxyService(const ServerConfig& config,
                                     const SsrfGuard& guard,
                                     std::shared_ptr<IRemoteFetcher> fetcher)
    : config_(config), guard_(guard), fetcher_(std::move(fetcher)) {
}

bool ImageProxyService::isRedirect(int status_code) {
    return status_code == 301 || status_code == 302 || status_code == 303 ||
           status_code == 307 || status_code == 308;
}

Result<ProxiedImage> ImageProxyService::fetchImage(const std::string& url) const {
    auto target = guard_.validateUrl(url);
    if (!target) {
        return std::move(target.error());
    }

    CROW_LOG_INFO << "Proxy request for host " << target->host
                  << (target->rewritten ? " (share link rewritten)" : "");

    FetchRequest request;
    request.target = std::move(*target);
    request.max_body_bytes = config_.limits.max_image_bytes;

    for (int hop = 0;; ++hop) {
        auto response = fetcher_->fetch(request);
        if (!response) {
            return std::move(response.error());
        }

        if (isRedirect(response->status_code)) {
            if (hop >= config_.fetch.max_redirects) {
                return Error::Upstream(502, "Failed to fetch image", "too many redirects");
            }

            auto location = response->headers.find("location");
            if (location == response->headers.end() || location->second.empty()) {
                return Error::Upstream(502, "Failed to fetch image", "redirect without location");
            }

            auto next = guard_.validateRedirect(location->second, request.target.fetch_url);
            if (!next) {
                return std::move(next.error());
            }

            CROW_LOG_DEBUG << "Following redirect to host " << next->host;
            request.target = std::move(*next);
            continue;
        }

        if (response->status_code < 200 || response->status_code >= 300) {
            int status = response->status_code >= 400 && response->status_code <= 599
                             ? response->status_code
                             : 502;
            return Error::Upstream(status, "Failed to fetch image",
                                   "upstream answered " + std::to_string(response->status_code));
        }

        if (!ContentValidator::checkSize(response->body.size(), config_.limits.max_image_bytes)) {
            return Error::TooLarge("File too large",
                                   std::to_string(response->body.size()) + " bytes from upstream");
        }

        auto classification = ContentValidator::classifyImage(response->body);
        if (!classification) {
            auto declared = response->headers.find("content-type");
            return Error::Validation("Invalid image file",
                                     "magic bytes rejected, declared type: " +
                                     (declared == response->headers.end() ? std::string("none") : declared->second));
        }

        CROW_LOG_INFO << "Successfully fetched " << response->body.size() << " bytes, type "
                      << classification->mime_type;

        ProxiedImage image;
        image.bytes = std::move(response->body);
        image.mime_type = classification->mime_type;
        image.source_url = request.target.fetch_url;
        return image;
    }
}

} // namespace arbundle
