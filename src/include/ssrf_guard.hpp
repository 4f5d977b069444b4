#pragma once

#include <functional>
#include <string>
#include <vector>

#include "error.hpp"
#include "server_config.hpp"

namespace arbundle {

/**
 * Where an approved outbound request may go.
 */
struct FetchTarget {
    std::string fetch_url;
    std::string host;
    int port = 443;
    bool rewritten = false;

    // Addresses the host resolved to during validation. The fetcher
    // connects to these only, so a second DNS answer cannot retarget it.
    std::vector<std::string> pinned_addresses;
};

/**
 * Gatekeeper for every outbound request made on behalf of a client.
 *
 * Policy, in order:
 *  1. the URL parses, uses https and carries no credentials
 *  2. the host is not a private, loopback, link-local or unspecified literal
 *  3. the host is on the allow-list (the primary defense)
 *  4. every address the host resolves to is public (DNS rebinding)
 *  5. known share links are rewritten to direct-download URLs
 */
class SsrfGuard {
public:
    // Returns numeric addresses for host, empty if resolution failed
    using HostResolver = std::function<std::vector<std::string>(const std::string& host)>;

    static constexpr std::size_t MAX_URL_LENGTH = 2048;

    explicit SsrfGuard(const FetchConfig& config);
    SsrfGuard(const FetchConfig& config, HostResolver resolver);

    /**
     * Validate a client-supplied URL and produce the fetch target,
     * applying the share-link rewrite.
     */
    Result<FetchTarget> validateUrl(const std::string& url) const;

    /**
     * Validate a redirect Location relative to the URL that produced it.
     * Same policy as validateUrl, without the share-link rewrite.
     */
    Result<FetchTarget> validateRedirect(const std::string& location, const std::string& base_url) const;

    /**
     * True for private, loopback, link-local and unspecified IPv4/IPv6
     * literals (including IPv4-mapped IPv6) and for "localhost" names.
     * Ordinary host names return false.
     */
    static bool isPrivateAddress(const std::string& host);

    bool isAllowedDomain(const std::string& host) const;

    /**
     * Rewrite drive.google.com share links (/file/d/<id>/... and
     * /open?id=<id>) into the direct download form. Returns an empty string
     * when the URL is not a recognized share link.
     */
    static std::string rewriteShareLink(const std::string& host,
                                        const std::string& path,
                                        const std::string& query);

    static std::vector<std::string> systemResolver(const std::string& host);

private:
    const FetchConfig& config_;
    HostResolver resolver_;

    struct ParsedUrl {
        std::string url;
        std::string scheme;
        std::string host;
        int port = 443;
        std::string path;
        std::string query;
        bool has_credentials = false;
    };

    Result<ParsedUrl> parse(const std::string& url, const std::string& base_url) const;
    Result<FetchTarget> applyPolicy(const ParsedUrl& parsed, bool allow_rewrite) const;
};

} // namespace arbundle
