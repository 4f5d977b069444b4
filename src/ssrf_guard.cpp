#include "ssrf_guard.hpp"

#include <crow/logging.h>
#include <curl/curl.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <regex>
#include <utility>

namespace arbundle {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* handle) const {
        if (handle) {
            curl_url_cleanup(handle);
        }
    }
};

using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;

// Fetch one URL component, empty string if absent
std::string getUrlPart(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(handle, part, &value, flags) != CURLUE_OK || value == nullptr) {
        return "";
    }
    std::string result(value);
    curl_free(value);
    return result;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

std::string stripBrackets(const std::string& host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

bool isPrivateIPv4(uint32_t address) {
    const uint8_t a = static_cast<uint8_t>(address >> 24);
    const uint8_t b = static_cast<uint8_t>(address >> 16);

    return a == 0 ||                            // 0.0.0.0/8 "this network"
           a == 10 ||                           // 10.0.0.0/8
           a == 127 ||                          // 127.0.0.0/8 loopback
           (a == 169 && b == 254) ||            // 169.254.0.0/16 link-local
           (a == 172 && b >= 16 && b <= 31) ||  // 172.16.0.0/12
           (a == 192 && b == 168) ||            // 192.168.0.0/16
           (a == 100 && b >= 64 && b <= 127);   // 100.64.0.0/10 carrier-grade NAT
}

bool isPrivateIPv6(const in6_addr& address) {
    const uint8_t* bytes = address.s6_addr;

    static const uint8_t unspecified[16] = {0};
    if (std::memcmp(bytes, unspecified, 16) == 0) {
        return true;
    }

    static const uint8_t loopback[16] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1};
    if (std::memcmp(bytes, loopback, 16) == 0) {
        return true;
    }

    // ::ffff:a.b.c.d carries an IPv4 address
    static const uint8_t mapped_prefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
    if (std::memcmp(bytes, mapped_prefix, 12) == 0) {
        uint32_t v4 = (static_cast<uint32_t>(bytes[12]) << 24) |
                      (static_cast<uint32_t>(bytes[13]) << 16) |
                      (static_cast<uint32_t>(bytes[14]) << 8) |
                      static_cast<uint32_t>(bytes[15]);
        return isPrivateIPv4(v4);
    }

    if ((bytes[0] & 0xfe) == 0xfc) {                 // fc00::/7 unique local
        return true;
    }
    if (bytes[0] == 0xfe && (bytes[1] & 0xc0) == 0x80) {  // fe80::/10 link-local
        return true;
    }
    if (bytes[0] == 0xfe && (bytes[1] & 0xc0) == 0xc0) {  // fec0::/10 site-local
        return true;
    }
    return false;
}

} // anonymous namespace

SsrfGuard::SsrfGuard(const FetchConfig& config)
    : config_(config), resolver_(&SsrfGuard::systemResolver) {
}

SsrfGuard::SsrfGuard(const FetchConfig& config, HostResolver resolver)
    : config_(config), resolver_(std::move(resolver)) {
}

Result<FetchTarget> SsrfGuard::validateUrl(const std::string& url) const {
    auto parsed = parse(url, "");
    if (!parsed) {
        return std::move(parsed.error());
    }
    return applyPolicy(*parsed, true);
}

Result<FetchTarget> SsrfGuard::validateRedirect(const std::string& location, const std::string& base_url) const {
    auto parsed = parse(location, base_url);
    if (!parsed) {
        return std::move(parsed.error());
    }
    return applyPolicy(*parsed, false);
}

Result<SsrfGuard::ParsedUrl> SsrfGuard::parse(const std::string& url, const std::string& base_url) const {
    if (url.empty() || url.size() > MAX_URL_LENGTH) {
        return Error::Validation("Invalid URL parameter", "empty or overlong URL");
    }

    CurlUrlHandle handle(curl_url());
    if (!handle) {
        return Error::Internal("Internal server error", "curl_url() returned null");
    }

    // A base URL lets relative redirect locations resolve against it
    if (!base_url.empty() &&
        curl_url_set(handle.get(), CURLUPART_URL, base_url.c_str(), 0) != CURLUE_OK) {
        return Error::Validation("Invalid URL format", "unparseable redirect base");
    }

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) {
        return Error::Validation("Invalid URL format. Only HTTPS URLs are allowed.",
                                 std::string("URL parse error: ") + curl_url_strerror(rc));
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(getUrlPart(handle.get(), CURLUPART_SCHEME));
    parsed.host = toLower(stripBrackets(getUrlPart(handle.get(), CURLUPART_HOST)));
    parsed.path = getUrlPart(handle.get(), CURLUPART_PATH);
    parsed.query = getUrlPart(handle.get(), CURLUPART_QUERY);
    parsed.has_credentials = !getUrlPart(handle.get(), CURLUPART_USER).empty() ||
                             !getUrlPart(handle.get(), CURLUPART_PASSWORD).empty();

    std::string port = getUrlPart(handle.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT);
    try {
        parsed.port = port.empty() ? 443 : std::stoi(port);
    } catch (const std::exception&) {
        return Error::Validation("Invalid URL format", "unparseable port");
    }

    // Drop the fragment, it is never sent upstream
    curl_url_set(handle.get(), CURLUPART_FRAGMENT, nullptr, 0);
    parsed.url = getUrlPart(handle.get(), CURLUPART_URL);

    if (parsed.scheme != "https") {
        return Error::Validation("Invalid URL format. Only HTTPS URLs are allowed.",
                                 "scheme '" + parsed.scheme + "' rejected");
    }
    if (parsed.host.empty()) {
        return Error::Validation("Invalid URL format", "URL without host");
    }
    if (parsed.has_credentials) {
        return Error::Validation("Invalid URL format", "URL with embedded credentials");
    }

    return parsed;
}

Result<FetchTarget> SsrfGuard::applyPolicy(const ParsedUrl& parsed, bool allow_rewrite) const {
    if (isPrivateAddress(parsed.host)) {
        return Error::Security("Domain not allowed", "private address target " + parsed.host);
    }

    if (!isAllowedDomain(parsed.host)) {
        return Error::Security("Domain not allowed", "host " + parsed.host + " not on allow-list");
    }

    if (parsed.port != 443) {
        return Error::Security("Domain not allowed", "port " + std::to_string(parsed.port) + " rejected");
    }

    FetchTarget target;
    target.host = parsed.host;
    target.port = parsed.port;
    target.fetch_url = parsed.url;

    if (config_.check_dns) {
        auto addresses = resolver_(parsed.host);
        if (addresses.empty()) {
            return Error::Upstream(502, "Failed to fetch image", "cannot resolve " + parsed.host);
        }
        for (const auto& address : addresses) {
            if (isPrivateAddress(address)) {
                return Error::Security("Domain not allowed",
                                       "host " + parsed.host + " resolves to private address " + address);
            }
        }
        target.pinned_addresses = std::move(addresses);
    }

    if (allow_rewrite) {
        std::string direct = rewriteShareLink(parsed.host, parsed.path, parsed.query);
        if (!direct.empty()) {
            CROW_LOG_DEBUG << "Converted share link to direct download URL";
            target.fetch_url = direct;
            target.rewritten = true;
        }
    }

    return target;
}

bool SsrfGuard::isPrivateAddress(const std::string& host) {
    std::string candidate = toLower(stripBrackets(host));

    if (candidate == "localhost" ||
        (candidate.size() > 10 && candidate.compare(candidate.size() - 10, 10, ".localhost") == 0)) {
        return true;
    }

    // Zone ids ("fe80::1%eth0") are not part of the address
    auto zone = candidate.find('%');
    if (zone != std::string::npos) {
        candidate.erase(zone);
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, candidate.c_str(), &v6) == 1) {
        return isPrivateIPv6(v6);
    }

    // inet_aton also accepts the short and numeric forms ("127.1", "2130706433")
    // that resolvers honor
    in_addr v4{};
    if (inet_aton(candidate.c_str(), &v4) != 0) {
        return isPrivateIPv4(ntohl(v4.s_addr));
    }

    return false;
}

bool SsrfGuard::isAllowedDomain(const std::string& host) const {
    return config_.allowed_domains.find(toLower(host)) != config_.allowed_domains.end();
}

std::string SsrfGuard::rewriteShareLink(const std::string& host,
                                        const std::string& path,
                                        const std::string& query) {
    if (host != "drive.google.com") {
        return "";
    }

    static const std::regex file_path_pattern(R"(^/file/d/([A-Za-z0-9_-]+)(/.*)?$)");
    static const std::regex id_pattern(R"(^[A-Za-z0-9_-]+$)");

    std::string file_id;
    std::smatch match;
    if (std::regex_match(path, match, file_path_pattern)) {
        file_id = match[1].str();
    } else if (path == "/open") {
        size_t start = 0;
        while (start <= query.size()) {
            size_t end = query.find('&', start);
            if (end == std::string::npos) {
                end = query.size();
            }
            std::string param = query.substr(start, end - start);
            if (param.compare(0, 3, "id=") == 0) {
                std::string candidate = param.substr(3);
                if (std::regex_match(candidate, id_pattern)) {
                    file_id = candidate;
                }
                break;
            }
            start = end + 1;
        }
    }

    if (file_id.empty()) {
        return "";
    }
    return "https://drive.google.com/uc?export=download&id=" + file_id + "&confirm=t";
}

std::vector<std::string> SsrfGuard::systemResolver(const std::string& host) {
    std::vector<std::string> addresses;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0) {
        CROW_LOG_WARNING << "DNS resolution failed for " << host << ": " << gai_strerror(rc);
        return addresses;
    }

    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(result, &freeaddrinfo);
    for (addrinfo* entry = result; entry != nullptr; entry = entry->ai_next) {
        char buffer[INET6_ADDRSTRLEN] = {0};
        if (entry->ai_family == AF_INET) {
            auto* sin = reinterpret_cast<sockaddr_in*>(entry->ai_addr);
            inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer));
        } else if (entry->ai_family == AF_INET6) {
            auto* sin6 = reinterpret_cast<sockaddr_in6*>(entry->ai_addr);
            inet_ntop(AF_INET6, &sin6->sin6_addr, buffer, sizeof(buffer));
        } else {
            continue;
        }
        std::string address(buffer);
        if (!address.empty() &&
            std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
            addresses.push_back(address);
        }
    }
    return addresses;
}

} // namespace arbundle
