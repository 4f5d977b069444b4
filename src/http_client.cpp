#include "http_client.hpp"
#include <crow/logging.h>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace arbundle {

namespace {

struct BodySink {
    std::string* body;
    std::size_t limit;
    bool overflowed = false;
};

/**
 * Callback for libcurl to write response data.
 * Returning less than requested aborts the transfer with CURLE_WRITE_ERROR.
 */
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<BodySink*>(userp);
    size_t bytes = size * nmemb;
    if (sink->body->size() + bytes > sink->limit) {
        sink->overflowed = true;
        return 0;
    }
    sink->body->append(static_cast<char*>(contents), bytes);
    return bytes;
}

/**
 * Callback for libcurl to write response headers
 */
size_t header_callback(char* buffer, size_t size, size_t nmemb, void* userp) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    std::string header_line(buffer, size * nmemb);

    // A new status line starts a new header block
    if (header_line.compare(0, 5, "HTTP/") == 0) {
        headers->clear();
        return size * nmemb;
    }

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string header_name = header_line.substr(0, colon_pos);
        std::string header_value = header_line.substr(colon_pos + 1);

        std::transform(header_name.begin(), header_name.end(), header_name.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        // Trim whitespace
        header_value.erase(0, header_value.find_first_not_of(" \t"));
        header_value.erase(header_value.find_last_not_of(" \r\n") + 1);

        (*headers)[header_name] = header_value;
    }

    return size * nmemb;
}

struct CurlEasyDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

} // anonymous namespace

CurlRemoteFetcher::CurlRemoteFetcher(const Options& options) : options_(options) {}

CurlRemoteFetcher::Options CurlRemoteFetcher::optionsFrom(const FetchConfig& config) {
    Options options;
    options.connect_timeout = config.connect_timeout;
    options.request_timeout = config.request_timeout;
    options.verify_ssl = config.verify_ssl;
    options.user_agent = config.user_agent;
    return options;
}

void CurlRemoteFetcher::globalInit() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlRemoteFetcher::globalCleanup() {
    curl_global_cleanup();
}

Result<FetchResponse> CurlRemoteFetcher::fetch(const FetchRequest& request) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        return Error::Internal("Internal server error", "Failed to initialize CURL");
    }

    FetchResponse response;
    BodySink sink{&response.body, request.max_body_bytes};

    const auto& target = request.target;
    CURL* handle = curl.get();

    curl_easy_setopt(handle, CURLOPT_URL, target.fetch_url.c_str());
    curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    // Redirects come back to the caller for re-validation
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 0L);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(handle, CURLOPT_PROTOCOLS_STR, "https");
#else
    curl_easy_setopt(handle, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTPS));
#endif

    // Set timeouts
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(options_.request_timeout.count()));

    // Set SSL verification
    if (!options_.verify_ssl) {
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
        CROW_LOG_WARNING << "SSL verification disabled - use only for development";
    } else {
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);
    }

    // Pin the addresses SsrfGuard approved
    std::unique_ptr<curl_slist, CurlSlistDeleter> resolve_list;
    if (!target.pinned_addresses.empty()) {
        std::string entry = target.host + ":" + std::to_string(target.port) + ":";
        for (size_t i = 0; i < target.pinned_addresses.size(); ++i) {
            const auto& address = target.pinned_addresses[i];
            if (i > 0) {
                entry += ",";
            }
            entry += address.find(':') != std::string::npos ? "[" + address + "]" : address;
        }
        resolve_list.reset(curl_slist_append(nullptr, entry.c_str()));
        curl_easy_setopt(handle, CURLOPT_RESOLVE, resolve_list.get());
    }

    // Set callbacks for response body and headers
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);

    curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());

    CURLcode res = curl_easy_perform(handle);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return Error::Timeout("Request timeout", "fetch of " + target.host + " exceeded " +
                              std::to_string(options_.request_timeout.count()) + "s");
    }
    if (res == CURLE_WRITE_ERROR && sink.overflowed) {
        return Error::TooLarge("File too large", "body from " + target.host + " exceeded " +
                               std::to_string(request.max_body_bytes) + " bytes");
    }
    if (res != CURLE_OK) {
        return Error::Upstream(502, "Failed to fetch image",
                               std::string("HTTP request failed: ") + curl_easy_strerror(res) +
                               " (host: " + target.host + ")");
    }

    long http_code = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<int>(http_code);

    CROW_LOG_DEBUG << "HTTP GET " << target.host << " -> " << response.status_code
                   << " (" << response.body.size() << " bytes)";

    return response;
}

} // namespace arbundle
