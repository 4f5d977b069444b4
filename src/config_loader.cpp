#include "config_loader.hpp"
#include <crow/logging.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace arbundle {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

} // anonymous namespace

template<typename T>
T ConfigLoader::safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) const {
    if (!node || !node.IsMap() || !node[key]) {
        return defaultValue;
    }
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value for key: " + path + ", Error: " + e.what());
    }
}

ConfigLoader::ConfigLoader(const std::filesystem::path& config_file_path)
    : config_file_path_(config_file_path) {

    // Make the config path absolute first so "arbundle.yaml" gets a real parent
    config_file_path_ = std::filesystem::absolute(config_file_path_);
    base_path_ = config_file_path_.parent_path();

    CROW_LOG_DEBUG << "ConfigLoader initialized with config file: " << config_file_path_.string();
}

YAML::Node ConfigLoader::loadYamlFile(const std::filesystem::path& file_path) const {
    std::filesystem::path full_path = resolvePath(file_path);
    try {
        std::ifstream file(full_path);
        if (!file.is_open()) {
            throw std::runtime_error("Configuration file not found: " + full_path.string());
        }

        CROW_LOG_DEBUG << "Loading YAML file: " << full_path.string();

        std::stringstream buffer;
        buffer << file.rdbuf();
        return YAML::Load(buffer.str());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + file_path.string() + "': " + e.what());
    }
}

ServerConfig ConfigLoader::loadServerConfig() const {
    if (!std::filesystem::exists(config_file_path_)) {
        CROW_LOG_WARNING << "Configuration file " << config_file_path_.string()
                         << " not found, using built-in defaults";
        ServerConfig config;
        config.temp_root = resolvePath(config.temp_root);
        return config;
    }

    return parseServerConfig(loadYamlFile(config_file_path_));
}

ServerConfig ConfigLoader::parseServerConfig(const YAML::Node& root) const {
    ServerConfig config;

    if (root && !root.IsNull() && !root.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping");
    }

    if (root && root.IsMap()) {
        parseServerSection(root["server"], config);
        parseStorageSection(root["storage"], config);
        parseLimitsSection(root["limits"], config);
        parseFetchSection(root["fetch"], config);
        parseCleanupSection(root["cleanup"], config);
        parseRateLimitSection(root["rate-limit"], config);

        if (root["extensions"]) {
            auto extensions = safeGet<std::vector<std::string>>(root, "extensions", "extensions", {});
            config.allowed_extensions.clear();
            for (auto ext : extensions) {
                ext = toLower(ext);
                if (!ext.empty() && ext.front() != '.') {
                    ext.insert(ext.begin(), '.');
                }
                config.allowed_extensions.insert(ext);
            }
        }

        if (root["cors"]) {
            config.allowed_origins = safeGet<std::vector<std::string>>(
                root["cors"], "allowed-origins", "cors.allowed-origins", config.allowed_origins);
        }
    }

    config.temp_root = resolvePath(config.temp_root);

    CROW_LOG_INFO << "Configuration loaded: port " << config.http_port
                  << ", temp root " << config.temp_root.string();
    return config;
}

void ConfigLoader::parseServerSection(const YAML::Node& node, ServerConfig& config) const {
    if (!node) return;
    config.bind_address = safeGet<std::string>(node, "bind-address", "server.bind-address", config.bind_address);
    config.http_port = safeGet<int>(node, "http-port", "server.http-port", config.http_port);
    config.limits.max_body_bytes = safeGet<std::size_t>(node, "max-body-bytes", "server.max-body-bytes", config.limits.max_body_bytes);

    if (config.http_port <= 0 || config.http_port > 65535) {
        throw std::runtime_error("Invalid value for key: server.http-port");
    }
}

void ConfigLoader::parseStorageSection(const YAML::Node& node, ServerConfig& config) const {
    if (!node) return;
    config.temp_root = safeGet<std::string>(node, "temp-root", "storage.temp-root", config.temp_root.string());
    config.output_dir_name = safeGet<std::string>(node, "output-dir", "storage.output-dir", config.output_dir_name);
    config.archive_name = safeGet<std::string>(node, "archive-name", "storage.archive-name", config.archive_name);

    // These become path components under every sandbox
    for (const auto& name : {config.output_dir_name, config.archive_name}) {
        if (name.empty() || name == "." || name == ".." ||
            name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
            throw std::runtime_error("Invalid storage name in configuration: '" + name + "'");
        }
    }
}

void ConfigLoader::parseLimitsSection(const YAML::Node& node, ServerConfig& config) const {
    if (!node) return;
    auto& limits = config.limits;
    limits.max_files_per_batch = safeGet<std::size_t>(node, "max-files", "limits.max-files", limits.max_files_per_batch);
    limits.max_path_length = safeGet<std::size_t>(node, "max-path-length", "limits.max-path-length", limits.max_path_length);
    limits.max_file_bytes = safeGet<std::size_t>(node, "max-file-bytes", "limits.max-file-bytes", limits.max_file_bytes);
    limits.max_encoded_bytes = safeGet<std::size_t>(node, "max-encoded-bytes", "limits.max-encoded-bytes", limits.max_encoded_bytes);
    limits.max_image_bytes = safeGet<std::size_t>(node, "max-image-bytes", "limits.max-image-bytes", limits.max_image_bytes);
    limits.max_upload_files = safeGet<std::size_t>(node, "max-upload-files", "limits.max-upload-files", limits.max_upload_files);
}

void ConfigLoader::parseFetchSection(const YAML::Node& node, ServerConfig& config) const {
    if (!node) return;
    auto& fetch = config.fetch;

    if (node["allowed-domains"]) {
        auto domains = safeGet<std::vector<std::string>>(node, "allowed-domains", "fetch.allowed-domains", {});
        fetch.allowed_domains.clear();
        for (const auto& domain : domains) {
            fetch.allowed_domains.insert(toLower(domain));
        }
    }

    fetch.connect_timeout = std::chrono::seconds(
        safeGet<int>(node, "connect-timeout", "fetch.connect-timeout", static_cast<int>(fetch.connect_timeout.count())));
    fetch.request_timeout = std::chrono::seconds(
        safeGet<int>(node, "timeout", "fetch.timeout", static_cast<int>(fetch.request_timeout.count())));
    fetch.max_redirects = safeGet<int>(node, "max-redirects", "fetch.max-redirects", fetch.max_redirects);
    fetch.check_dns = safeGet<bool>(node, "check-dns", "fetch.check-dns", fetch.check_dns);
    fetch.verify_ssl = safeGet<bool>(node, "verify-ssl", "fetch.verify-ssl", fetch.verify_ssl);
    fetch.cache_max_age = safeGet<int>(node, "cache-max-age", "fetch.cache-max-age", fetch.cache_max_age);
    fetch.user_agent = safeGet<std::string>(node, "user-agent", "fetch.user-agent", fetch.user_agent);

    if (fetch.request_timeout.count() <= 0 || fetch.connect_timeout.count() <= 0) {
        throw std::runtime_error("Invalid value for key: fetch.timeout (must be positive)");
    }
    if (fetch.max_redirects < 0) {
        throw std::runtime_error("Invalid value for key: fetch.max-redirects");
    }
}

void ConfigLoader::parseCleanupSection(const YAML::Node& node, ServerConfig& config) const {
    if (!node) return;
    config.cleanup_delay = std::chrono::seconds(
        safeGet<int>(node, "delay", "cleanup.delay", static_cast<int>(config.cleanup_delay.count())));

    const auto& sweep_node = node["sweep"];
    if (sweep_node) {
        config.sweep.enabled = safeGet<bool>(sweep_node, "enabled", "cleanup.sweep.enabled", config.sweep.enabled);
        config.sweep.interval = std::chrono::seconds(
            safeGet<int>(sweep_node, "interval", "cleanup.sweep.interval", static_cast<int>(config.sweep.interval.count())));
        config.sweep.max_age = std::chrono::seconds(
            safeGet<int>(sweep_node, "max-age", "cleanup.sweep.max-age", static_cast<int>(config.sweep.max_age.count())));
    }

    if (config.cleanup_delay.count() < 0) {
        throw std::runtime_error("Invalid value for key: cleanup.delay");
    }
}

void ConfigLoader::parseRateLimitSection(const YAML::Node& node, ServerConfig& config) const {
    if (!node) return;
    config.general_rate_limit = parseRateLimitRule(node["general"], "rate-limit.general", config.general_rate_limit);
    config.proxy_rate_limit = parseRateLimitRule(node["proxy"], "rate-limit.proxy", config.proxy_rate_limit);
}

RateLimitRule ConfigLoader::parseRateLimitRule(const YAML::Node& node, const std::string& path,
                                               const RateLimitRule& defaults) const {
    if (!node) return defaults;
    RateLimitRule rule;
    rule.enabled = safeGet<bool>(node, "enabled", path + ".enabled", defaults.enabled);
    rule.max = safeGet<int>(node, "max", path + ".max", defaults.max);
    rule.interval = safeGet<int>(node, "interval", path + ".interval", defaults.interval);
    return rule;
}

std::filesystem::path ConfigLoader::resolvePath(const std::filesystem::path& relative_path) const {
    if (relative_path.empty()) {
        return base_path_;
    }
    if (relative_path.is_absolute()) {
        return relative_path.lexically_normal();
    }
    return (base_path_ / relative_path).lexically_normal();
}

} // namespace arbundle
