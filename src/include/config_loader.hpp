#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

#include "server_config.hpp"

namespace arbundle {

/**
 * Loads the YAML configuration file and turns it into a ServerConfig.
 *
 * Every key is optional; missing keys keep the ServerConfig defaults.
 * Type errors are reported with the offending key path.
 */
class ConfigLoader {
public:
    /**
     * Create a ConfigLoader for a specific configuration file.
     *
     * @param config_file_path Path to the arbundle.yaml configuration file
     */
    explicit ConfigLoader(const std::filesystem::path& config_file_path);

    /**
     * Load and parse a YAML file from disk.
     *
     * @param file_path Absolute or relative path to YAML file
     * @return Parsed YAML::Node representing the file contents
     * @throws std::runtime_error if file cannot be loaded or parsed
     */
    YAML::Node loadYamlFile(const std::filesystem::path& file_path) const;

    /**
     * Load the main configuration file into a ServerConfig.
     * A missing file yields the defaults; a malformed one throws.
     */
    ServerConfig loadServerConfig() const;

    /**
     * Build a ServerConfig from an already parsed YAML document.
     * Relative paths are resolved against the configuration directory.
     */
    ServerConfig parseServerConfig(const YAML::Node& root) const;

    std::filesystem::path getBasePath() const { return base_path_; }
    std::filesystem::path getConfigFilePath() const { return config_file_path_; }

    /**
     * Resolve a potentially relative path against the base path.
     * If path is absolute, returns it as-is.
     */
    std::filesystem::path resolvePath(const std::filesystem::path& relative_path) const;

private:
    std::filesystem::path config_file_path_;
    std::filesystem::path base_path_;

    template<typename T>
    T safeGet(const YAML::Node& node, const std::string& key, const std::string& path, const T& defaultValue) const;

    void parseServerSection(const YAML::Node& node, ServerConfig& config) const;
    void parseStorageSection(const YAML::Node& node, ServerConfig& config) const;
    void parseLimitsSection(const YAML::Node& node, ServerConfig& config) const;
    void parseFetchSection(const YAML::Node& node, ServerConfig& config) const;
    void parseCleanupSection(const YAML::Node& node, ServerConfig& config) const;
    void parseRateLimitSection(const YAML::Node& node, ServerConfig& config) const;
    RateLimitRule parseRateLimitRule(const YAML::Node& node, const std::string& path, const RateLimitRule& defaults) const;
};

} // namespace arbundle
