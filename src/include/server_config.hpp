#pragma once

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace arbundle {

struct RateLimitRule {
    bool enabled = true;
    int max = 100;
    int interval = 900;  // seconds
};

struct SweepConfig {
    bool enabled = false;
    std::chrono::seconds interval{600};
    std::chrono::seconds max_age{86400};
};

struct FetchConfig {
    std::set<std::string> allowed_domains = {
        "drive.google.com",
        "lh3.googleusercontent.com",
        "drive.usercontent.google.com"
    };
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds request_timeout{30};
    int max_redirects = 5;
    bool check_dns = true;
    bool verify_ssl = true;
    int cache_max_age = 3600;
    std::string user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";
};

struct LimitsConfig {
    std::size_t max_files_per_batch = 1000;
    std::size_t max_path_length = 255;
    std::size_t max_file_bytes = 20 * 1024 * 1024;
    std::size_t max_encoded_bytes = 20 * 1024 * 1024;
    std::size_t max_image_bytes = 10 * 1024 * 1024;
    std::size_t max_body_bytes = 50 * 1024 * 1024;
    std::size_t max_upload_files = 10;
};

/**
 * Process-wide configuration. Built once at startup by ConfigLoader and
 * passed by const reference into every component; never mutated afterwards.
 */
struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    int http_port = 3000;

    std::filesystem::path temp_root = "temp";
    std::string output_dir_name = "output";
    std::string images_dir_name = "images";
    std::string archive_name = "ar_output.zip";

    LimitsConfig limits;

    std::set<std::string> allowed_extensions = {".glb", ".mind", ".json"};
    std::set<std::string> allowed_image_types = {"image/jpeg", "image/png", "image/webp"};

    FetchConfig fetch;

    std::chrono::seconds cleanup_delay{60};
    SweepConfig sweep;

    RateLimitRule general_rate_limit{true, 100, 900};
    RateLimitRule proxy_rate_limit{true, 10, 60};

    std::vector<std::string> allowed_origins = {
        "http://localhost:3000",
        "http://127.0.0.1:3000"
    };
};

} // namespace arbundle
