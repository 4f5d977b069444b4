#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_all.hpp>
#include "config_loader.hpp"
#include "test_utils.hpp"

using namespace arbundle;
using namespace arbundle::test;

TEST_CASE("ConfigLoader: defaults", "[config_loader]") {
    TempDirectory temp("arbundle_config");
    ConfigLoader loader(temp.fsPath() / "missing.yaml");

    SECTION("A missing file yields the built-in defaults") {
        auto config = loader.loadServerConfig();
        REQUIRE(config.http_port == 3000);
        REQUIRE(config.cleanup_delay == std::chrono::seconds(60));
        REQUIRE(config.limits.max_files_per_batch == 1000);
        REQUIRE(config.limits.max_body_bytes == 50u * 1024 * 1024);
        REQUIRE(config.allowed_extensions == std::set<std::string>{".glb", ".mind", ".json"});
        REQUIRE(config.fetch.allowed_domains.count("drive.google.com") == 1);
        REQUIRE(config.fetch.request_timeout == std::chrono::seconds(30));
        REQUIRE(config.general_rate_limit.max == 100);
        REQUIRE(config.proxy_rate_limit.max == 10);
        REQUIRE_FALSE(config.sweep.enabled);
        REQUIRE(config.temp_root == (temp.fsPath() / "temp").lexically_normal());
    }

    SECTION("An empty document yields the defaults") {
        auto config = loader.parseServerConfig(YAML::Load(""));
        REQUIRE(config.http_port == 3000);
        REQUIRE(config.archive_name == "ar_output.zip");
    }
}

TEST_CASE("ConfigLoader: full document", "[config_loader]") {
    TempDirectory temp("arbundle_config");
    auto path = temp.writeFile("arbundle.yaml", R"(
server:
  bind-address: 127.0.0.1
  http-port: 8088
  max-body-bytes: 1048576
storage:
  temp-root: sandboxes
  archive-name: bundle.zip
limits:
  max-files: 50
  max-image-bytes: 2048
extensions: [GLB, "json", .usdz]
fetch:
  allowed-domains: [Example.COM]
  timeout: 5
  max-redirects: 2
  check-dns: false
cleanup:
  delay: 5
  sweep:
    enabled: true
    interval: 30
    max-age: 120
rate-limit:
  general:
    max: 500
  proxy:
    enabled: false
cors:
  allowed-origins: ["https://app.example.com"]
unknown-section:
  ignored: true
)");

    ConfigLoader loader(path);
    auto config = loader.loadServerConfig();

    REQUIRE(config.bind_address == "127.0.0.1");
    REQUIRE(config.http_port == 8088);
    REQUIRE(config.limits.max_body_bytes == 1048576);
    REQUIRE(config.temp_root == (temp.fsPath() / "sandboxes").lexically_normal());
    REQUIRE(config.archive_name == "bundle.zip");
    REQUIRE(config.output_dir_name == "output");
    REQUIRE(config.limits.max_files_per_batch == 50);
    REQUIRE(config.limits.max_image_bytes == 2048);
    REQUIRE(config.allowed_extensions == std::set<std::string>{".glb", ".json", ".usdz"});
    REQUIRE(config.fetch.allowed_domains == std::set<std::string>{"example.com"});
    REQUIRE(config.fetch.request_timeout == std::chrono::seconds(5));
    REQUIRE(config.fetch.connect_timeout == std::chrono::seconds(10));
    REQUIRE(config.fetch.max_redirects == 2);
    REQUIRE_FALSE(config.fetch.check_dns);
    REQUIRE(config.cleanup_delay == std::chrono::seconds(5));
    REQUIRE(config.sweep.enabled);
    REQUIRE(config.sweep.interval == std::chrono::seconds(30));
    REQUIRE(config.sweep.max_age == std::chrono::seconds(120));
    REQUIRE(config.general_rate_limit.max == 500);
    REQUIRE(config.general_rate_limit.interval == 900);
    REQUIRE_FALSE(config.proxy_rate_limit.enabled);
    REQUIRE(config.allowed_origins == std::vector<std::string>{"https://app.example.com"});
}

TEST_CASE("ConfigLoader: invalid values", "[config_loader]") {
    TempDirectory temp("arbundle_config");
    ConfigLoader loader(temp.fsPath() / "arbundle.yaml");

    SECTION("Type errors name the key") {
        REQUIRE_THROWS_WITH(loader.parseServerConfig(YAML::Load("server:\n  http-port: abc\n")),
                            Catch::Matchers::ContainsSubstring("server.http-port"));
    }

    SECTION("Port out of range") {
        REQUIRE_THROWS(loader.parseServerConfig(YAML::Load("server:\n  http-port: 70000\n")));
    }

    SECTION("Storage names must be single path components") {
        REQUIRE_THROWS(loader.parseServerConfig(YAML::Load("storage:\n  archive-name: ../x.zip\n")));
        REQUIRE_THROWS(loader.parseServerConfig(YAML::Load("storage:\n  output-dir: ..\n")));
    }

    SECTION("Non-positive timeouts") {
        REQUIRE_THROWS(loader.parseServerConfig(YAML::Load("fetch:\n  timeout: 0\n")));
    }

    SECTION("Root must be a mapping") {
        REQUIRE_THROWS(loader.parseServerConfig(YAML::Load("- a\n- b\n")));
    }

    SECTION("Unparseable YAML") {
        auto path = temp.writeFile("broken.yaml", "server: [unterminated\n");
        ConfigLoader broken(path);
        REQUIRE_THROWS(broken.loadServerConfig());
    }
}

TEST_CASE("ConfigLoader: path resolution", "[config_loader]") {
    TempDirectory temp("arbundle_config");
    ConfigLoader loader(temp.fsPath() / "arbundle.yaml");

    REQUIRE(loader.getBasePath() == temp.fsPath());
    REQUIRE(loader.resolvePath("a/../b") == temp.fsPath() / "b");
    REQUIRE(loader.resolvePath("/var/tmp/x") == std::filesystem::path("/var/tmp/x"));
}
