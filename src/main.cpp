#include <argparse/argparse.hpp>
#include <exception>
#include <iostream>
#include <cstdlib>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <thread>

#include "api_server.hpp"
#include "config_loader.hpp"
#include "http_client.hpp"
#include "ssrf_guard.hpp"

using namespace arbundle;

std::atomic<bool> should_exit(false);
std::shared_ptr<APIServer> api_server;

void set_log_level(const std::string& log_level) {
    if (log_level == "debug") {
        crow::logger::setLogLevel(crow::LogLevel::Debug);
    } else if (log_level == "info") {
        crow::logger::setLogLevel(crow::LogLevel::Info);
    } else if (log_level == "warning") {
        crow::logger::setLogLevel(crow::LogLevel::Warning);
    } else if (log_level == "error") {
        crow::logger::setLogLevel(crow::LogLevel::Error);
    } else {
        std::cerr << "Invalid log level: " << log_level << ". Using default (info)." << std::endl;
        crow::logger::setLogLevel(crow::LogLevel::Info);
    }
}

ServerConfig initializeConfig(const std::string& config_file) {
    try {
        ConfigLoader loader{std::filesystem::path(config_file)};
        return loader.loadServerConfig();
    } catch (const std::exception& e) {
        throw std::runtime_error("Error while loading configuration, Details: " + std::string(e.what()));
    }
}

void initializeTempRoot(const ServerConfig& config) {
    std::error_code ec;
    std::filesystem::create_directories(config.temp_root, ec);
    if (ec) {
        throw std::runtime_error("Cannot create temp directory " + config.temp_root.string() + ": " + ec.message());
    }
}

void terminateHandler() {
    CROW_LOG_ERROR << "Unhandled exception caught! arbundle is giving up";

    auto ex = std::current_exception();
    if (ex) {
        try {
            std::rethrow_exception(ex);
        } catch (const std::exception& e) {
            CROW_LOG_ERROR << "exception caught: " << e.what();
        }
    }
    std::abort();
}

void signal_handler(int signal) {
    if (signal == SIGINT) {
        CROW_LOG_INFO << "Received SIGINT, shutting down...";
        should_exit = true;
        if (api_server) {
            api_server->stop();
        }
    }
}

int main(int argc, char* argv[])
{
    std::set_terminate(terminateHandler);

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);

    static argparse::ArgumentParser program("arbundle");

    program.add_argument("-c", "--config")
        .help("Path to the arbundle.yaml configuration file")
        .default_value(std::string("arbundle.yaml"));

    program.add_argument("-p", "--port")
        .help("Port number for the web server")
        .default_value(-1)
        .scan<'i', int>();

    program.add_argument("--temp-dir")
        .help("Directory holding the per-session sandboxes")
        .default_value(std::string(""));

    program.add_argument("--log-level")
        .help("Set the log level (debug, info, warning, error)")
        .default_value(std::string("info"));

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string config_file = program.get<std::string>("--config");
    int cmd_port = program.get<int>("--port");
    std::string temp_dir = program.get<std::string>("--temp-dir");
    std::string log_level = program.get<std::string>("--log-level");

    set_log_level(log_level);

    ServerConfig config = initializeConfig(config_file);

    if (cmd_port != -1) {
        config.http_port = cmd_port;
    }
    if (!temp_dir.empty()) {
        config.temp_root = std::filesystem::absolute(temp_dir);
    }

    initializeTempRoot(config);
    CurlRemoteFetcher::globalInit();

    auto fetcher = std::make_shared<CurlRemoteFetcher>(CurlRemoteFetcher::optionsFrom(config.fetch));
    api_server = std::make_shared<APIServer>(config, fetcher, SsrfGuard::systemResolver);

    std::thread server_thread([server = api_server]() {
        server->run();
    });

    CROW_LOG_INFO << "arbundle server started on port " << config.http_port
                  << ", temp directory " << config.temp_root.string();

    server_thread.join();

    api_server.reset();
    CurlRemoteFetcher::globalCleanup();
    return 0;
}
