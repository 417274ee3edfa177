/// @file main.cpp
/// @brief rulemux ruler entry point

#include <csignal>
#include <iostream>

#include <CLI/CLI.hpp>

#include "common/logging.h"
#include "ruler/ruler.h"
#include "ruler/ruler_config.h"

namespace {

rulemux::ruler::Ruler* g_ruler = nullptr;

void SignalHandler(int signal) {
    if (g_ruler == nullptr) {
        return;
    }
    if (signal == SIGHUP) {
        g_ruler->RequestReload();
    } else {
        g_ruler->RequestShutdown();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"rulemux ruler - evaluates alerting and recording rules per "
                 "partial response strategy"};

    std::string config_path;
    std::string data_dir;
    std::string eval_interval;
    std::vector<std::string> rule_files;
    std::vector<std::string> query_endpoints;
    std::string grpc_address;
    std::string http_address;
    std::string log_level;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--data-dir", data_dir, "Working directory for scratch rule files");
    app.add_option("--eval-interval", eval_interval, "Default evaluation interval (e.g. 1m)");
    app.add_option("--rule-file", rule_files, "Rule file glob pattern (repeatable)");
    app.add_option("--query", query_endpoints, "Query endpoint URL (repeatable)");
    app.add_option("--grpc-address", grpc_address, "gRPC listen address (host:port)");
    app.add_option("--http-address", http_address, "HTTP listen address (host:port)");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "rulemux ruler v1.0.0" << std::endl;
        return 0;
    }

    // Config file plus environment, then CLI overrides
    rulemux::Config config;
    if (!config_path.empty()) {
        auto file_config = rulemux::Config::LoadFromFile(config_path);
        if (!file_config.ok()) {
            std::cerr << "Failed to load config: " << file_config.status().message()
                      << std::endl;
            return 1;
        }
        config = std::move(*file_config);
    }
    config.Merge(rulemux::Config::LoadFromEnvironment());

    if (!data_dir.empty()) {
        config.Set("data_dir", data_dir);
    }
    if (!eval_interval.empty()) {
        config.Set("eval_interval", eval_interval);
    }
    if (!rule_files.empty()) {
        config.Set("rule_files", rule_files);
    }
    if (!query_endpoints.empty()) {
        config.Set("query.endpoints", query_endpoints);
    }
    if (!grpc_address.empty()) {
        config.Set("grpc.address", grpc_address);
    }
    if (!http_address.empty()) {
        config.Set("http.address", http_address);
    }
    if (!log_level.empty()) {
        config.Set("logging.level", log_level);
    }

    auto ruler_config = rulemux::ruler::RulerConfig::FromConfig(config);
    if (!ruler_config.ok()) {
        std::cerr << "Invalid configuration: " << ruler_config.status().message() << std::endl;
        return 1;
    }

    // Initialize logging
    rulemux::LogConfig log_config;
    log_config.name = "rulemux-ruler";
    log_config.level = rulemux::ParseLogLevel(ruler_config->logging.level);
    if (!ruler_config->logging.file.empty()) {
        log_config.enable_file = true;
        log_config.file_path = ruler_config->logging.file;
    }
    rulemux::InitLogging(log_config);

    RULEMUX_LOG_INFO("rulemux ruler v1.0.0 starting...");
    RULEMUX_LOG_INFO("Configuration:");
    RULEMUX_LOG_INFO("  Data dir: {}", ruler_config->data_dir.string());
    RULEMUX_LOG_INFO("  Rule file patterns: {}", ruler_config->rule_files.size());
    RULEMUX_LOG_INFO("  Query endpoints: {}",
                     ruler_config->query.endpoints.empty() ? "(none)" :
                     ruler_config->query.endpoints[0]);
    RULEMUX_LOG_INFO("  gRPC address: {}", ruler_config->grpc.address);
    RULEMUX_LOG_INFO("  HTTP address: {}", ruler_config->http.address);

    rulemux::ruler::Ruler ruler(std::move(*ruler_config));
    g_ruler = &ruler;

    struct sigaction sa;
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    auto status = ruler.Start();
    if (!status.ok()) {
        RULEMUX_LOG_ERROR("Failed to start ruler: {}", std::string_view(status.message().data(), status.message().size()));
        return 1;
    }

    RULEMUX_LOG_INFO("Ruler is running. Send SIGHUP to reload rules, Ctrl+C to stop.");

    ruler.WaitForShutdown();

    status = ruler.Shutdown();
    if (!status.ok()) {
        RULEMUX_LOG_ERROR("Error during shutdown: {}", std::string_view(status.message().data(), status.message().size()));
    }

    g_ruler = nullptr;
    RULEMUX_LOG_INFO("Ruler stopped successfully");
    rulemux::ShutdownLogging();

    return 0;
}
