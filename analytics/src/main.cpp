#include "config.hpp"
#include "analytics_service.hpp"
#include "alert_sink.hpp"
#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <csignal>
#include <fstream>
#include <stdexcept>
#include <memory>
#include <atomic>
#include <string>
#include <vector>

namespace {

// Service pointer for the signal handler; only request_cancel() is touched
std::atomic<AnalyticsService*> g_service(nullptr);
std::atomic<bool> g_terminate_flag(false);

CycleInput load_cycle(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open cycle file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return CycleInput::from_json(j);
}

} // namespace

// Signal handler function
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_terminate_flag = true;
        AnalyticsService* service = g_service.load();
        if (service) {
            service->request_cancel();
        }
    }
}

int main(int argc, char* argv[]) {
    // Set up logger
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("confluence_scanner", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::debug); // Default, will be overridden by config
    spdlog::flush_on(spdlog::level::info);

    spdlog::info("Starting Confluence Scanner...");

    // Load configuration
    std::string config_path = "config.json"; // Default config file name
    if (argc > 1) {
        config_path = argv[1];
    }

    std::vector<std::string> cycle_paths;
    for (int i = 2; i < argc; ++i) {
        cycle_paths.emplace_back(argv[i]);
    }

    Config config;
    try {
        config.load(config_path);
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::info("Configuration loaded from {}", config_path);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    // Weight vectors are validated here, before any cycle runs
    std::unique_ptr<AnalyticsService> service;
    try {
        service = std::make_unique<AnalyticsService>(config);
    } catch (const std::exception& e) {
        spdlog::critical("Failed to initialize the scanner: {}", e.what());
        return 1;
    }

    service->add_sink(std::make_shared<LogAlertSink>());
    if (config.redis_enabled) {
        auto bus = std::make_shared<RedisBus>(config);
        if (!bus->is_connected()) {
            spdlog::warn("Redis unavailable at startup; alerts will be retried per publish");
        }
        service->add_sink(bus);
    }

    // Register signal handlers
    g_service = service.get();
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    if (cycle_paths.empty()) {
        spdlog::warn("No cycle files given. Usage: {} <config.json> <cycle.json>...", argv[0]);
    }

    int exit_code = 0;
    for (const auto& path : cycle_paths) {
        if (g_terminate_flag) {
            spdlog::info("Termination requested; skipping remaining cycles");
            break;
        }

        CycleInput input;
        try {
            input = load_cycle(path);
        } catch (const std::exception& e) {
            spdlog::error("Failed to read cycle {}: {}", path, e.what());
            exit_code = 2;
            continue;
        }

        CycleReport report = service->run_cycle(input);
        for (const auto& warning : report.warnings) {
            spdlog::warn("Cycle {}: {}", path, warning);
        }
        if (report.cancelled) {
            spdlog::info("Cycle {} cancelled", path);
        }
    }

    g_service = nullptr;
    service.reset();

    spdlog::info("Confluence Scanner has shut down gracefully.");
    spdlog::shutdown();
    return exit_code;
}
