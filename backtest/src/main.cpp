#include "config.hpp"
#include "backtest_service.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <stdexcept>

int main(int argc, char* argv[]) {
    // Set up logger; stdout carries the JSON report
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("wincal", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info); // Default, will be overridden by config
    spdlog::flush_on(spdlog::level::info);

    Config config;
    try {
        config = Config::from_env();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
    } catch (const std::exception& e) {
        spdlog::critical("Failed to load configuration: {}", e.what());
        return 1;
    }

    std::string predictions_path = config.predictions_path;
    if (argc > 1) {
        predictions_path = argv[1];
    }

    try {
        BacktestService service(config);
        BacktestReport report = service.run_file(predictions_path);
        std::cout << report.to_json().dump(2) << std::endl;
    } catch (const std::invalid_argument& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Backtest failed: {}", e.what());
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
