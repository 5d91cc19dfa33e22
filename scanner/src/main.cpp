#include "config.hpp"
#include "assembler.hpp"
#include "bybit_client.hpp"
#include "cooldown.hpp"
#include "health.hpp"
#include "redis_bus.hpp"
#include "request_limiter.hpp"
#include "scan_engine.hpp"
#include "strategy.hpp"
#include "util.hpp"
#include <httplib.h>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("trendscout", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("Logging initialized at level: {}", log_level);
}

StrategyConfig load_strategy(const Config& config) {
    StrategyConfig strategy = config.strategy_file.empty()
        ? StrategyConfig::preset(config.strategy)
        : StrategyConfig::from_file(config.strategy_file, config.strategy);
    strategy.validate();

    spdlog::info("Strategy {}: trend {} / execution {}, {} profiles, cooldown {} candles",
                 strategy.name, strategy.trend.label(), strategy.execution.label(),
                 strategy.profiles.size(), strategy.cooldown_candles);
    return strategy;
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);

        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        StrategyConfig strategy;
        try {
            config.validate();
            strategy = load_strategy(config);
        } catch (const ConfigurationError& e) {
            spdlog::error("Configuration error: {}", e.what());
            return 1;
        }

        curl_global_init(CURL_GLOBAL_DEFAULT);

        std::shared_ptr<RedisBus> redis;
        if (config.publish_signals) {
            redis = std::make_shared<RedisBus>(config.redis_url);
            if (!redis->ping()) {
                spdlog::error("Failed to connect to Redis");
                curl_global_cleanup();
                return 1;
            }
        }

        RequestLimiter limiter(config.max_concurrent_requests, config.min_request_spacing_ms);
        BybitClient bybit(config.bybit_base, config.bybit_category, config.quote_coin,
                          config.request_timeout_ms, limiter);
        CooldownTracker cooldowns;
        SignalAssembler assembler(config.sampling_seed);
        ScanEngine engine(bybit, cooldowns, assembler, config.worker_threads, config.sampling_seed);
        HealthCheck health(redis);

        // Setup HTTP server for /health and /signals
        httplib::Server http_server;

        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            auto status = health.get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status.value("ok", false) ? 200 : 503;
        });

        http_server.Get("/signals", [&health](const httplib::Request&, httplib::Response& res) {
            res.set_content(health.last_signals().dump(), "application/json");
        });

        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            http_server.listen(config.listen_addr.c_str(), config.listen_port);
        });

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        spdlog::info("Entering scan loop, every {}s", config.scan_interval_seconds);
        health.set_loop_status("running");

        while (!shutdown_requested) {
            try {
                auto signals = engine.generate_signals(strategy);
                auto stats = engine.last_stats();
                health.record_scan(signals, stats);

                spdlog::info("Scan pass done: {} signals, {} candidates, {} ms",
                             signals.size(), stats.candidates,
                             stats.finished_ms - stats.started_ms);

                if (redis && !signals.empty()) {
                    size_t written = redis->publish_signals(config.stream_signals, signals);
                    spdlog::info("Published {}/{} signals to {}",
                                 written, signals.size(), config.stream_signals);
                }
                health.set_loop_status("running");
            } catch (const std::exception& e) {
                spdlog::error("Error in scan loop: {}", e.what());
                health.set_loop_status("error");
            }

            // Sleep in short steps so a signal ends the wait promptly
            auto next_scan = std::chrono::steady_clock::now() +
                             std::chrono::seconds(config.scan_interval_seconds);
            while (!shutdown_requested && std::chrono::steady_clock::now() < next_scan) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }

        spdlog::info("Shutting down gracefully");
        health.set_loop_status("shutdown");
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }

        curl_global_cleanup();
        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
