#include "config.hpp"
#include "scan_profile.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.bybit_base = get_env("BYBIT_BASE", "https://api.bybit.com/v5");
    cfg.bybit_category = get_env("BYBIT_CATEGORY", "linear");
    cfg.quote_coin = get_env("QUOTE_COIN", "USDT");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);
    cfg.max_concurrent_requests = get_env_int("MAX_CONCURRENT_REQUESTS", 4);
    cfg.min_request_spacing_ms = get_env_int("MIN_REQUEST_SPACING_MS", 50);

    cfg.worker_threads = get_env_int("WORKER_THREADS", 4);
    cfg.strategy = get_env("STRATEGY", "classic_v2");
    cfg.strategy_file = get_env("STRATEGY_FILE");
    cfg.scan_interval_seconds = get_env_int("SCAN_INTERVAL_SECONDS", 300);

    // 0 derives the seed from the clock
    int seed = get_env_int("SAMPLING_SEED", 0);
    cfg.sampling_seed = seed != 0 ? static_cast<uint64_t>(seed)
                                  : static_cast<uint64_t>(util::current_timestamp_ms());

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_signals = get_env("STREAM_SIGNALS", "trendscout.signals");
    cfg.publish_signals = get_env_int("PUBLISH_SIGNALS", 1) != 0;

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "scanner");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (bybit_base.empty()) {
        throw ConfigurationError("BYBIT_BASE is required");
    }
    if (request_timeout_ms <= 0) {
        throw ConfigurationError("REQUEST_TIMEOUT_MS must be > 0");
    }
    if (max_concurrent_requests <= 0 || worker_threads <= 0) {
        throw ConfigurationError("MAX_CONCURRENT_REQUESTS and WORKER_THREADS must be > 0");
    }
    if (min_request_spacing_ms < 0) {
        throw ConfigurationError("MIN_REQUEST_SPACING_MS must be >= 0");
    }
    if (scan_interval_seconds <= 0) {
        throw ConfigurationError("SCAN_INTERVAL_SECONDS must be > 0");
    }
    if (publish_signals && (redis_url.empty() || stream_signals.empty())) {
        throw ConfigurationError("REDIS_URL and STREAM_SIGNALS are required when publishing");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw ConfigurationError("LISTEN_PORT out of range");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Strategy: {}{}", strategy,
                 strategy_file.empty() ? "" : " (overrides from " + strategy_file + ")");
    spdlog::info("  Scan interval: {}s, workers={}", scan_interval_seconds, worker_threads);
    spdlog::info("  Requests: max_in_flight={}, spacing={}ms, timeout={}ms",
                 max_concurrent_requests, min_request_spacing_ms, request_timeout_ms);
}
