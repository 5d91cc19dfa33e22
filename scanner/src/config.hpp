#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>

struct Config {
    // Bybit
    std::string bybit_base;
    std::string bybit_category;
    std::string quote_coin;
    int request_timeout_ms;
    int max_concurrent_requests;
    int min_request_spacing_ms;

    // Scan
    int worker_threads;
    std::string strategy;
    std::string strategy_file;
    int scan_interval_seconds;
    uint64_t sampling_seed;

    // Redis
    std::string redis_url;
    std::string stream_signals;
    bool publish_signals;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();

    // Throws ConfigurationError
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
};
