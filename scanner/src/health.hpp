#pragma once
#include "redis_bus.hpp"
#include "scan_engine.hpp"
#include "signal.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class HealthCheck {
public:
    // `redis` may be null when publishing is disabled
    explicit HealthCheck(std::shared_ptr<RedisBus> redis);

    void set_loop_status(const std::string& status);
    void record_scan(const std::vector<TradingSignal>& signals, const ScanStats& stats);

    nlohmann::json get_status();
    nlohmann::json last_signals() const;
    bool is_healthy();

private:
    std::shared_ptr<RedisBus> redis_;

    mutable std::mutex mutex_;
    std::string loop_status_ = "idle";
    int64_t last_scan_ms_ = 0;
    size_t last_signal_count_ = 0;
    nlohmann::json last_signals_ = nlohmann::json::array();
    nlohmann::json last_profiles_ = nlohmann::json::array();
};
