#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis)
    : redis_(redis) {}

void HealthCheck::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthCheck::record_scan(const std::vector<TradingSignal>& signals, const ScanStats& stats) {
    auto list = nlohmann::json::array();
    for (const auto& s : signals) {
        list.push_back(s);
    }

    auto profiles = nlohmann::json::array();
    for (const auto& p : stats.profiles) {
        profiles.push_back({{"name", p.name}, {"pool", p.pool_size}, {"accepted", p.accepted}});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    last_scan_ms_ = stats.finished_ms;
    last_signal_count_ = signals.size();
    last_signals_ = std::move(list);
    last_profiles_ = std::move(profiles);
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_ ? redis_->ping() : true;

    std::lock_guard<std::mutex> lock(mutex_);
    bool loop_ok = loop_status_ != "error";
    return {
        {"ok", redis_ok && loop_ok},
        {"redis", redis_ ? (redis_ok ? "ok" : "down") : "disabled"},
        {"loop", loop_status_},
        {"last_scan_ts", last_scan_ms_ > 0 ? util::to_iso8601(last_scan_ms_) : ""},
        {"last_signal_count", last_signal_count_},
        {"profiles", last_profiles_},
        {"ts", util::current_iso8601()}
    };
}

nlohmann::json HealthCheck::last_signals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_signals_;
}

bool HealthCheck::is_healthy() {
    bool redis_ok = redis_ ? redis_->ping() : true;
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_ok && loop_status_ != "error";
}
