#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis: {}", redis_url);
}

size_t RedisBus::publish_signals(const std::string& stream,
                                 const std::vector<TradingSignal>& signals) {
    size_t written = 0;
    for (const auto& signal : signals) {
        try {
            std::unordered_map<std::string, std::string> fields;
            fields["data"] = nlohmann::json(signal).dump();
            redis_->xadd(stream, "*", fields.begin(), fields.end());
            written++;
        } catch (const std::exception& e) {
            spdlog::error("Failed to publish signal {}: {}", signal.id, e.what());
        }
    }
    return written;
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
