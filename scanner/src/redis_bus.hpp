#pragma once
#include "signal.hpp"
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);

    // One stream entry per signal, JSON under the "data" field.
    // Returns how many were written.
    size_t publish_signals(const std::string& stream, const std::vector<TradingSignal>& signals);
    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
