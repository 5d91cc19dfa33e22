#pragma once

#include "candle.hpp"
#include "indicators.hpp"
#include "order_book.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct TimeframeState {
    double close = 0.0;
    double ema9 = 0.0;
    double ema14 = 0.0;
    double ema21 = 0.0;
};

// Everything the evaluator needs for one symbol, computed once per pass.
// Trend fields come from the higher timeframe, the rest from execution.
struct IndicatorSnapshot {
    TimeframeState trend;
    TimeframeState execution;
    Candle last{};

    indicators::VwapResult vwap;
    indicators::MacdResult macd;
    double atr = 0.0;
    double rsi = 50.0;
    indicators::VolumeMetrics volume;
    indicators::PivotLevels pivots;
    indicators::Divergence divergence;

    indicators::Range breakout_range;
    double swing_low = 0.0;
    double swing_high = 0.0;

    OrderBookMetrics order_book;
};

struct NearestLevel {
    std::string type = "none";  // support | resistance | none
    double price = 0.0;
    double distance = 0.0;
};

// Accepted setup. Immutable once built by the evaluator.
struct SignalCandidate {
    std::string symbol;
    std::string strategy;
    std::string profile;
    Direction direction = Direction::Long;
    std::string trend_timeframe;
    std::string execution_timeframe;

    double entry = 0.0;
    double entry_min = 0.0;
    double entry_max = 0.0;
    double stop_loss = 0.0;
    double take_profit_1 = 0.0;
    double take_profit_2 = 0.0;
    double take_profit_3 = 0.0;
    double risk_reward = 0.0;
    double rr_min = 0.0;

    SetupType setup = SetupType::PullbackEma21;
    double score = 0.0;
    std::vector<std::string> reasons;   // profile tag first

    int64_t cooldown_until_ms = 0;

    IndicatorSnapshot snapshot;
    NearestLevel nearest_level;

    // Stop and targets on the correct side of the entry, R/R finite
    bool levels_valid() const;
};

struct TradingSignal {
    std::string id;
    int64_t created_at_ms = 0;
    double confidence = 0.0;            // score / 100
    std::string rationale;
    std::string status = "WAITING";
    SignalCandidate candidate;
};

std::string vwap_state(const indicators::VwapResult& vwap);
std::string divergence_label(const indicators::Divergence& divergence);

void to_json(nlohmann::json& j, const TradingSignal& s);
