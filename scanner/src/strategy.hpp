#pragma once

#include "candle.hpp"
#include "scan_profile.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Additive confidence weights; the maximum attainable score is 100
struct ScoringWeights {
    double ema_stack = 25.0;
    double vwap = 15.0;
    double macd = 15.0;
    double volume = 15.0;
    double pullback_setup = 15.0;
    double breakout_setup = 10.0;
    double rr_bonus = 15.0;
    double order_book = 0.0;

    double divergence_penalty = 10.0;
    double sr_penalty = 10.0;

    // Best case: pullback setup with every bonus and a perfect book
    double max_score() const {
        return ema_stack + vwap + macd + volume + pullback_setup + rr_bonus + order_book;
    }
};

// Execution-timeframe RSI window each direction must sit in, bounds inclusive
struct RsiBand {
    bool enabled = false;
    double long_min = 25.0;
    double long_max = 40.0;
    double short_min = 60.0;
    double short_max = 75.0;

    bool allows(Direction direction, double rsi) const {
        if (direction == Direction::Long) return rsi >= long_min && rsi <= long_max;
        return rsi >= short_min && rsi <= short_max;
    }
};

struct Timeframe {
    std::string interval;   // exchange interval code ("5", "15", "60")
    int minutes = 0;
    int limit = 0;          // candles requested
    int min_candles = 0;    // below this the symbol is insufficient history

    std::string label() const;  // "15m", "1h"
};

// One scan strategy: timeframe pair, scoring weights and the ordered profile
// tiers. The three shipped variants differ only in these values.
struct StrategyConfig {
    std::string name;

    Timeframe trend;
    Timeframe execution;

    ScoringWeights weights;
    std::vector<ScanProfile> profiles;

    int cooldown_candles = 5;       // execution-timeframe candles
    int target_candidates = 5;      // stop relaxing once reached
    int max_signals = 8;            // per pass

    bool use_order_book = false;
    int order_book_depth = 25;

    double entry_zone_pct = 0.001;  // half-width of the entry zone
    double rr_bonus_threshold = 2.0;
    int breakout_lookback = 10;
    int swing_lookback = 5;

    double sampling_rate = 1.0;

    RsiBand rsi_band;

    int64_t cooldown_ms() const;

    // Throws ConfigurationError
    void validate() const;

    static StrategyConfig classic_v2();
    static StrategyConfig classic_crypto_pro_v3();
    static StrategyConfig monster_v2();

    static std::vector<std::string> preset_names();

    // Throws ConfigurationError for an unknown name
    static StrategyConfig preset(const std::string& name);

    // Starts from the preset named by j["preset"] (or `base`) and overlays
    // the fields present in the document.
    static StrategyConfig from_json(const nlohmann::json& j, const std::string& base);
    static StrategyConfig from_file(const std::string& path, const std::string& base);
};

void to_json(nlohmann::json& j, const StrategyConfig& s);
