#pragma once

#include <cstdint>
#include <string>
#include <vector>

// OHLCV record, produced once at the ingestion boundary
struct Candle {
    int64_t open_time_ms;
    double open;
    double high;
    double low;
    double close;
    double volume;
};

// Always chronological ascending by open_time_ms
using KlineSeries = std::vector<Candle>;

enum class Direction {
    Long,
    Short
};

inline const char* to_string(Direction d) {
    return d == Direction::Long ? "LONG" : "SHORT";
}

inline const char* to_side(Direction d) {
    return d == Direction::Long ? "BUY" : "SELL";
}

enum class SetupType {
    PullbackEma21,
    BreakoutRetest
};

inline const char* to_string(SetupType s) {
    return s == SetupType::PullbackEma21 ? "pullback_ema21" : "breakout_retest";
}

inline std::vector<double> closes_of(const KlineSeries& series) {
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& c : series) out.push_back(c.close);
    return out;
}

inline std::vector<double> volumes_of(const KlineSeries& series) {
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& c : series) out.push_back(c.volume);
    return out;
}
