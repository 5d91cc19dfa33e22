#pragma once

#include "candle.hpp"
#include <vector>
#include <cstddef>
#include <limits>

// Stateless technical indicators over chronological (oldest-first) input.
// Every function returns a neutral default when input is too short; callers
// gate on minimum history before trusting the result.
namespace indicators {

struct MacdResult {
    double value = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
    int slope = 0;  // sign of the latest histogram delta
};

struct VwapResult {
    double vwap = 0.0;
    bool above = false;
    bool reclaimed = false;
    bool rejected = false;
};

struct VolumeMetrics {
    double current = 0.0;
    double sma20 = 0.0;
    double zscore = 0.0;
};

struct PivotLevels {
    std::vector<double> resistance;
    std::vector<double> support;
};

struct Divergence {
    bool bullish = false;
    bool bearish = false;
    bool confirmed = false;
};

struct SrProximity {
    bool has_level = false;
    bool too_close = false;
    double nearest_level = 0.0;
    double distance = std::numeric_limits<double>::infinity();
};

// Seeded with the simple mean of the first `period` values; element i of the
// result corresponds to prices[i + period - 1]. Empty when prices < period.
std::vector<double> ema_series(const std::vector<double>& prices, size_t period);

// Last EMA value; falls back to the last price when prices < period.
double ema(const std::vector<double>& prices, size_t period);

// Wilder RSI. 50 on insufficient data, 100 when the average loss is zero.
double rsi(const std::vector<double>& prices, size_t period = 14);

// EMA12 - EMA26 aligned to `prices` (0.0 before the slow EMA is seeded).
std::vector<double> macd_line(const std::vector<double>& prices);

MacdResult macd(const std::vector<double>& prices);

// Mean true range over the most recent `period` candles; 0 when too short.
double atr(const KlineSeries& klines, size_t period = 14);

VwapResult vwap(const KlineSeries& klines, size_t window = 20);

VolumeMetrics volume_metrics(const std::vector<double>& volumes, size_t window = 20);

PivotLevels pivots(const KlineSeries& klines,
                   size_t lookback = 5,
                   size_t window = 60,
                   double cluster_pct = 0.001,
                   size_t max_levels = 3);

Divergence divergence(const std::vector<double>& prices,
                      const std::vector<double>& macd_values,
                      size_t window = 20);

bool ema_stack(double ema9, double ema14, double ema21, Direction direction);

SrProximity sr_proximity(double price, const PivotLevels& levels, double min_distance);

double swing_low(const KlineSeries& klines, size_t lookback);
double swing_high(const KlineSeries& klines, size_t lookback);

// High/low of the `lookback` candles preceding the last `exclude_last` ones.
struct Range {
    double high = 0.0;
    double low = 0.0;
    bool valid = false;
};
Range recent_range(const KlineSeries& klines, size_t lookback, size_t exclude_last);

} // namespace indicators
