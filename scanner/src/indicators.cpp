#include "indicators.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace indicators {

namespace {

constexpr double kSlopeEpsilon = 1e-10;

int sign_of(double delta) {
    if (delta > kSlopeEpsilon) return 1;
    if (delta < -kSlopeEpsilon) return -1;
    return 0;
}

struct Cluster {
    double level;
    int touches;
    size_t last_index;
};

void add_to_clusters(std::vector<Cluster>& clusters, double level, size_t index,
                     double cluster_pct) {
    for (auto& c : clusters) {
        if (std::abs(level - c.level) <= c.level * cluster_pct) {
            c.level = (c.level * c.touches + level) / (c.touches + 1);
            c.touches++;
            c.last_index = index;
            return;
        }
    }
    clusters.push_back(Cluster{level, 1, index});
}

std::vector<double> most_recent_levels(std::vector<Cluster> clusters, size_t max_levels) {
    std::stable_sort(clusters.begin(), clusters.end(),
                     [](const Cluster& a, const Cluster& b) {
                         return a.last_index < b.last_index;
                     });
    if (clusters.size() > max_levels) {
        clusters.erase(clusters.begin(), clusters.end() - max_levels);
    }

    std::vector<double> levels;
    levels.reserve(clusters.size());
    for (const auto& c : clusters) levels.push_back(c.level);
    return levels;
}

} // namespace

std::vector<double> ema_series(const std::vector<double>& prices, size_t period) {
    std::vector<double> out;
    if (period == 0 || prices.size() < period) return out;

    const double k = 2.0 / (static_cast<double>(period) + 1.0);
    double seed = std::accumulate(prices.begin(), prices.begin() + period, 0.0) /
                  static_cast<double>(period);

    out.reserve(prices.size() - period + 1);
    out.push_back(seed);
    for (size_t i = period; i < prices.size(); ++i) {
        out.push_back(prices[i] * k + out.back() * (1.0 - k));
    }
    return out;
}

double ema(const std::vector<double>& prices, size_t period) {
    if (prices.empty()) return 0.0;
    if (prices.size() < period) return prices.back();

    auto series = ema_series(prices, period);
    return series.empty() ? prices.back() : series.back();
}

double rsi(const std::vector<double>& prices, size_t period) {
    if (period == 0 || prices.size() < period + 1) return 50.0;

    double gains = 0.0;
    double losses = 0.0;
    for (size_t i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) gains += change;
        else losses -= change;
    }

    const double p = static_cast<double>(period);
    double avg_gain = gains / p;
    double avg_loss = losses / p;

    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        double gain = change > 0 ? change : 0.0;
        double loss = change < 0 ? -change : 0.0;
        avg_gain = (avg_gain * (p - 1.0) + gain) / p;
        avg_loss = (avg_loss * (p - 1.0) + loss) / p;
    }

    if (avg_loss == 0.0) return 100.0;
    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

std::vector<double> macd_line(const std::vector<double>& prices) {
    std::vector<double> line(prices.size(), 0.0);
    if (prices.size() < 26) return line;

    auto fast = ema_series(prices, 12);  // fast[i] <-> prices[i + 11]
    auto slow = ema_series(prices, 26);  // slow[j] <-> prices[j + 25]

    for (size_t k = 25; k < prices.size(); ++k) {
        line[k] = fast[k - 11] - slow[k - 25];
    }
    return line;
}

MacdResult macd(const std::vector<double>& prices) {
    MacdResult result;
    if (prices.size() < 26) return result;

    auto aligned = macd_line(prices);
    std::vector<double> line(aligned.begin() + 25, aligned.end());

    result.value = line.back();

    auto signal = ema_series(line, 9);  // signal[m] <-> line[m + 8]
    if (signal.empty()) {
        result.signal = result.value;
        result.histogram = 0.0;
        return result;
    }

    result.signal = signal.back();
    result.histogram = result.value - result.signal;

    if (signal.size() >= 2) {
        size_t last = line.size() - 1;
        double prev_hist = line[last - 1] - signal[signal.size() - 2];
        result.slope = sign_of(result.histogram - prev_hist);
    }

    return result;
}

double atr(const KlineSeries& klines, size_t period) {
    if (period == 0 || klines.size() < period + 1) return 0.0;

    double sum = 0.0;
    for (size_t i = klines.size() - period; i < klines.size(); ++i) {
        const auto& cur = klines[i];
        double prev_close = klines[i - 1].close;
        double tr = std::max({cur.high - cur.low,
                              std::abs(cur.high - prev_close),
                              std::abs(cur.low - prev_close)});
        sum += tr;
    }
    return sum / static_cast<double>(period);
}

VwapResult vwap(const KlineSeries& klines, size_t window) {
    VwapResult result;
    if (klines.empty() || window == 0) return result;

    size_t start = klines.size() > window ? klines.size() - window : 0;
    double pv = 0.0;
    double vol = 0.0;
    for (size_t i = start; i < klines.size(); ++i) {
        const auto& k = klines[i];
        double typical = (k.high + k.low + k.close) / 3.0;
        pv += typical * k.volume;
        vol += k.volume;
    }

    if (vol <= 0.0) return result;

    result.vwap = pv / vol;
    const double last = klines.back().close;
    result.above = last > result.vwap;

    // Cross within the last one or two candles
    if (klines.size() >= 2) {
        const double prev = klines[klines.size() - 2].close;
        double prev2 = prev;
        if (klines.size() >= 3) prev2 = klines[klines.size() - 3].close;

        result.reclaimed = last > result.vwap &&
                           (prev < result.vwap || (prev2 < result.vwap && prev > result.vwap));
        result.rejected = last < result.vwap &&
                          (prev > result.vwap || (prev2 > result.vwap && prev < result.vwap));
    }

    return result;
}

VolumeMetrics volume_metrics(const std::vector<double>& volumes, size_t window) {
    VolumeMetrics m;
    if (volumes.empty()) return m;

    m.current = volumes.back();
    if (window == 0 || volumes.size() < window) {
        m.sma20 = m.current;
        m.zscore = 0.0;
        return m;
    }

    const double n = static_cast<double>(window);
    double sum = std::accumulate(volumes.end() - window, volumes.end(), 0.0);
    m.sma20 = sum / n;

    double variance = 0.0;
    for (auto it = volumes.end() - window; it != volumes.end(); ++it) {
        variance += (*it - m.sma20) * (*it - m.sma20);
    }
    variance /= n;

    double stddev = std::sqrt(variance);
    m.zscore = stddev > 0.0 ? (m.current - m.sma20) / stddev : 0.0;
    return m;
}

PivotLevels pivots(const KlineSeries& klines, size_t lookback, size_t window,
                   double cluster_pct, size_t max_levels) {
    PivotLevels levels;
    if (lookback == 0 || klines.size() < lookback * 2 + 1) return levels;

    size_t start = klines.size() > window ? klines.size() - window : 0;
    start = std::max(start, lookback);

    std::vector<Cluster> highs;
    std::vector<Cluster> lows;

    for (size_t i = start; i + lookback < klines.size(); ++i) {
        const auto& cur = klines[i];
        bool is_high = true;
        bool is_low = true;

        for (size_t j = i - lookback; j <= i + lookback; ++j) {
            if (j == i) continue;
            if (klines[j].high >= cur.high) is_high = false;
            if (klines[j].low <= cur.low) is_low = false;
        }

        if (is_high) add_to_clusters(highs, cur.high, i, cluster_pct);
        if (is_low) add_to_clusters(lows, cur.low, i, cluster_pct);
    }

    levels.resistance = most_recent_levels(std::move(highs), max_levels);
    levels.support = most_recent_levels(std::move(lows), max_levels);
    return levels;
}

Divergence divergence(const std::vector<double>& prices,
                      const std::vector<double>& macd_values, size_t window) {
    Divergence d;
    if (window < 4 || prices.size() < window || macd_values.size() < window) return d;

    const double* p = prices.data() + (prices.size() - window);
    const double* m = macd_values.data() + (macd_values.size() - window);
    const size_t half = window / 2;

    // Extrema of the earlier half vs the later half of the window
    auto argmin = [p](size_t from, size_t to) {
        size_t best = from;
        for (size_t i = from; i < to; ++i) if (p[i] <= p[best]) best = i;
        return best;
    };
    auto argmax = [p](size_t from, size_t to) {
        size_t best = from;
        for (size_t i = from; i < to; ++i) if (p[i] >= p[best]) best = i;
        return best;
    };

    size_t low_a = argmin(0, half);
    size_t low_b = argmin(half, window);
    size_t high_a = argmax(0, half);
    size_t high_b = argmax(half, window);

    d.bullish = p[low_b] < p[low_a] && m[low_b] > m[low_a];
    d.bearish = p[high_b] > p[high_a] && m[high_b] < m[high_a];
    d.confirmed = d.bullish != d.bearish;
    return d;
}

bool ema_stack(double ema9, double ema14, double ema21, Direction direction) {
    if (direction == Direction::Long) {
        return ema9 > ema14 && ema14 > ema21;
    }
    return ema9 < ema14 && ema14 < ema21;
}

SrProximity sr_proximity(double price, const PivotLevels& levels, double min_distance) {
    SrProximity result;

    auto consider = [&](double level) {
        double distance = std::abs(price - level);
        if (!result.has_level || distance < result.distance) {
            result.has_level = true;
            result.distance = distance;
            result.nearest_level = level;
        }
    };

    for (double level : levels.resistance) consider(level);
    for (double level : levels.support) consider(level);

    result.too_close = result.has_level && result.distance < min_distance;
    return result;
}

double swing_low(const KlineSeries& klines, size_t lookback) {
    if (klines.empty()) return 0.0;
    size_t start = klines.size() > lookback ? klines.size() - lookback : 0;
    double low = klines[start].low;
    for (size_t i = start; i < klines.size(); ++i) low = std::min(low, klines[i].low);
    return low;
}

double swing_high(const KlineSeries& klines, size_t lookback) {
    if (klines.empty()) return 0.0;
    size_t start = klines.size() > lookback ? klines.size() - lookback : 0;
    double high = klines[start].high;
    for (size_t i = start; i < klines.size(); ++i) high = std::max(high, klines[i].high);
    return high;
}

Range recent_range(const KlineSeries& klines, size_t lookback, size_t exclude_last) {
    Range r;
    if (lookback <= exclude_last || klines.size() < lookback) return r;

    size_t start = klines.size() - lookback;
    size_t end = klines.size() - exclude_last;
    r.high = klines[start].high;
    r.low = klines[start].low;
    for (size_t i = start; i < end; ++i) {
        r.high = std::max(r.high, klines[i].high);
        r.low = std::min(r.low, klines[i].low);
    }
    r.valid = true;
    return r;
}

} // namespace indicators
