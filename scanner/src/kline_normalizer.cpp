#include "kline_normalizer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

std::optional<double> KlineNormalizer::parse_number(const nlohmann::json& value) {
    if (value.is_number()) {
        double v = value.get<double>();
        if (!std::isfinite(v)) return std::nullopt;
        return v;
    }

    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty()) return std::nullopt;
        try {
            size_t consumed = 0;
            double v = std::stod(text, &consumed);
            if (consumed != text.size() || !std::isfinite(v)) return std::nullopt;
            return v;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    return std::nullopt;
}

std::optional<Candle> KlineNormalizer::parse_row(const nlohmann::json& row) {
    std::optional<double> ts, o, h, l, c, v;

    if (row.is_array()) {
        // [startTime, open, high, low, close, volume, turnover]
        if (row.size() < 6) return std::nullopt;
        ts = parse_number(row[0]);
        o = parse_number(row[1]);
        h = parse_number(row[2]);
        l = parse_number(row[3]);
        c = parse_number(row[4]);
        v = parse_number(row[5]);
    } else if (row.is_object()) {
        auto field = [&row](const char* key) -> std::optional<double> {
            auto it = row.find(key);
            if (it == row.end()) return std::nullopt;
            return parse_number(*it);
        };
        ts = field("open_time");
        o = field("open");
        h = field("high");
        l = field("low");
        c = field("close");
        v = field("volume");
    } else {
        return std::nullopt;
    }

    if (!ts || !o || !h || !l || !c || !v) return std::nullopt;
    // Timestamps past 2^53 ms are not exact as doubles nor real open times
    if (*ts < 0.0 || *ts >= 9007199254740992.0) return std::nullopt;
    if (*h < *l || *l <= 0.0 || *v < 0.0) return std::nullopt;
    if (*o > *h || *o < *l || *c > *h || *c < *l) return std::nullopt;

    return Candle{static_cast<int64_t>(*ts), *o, *h, *l, *c, *v};
}

KlineSeries KlineNormalizer::normalize(const nlohmann::json& raw_rows) {
    KlineSeries series;

    if (!raw_rows.is_array()) {
        spdlog::warn("Kline payload is not an array, treating as empty");
        return series;
    }

    series.reserve(raw_rows.size());
    size_t dropped = 0;

    // Feed order is newest-first; walk it backwards
    for (auto it = raw_rows.rbegin(); it != raw_rows.rend(); ++it) {
        auto candle = parse_row(*it);
        if (candle) {
            series.push_back(*candle);
        } else {
            dropped++;
        }
    }

    if (dropped > 0) {
        spdlog::debug("Dropped {} malformed kline rows", dropped);
    }

    if (!std::is_sorted(series.begin(), series.end(),
                        [](const Candle& a, const Candle& b) {
                            return a.open_time_ms < b.open_time_ms;
                        })) {
        std::stable_sort(series.begin(), series.end(),
                         [](const Candle& a, const Candle& b) {
                             return a.open_time_ms < b.open_time_ms;
                         });
    }

    auto last = std::unique(series.begin(), series.end(),
                            [](const Candle& a, const Candle& b) {
                                return a.open_time_ms == b.open_time_ms;
                            });
    series.erase(last, series.end());

    return series;
}
