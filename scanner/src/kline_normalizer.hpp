#pragma once

#include "candle.hpp"
#include <optional>
#include <nlohmann/json.hpp>

// Converts raw exchange kline rows (newest-first, string or numeric fields)
// into a typed, strictly ascending KlineSeries.
class KlineNormalizer {
public:
    static KlineSeries normalize(const nlohmann::json& raw_rows);

    static std::optional<Candle> parse_row(const nlohmann::json& row);

private:
    static std::optional<double> parse_number(const nlohmann::json& value);
};
