#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

struct UniverseEntry {
    std::string symbol;
    double turnover_24h = 0.0;
    double last_price = 0.0;
};

struct BookLevel {
    double price = 0.0;
    double size = 0.0;
};

// Best level first on both sides
struct OrderBook {
    std::vector<BookLevel> bids;
    std::vector<BookLevel> asks;
};

// Upstream feeds consumed by the scanner. Every call is bounded by a timeout;
// std::nullopt means the data is unavailable and the caller skips it.
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    virtual std::optional<std::vector<UniverseEntry>> fetch_universe() = 0;

    // Raw kline rows, newest first, as delivered by the exchange
    virtual std::optional<nlohmann::json> fetch_klines(const std::string& symbol,
                                                       const std::string& interval,
                                                       int limit) = 0;

    virtual std::optional<OrderBook> fetch_order_book(const std::string& symbol, int depth) = 0;
};
