#pragma once

#include "candle.hpp"
#include "market_data.hpp"
#include "strategy.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

// Per-pass memo of normalized kline series and order books, so every
// profile of one pass judges the same snapshot and each symbol/interval is
// requested at most once. Failed fetches are remembered too.
class SeriesCache {
public:
    std::optional<KlineSeries> klines(MarketDataProvider& provider,
                                      const std::string& symbol,
                                      const Timeframe& tf);

    std::optional<OrderBook> order_book(MarketDataProvider& provider,
                                        const std::string& symbol,
                                        int depth);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::optional<KlineSeries>> series_;
    std::map<std::string, std::optional<OrderBook>> books_;
};
