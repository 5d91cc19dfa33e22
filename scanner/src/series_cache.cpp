#include "series_cache.hpp"
#include "kline_normalizer.hpp"
#include <spdlog/spdlog.h>

std::optional<KlineSeries> SeriesCache::klines(MarketDataProvider& provider,
                                               const std::string& symbol,
                                               const Timeframe& tf) {
    const std::string key = symbol + ":" + tf.interval;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = series_.find(key);
        if (it != series_.end()) return it->second;
    }

    // Fetched outside the lock; a symbol is evaluated by one worker at a time
    std::optional<KlineSeries> result;
    auto raw = provider.fetch_klines(symbol, tf.interval, tf.limit);
    if (raw) {
        auto series = KlineNormalizer::normalize(*raw);
        if (!series.empty()) {
            result = std::move(series);
        }
    }

    if (!result) {
        spdlog::warn("Kline data unavailable for {} ({})", symbol, tf.label());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    series_[key] = result;
    return result;
}

std::optional<OrderBook> SeriesCache::order_book(MarketDataProvider& provider,
                                                 const std::string& symbol,
                                                 int depth) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(symbol);
        if (it != books_.end()) return it->second;
    }

    auto book = provider.fetch_order_book(symbol, depth);
    if (!book) {
        spdlog::debug("No order book for {}, using neutral score", symbol);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    books_[symbol] = book;
    return book;
}

size_t SeriesCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return series_.size() + books_.size();
}
