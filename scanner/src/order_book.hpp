#pragma once

#include "market_data.hpp"
#include <optional>

struct OrderBookMetrics {
    double bid_depth = 0.0;       // quote value across the top levels
    double ask_depth = 0.0;
    double liquidity_ratio = 0.5; // bid / (bid + ask)
    double spread_pct = 0.0;      // (ask - bid) / bid * 100
    double score = 0.5;           // 0..1, 0.5 when no book
    bool available = false;
};

// Liquidity-balance and spread micro-score from top-of-book depth
class OrderBookScorer {
public:
    static constexpr double kNeutralScore = 0.5;

    static OrderBookMetrics analyze(const std::optional<OrderBook>& book, size_t depth = 25);
};
