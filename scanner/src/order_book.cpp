#include "order_book.hpp"
#include <algorithm>

namespace {

double side_depth(const std::vector<BookLevel>& levels, size_t depth) {
    double total = 0.0;
    size_t n = std::min(depth, levels.size());
    for (size_t i = 0; i < n; ++i) {
        total += levels[i].price * levels[i].size;
    }
    return total;
}

} // namespace

OrderBookMetrics OrderBookScorer::analyze(const std::optional<OrderBook>& book, size_t depth) {
    OrderBookMetrics m;
    if (!book || book->bids.empty() || book->asks.empty()) {
        return m;
    }

    const double best_bid = book->bids.front().price;
    const double best_ask = book->asks.front().price;
    if (best_bid <= 0.0 || best_ask < best_bid) {
        return m;
    }

    m.bid_depth = side_depth(book->bids, depth);
    m.ask_depth = side_depth(book->asks, depth);
    const double total = m.bid_depth + m.ask_depth;
    if (total <= 0.0) {
        return m;
    }

    m.available = true;
    m.liquidity_ratio = m.bid_depth / total;
    m.spread_pct = (best_ask - best_bid) / best_bid * 100.0;

    double score = kNeutralScore;
    if (m.spread_pct < 0.1) {
        score += 0.3;
    } else if (m.spread_pct < 0.2) {
        score += 0.2;
    }

    if (m.liquidity_ratio > 0.4 && m.liquidity_ratio < 0.6) {
        score += 0.2;
    }

    m.score = std::min(1.0, score);
    return m;
}
