#pragma once

#include "market_data.hpp"
#include "request_limiter.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

// Bybit v5 public market endpoints. Safe to call from several worker
// threads: each request uses its own curl handle and goes through the
// shared RequestLimiter.
class BybitClient : public MarketDataProvider {
public:
    BybitClient(const std::string& base_url,
                const std::string& category,
                const std::string& quote_coin,
                int timeout_ms,
                RequestLimiter& limiter);

    std::optional<std::vector<UniverseEntry>> fetch_universe() override;

    std::optional<nlohmann::json> fetch_klines(const std::string& symbol,
                                               const std::string& interval,
                                               int limit) override;

    std::optional<OrderBook> fetch_order_book(const std::string& symbol, int depth) override;

    // Parses a /market/tickers result; exposed for tests
    static std::vector<UniverseEntry> parse_tickers(const nlohmann::json& result,
                                                    const std::string& quote_coin);
    static std::optional<OrderBook> parse_order_book(const nlohmann::json& result);

private:
    std::string base_url_;
    std::string category_;
    std::string quote_coin_;
    int timeout_ms_;
    RequestLimiter& limiter_;

    // Returns the "result" object of a successful response
    std::optional<nlohmann::json> make_request(const std::string& endpoint);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
