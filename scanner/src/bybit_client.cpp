#include "bybit_client.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <memory>

namespace {

std::optional<double> to_double(const nlohmann::json& value) {
    if (value.is_number()) return value.get<double>();
    if (!value.is_string()) return std::nullopt;
    try {
        return std::stod(value.get<std::string>());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<BookLevel> parse_side(const nlohmann::json& side) {
    std::vector<BookLevel> levels;
    if (!side.is_array()) return levels;

    for (const auto& row : side) {
        if (!row.is_array() || row.size() < 2) continue;
        auto price = to_double(row[0]);
        auto size = to_double(row[1]);
        if (price && size && *price > 0.0 && *size >= 0.0) {
            levels.push_back(BookLevel{*price, *size});
        }
    }
    return levels;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

BybitClient::BybitClient(const std::string& base_url,
                         const std::string& category,
                         const std::string& quote_coin,
                         int timeout_ms,
                         RequestLimiter& limiter)
    : base_url_(base_url)
    , category_(category)
    , quote_coin_(quote_coin)
    , timeout_ms_(timeout_ms)
    , limiter_(limiter) {}

size_t BybitClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

std::optional<nlohmann::json> BybitClient::make_request(const std::string& endpoint) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        spdlog::error("Failed to initialize CURL for Bybit request");
        return std::nullopt;
    }

    std::string response_string;
    std::string url = base_url_ + endpoint;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res;
    long http_code = 0;
    {
        auto permit = limiter_.acquire();
        res = curl_easy_perform(curl.get());
    }

    if (res != CURLE_OK) {
        spdlog::warn("Bybit request {} failed: {}", endpoint, curl_easy_strerror(res));
        return std::nullopt;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        spdlog::warn("Bybit request {} returned HTTP {}", endpoint, http_code);
        return std::nullopt;
    }

    try {
        auto body = nlohmann::json::parse(response_string);
        int ret_code = body.value("retCode", -1);
        if (ret_code != 0) {
            spdlog::warn("Bybit request {} rejected: retCode={} {}", endpoint, ret_code,
                         body.value("retMsg", ""));
            return std::nullopt;
        }
        if (!body.contains("result") || !body["result"].is_object()) {
            spdlog::warn("Bybit response for {} has no result", endpoint);
            return std::nullopt;
        }
        return body["result"];
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse Bybit response for {}: {}", endpoint, e.what());
        return std::nullopt;
    }
}

std::vector<UniverseEntry> BybitClient::parse_tickers(const nlohmann::json& result,
                                                      const std::string& quote_coin) {
    std::vector<UniverseEntry> entries;
    auto list = result.find("list");
    if (list == result.end() || !list->is_array()) return entries;

    for (const auto& item : *list) {
        if (!item.is_object()) continue;

        std::string symbol = item.value("symbol", "");
        if (symbol.empty() || !ends_with(symbol, quote_coin)) continue;

        std::optional<double> turnover;
        if (item.contains("turnover24h")) turnover = to_double(item["turnover24h"]);
        if (!turnover) continue;

        UniverseEntry entry;
        entry.symbol = symbol;
        entry.turnover_24h = *turnover;
        if (item.contains("lastPrice")) {
            entry.last_price = to_double(item["lastPrice"]).value_or(0.0);
        }
        entries.push_back(entry);
    }

    return entries;
}

std::optional<OrderBook> BybitClient::parse_order_book(const nlohmann::json& result) {
    if (!result.is_object()) return std::nullopt;

    OrderBook book;
    if (result.contains("b")) book.bids = parse_side(result["b"]);
    if (result.contains("a")) book.asks = parse_side(result["a"]);

    if (book.bids.empty() || book.asks.empty()) return std::nullopt;
    return book;
}

std::optional<std::vector<UniverseEntry>> BybitClient::fetch_universe() {
    auto result = make_request("/market/tickers?category=" + category_);
    if (!result) return std::nullopt;

    auto entries = parse_tickers(*result, quote_coin_);
    if (entries.empty()) {
        spdlog::warn("Bybit ticker list is empty");
        return std::nullopt;
    }

    spdlog::debug("Fetched {} {} tickers", entries.size(), quote_coin_);
    return entries;
}

std::optional<nlohmann::json> BybitClient::fetch_klines(const std::string& symbol,
                                                        const std::string& interval,
                                                        int limit) {
    auto result = make_request("/market/kline?category=" + category_ +
                               "&symbol=" + symbol +
                               "&interval=" + interval +
                               "&limit=" + std::to_string(limit));
    if (!result) return std::nullopt;

    auto list = result->find("list");
    if (list == result->end() || !list->is_array() || list->empty()) {
        spdlog::warn("No klines for {} ({})", symbol, interval);
        return std::nullopt;
    }

    return *list;
}

std::optional<OrderBook> BybitClient::fetch_order_book(const std::string& symbol, int depth) {
    auto result = make_request("/market/orderbook?category=" + category_ +
                               "&symbol=" + symbol +
                               "&limit=" + std::to_string(depth));
    if (!result) return std::nullopt;

    return parse_order_book(*result);
}
