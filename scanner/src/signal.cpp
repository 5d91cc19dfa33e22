#include "signal.hpp"
#include "util.hpp"
#include <cmath>

bool SignalCandidate::levels_valid() const {
    const double levels[] = {entry, entry_min, entry_max, stop_loss,
                             take_profit_1, take_profit_2, take_profit_3, risk_reward};
    for (double v : levels) {
        if (!std::isfinite(v) || v <= 0.0) return false;
    }

    if (entry_min > entry || entry > entry_max) return false;

    if (direction == Direction::Long) {
        return stop_loss < entry &&
               entry < take_profit_1 && take_profit_1 < take_profit_2 &&
               take_profit_2 < take_profit_3;
    }
    return stop_loss > entry &&
           entry > take_profit_1 && take_profit_1 > take_profit_2 &&
           take_profit_2 > take_profit_3;
}

std::string vwap_state(const indicators::VwapResult& vwap) {
    if (vwap.reclaimed) return "reclaimed";
    if (vwap.rejected) return "rejected";
    return vwap.above ? "above" : "below";
}

std::string divergence_label(const indicators::Divergence& divergence) {
    if (!divergence.confirmed) return "none";
    return divergence.bullish ? "bullish" : "bearish";
}

void to_json(nlohmann::json& j, const TradingSignal& s) {
    const auto& c = s.candidate;
    const auto& snap = c.snapshot;

    j = nlohmann::json{
        {"id", s.id},
        {"symbol", c.symbol},
        {"pair", c.symbol},
        {"strategy", c.strategy},
        {"profile", c.profile},
        {"direction", to_string(c.direction)},
        {"side", to_side(c.direction)},
        {"status", s.status},
        {"timeframe", c.trend_timeframe + "/" + c.execution_timeframe},
        {"setup_type", to_string(c.setup)},
        {"entry_zone", {{"min", c.entry_min}, {"max", c.entry_max}}},
        {"entry_price", (c.entry_min + c.entry_max) / 2.0},
        {"stop_loss", c.stop_loss},
        {"take_profit_1", c.take_profit_1},
        {"take_profit_2", c.take_profit_2},
        {"take_profit_3", c.take_profit_3},
        {"risk_reward", c.risk_reward},
        {"rr_min", c.rr_min},
        {"score", c.score},
        {"confidence", s.confidence},
        {"rationale", s.rationale},
        {"reasons", c.reasons},
        {"atr", snap.atr},
        {"rsi", snap.rsi},
        {"vwap_state", vwap_state(snap.vwap)},
        {"divergence", divergence_label(snap.divergence)},
        {"nearest_sr", {
            {"type", c.nearest_level.type},
            {"price", c.nearest_level.price},
            {"distance", c.nearest_level.distance}
        }},
        {"indicators", {
            {"ema9", snap.execution.ema9},
            {"ema14", snap.execution.ema14},
            {"ema21", snap.execution.ema21},
            {"vwap", snap.vwap.vwap},
            {"macd", {
                {"value", snap.macd.value},
                {"signal", snap.macd.signal},
                {"histogram", snap.macd.histogram},
                {"slope", snap.macd.slope}
            }},
            {"volume", {
                {"last", snap.volume.current},
                {"sma20", snap.volume.sma20},
                {"zscore", snap.volume.zscore}
            }}
        }},
        {"created_at", util::to_iso8601(s.created_at_ms)},
        {"created_at_ms", s.created_at_ms},
        {"expires_at", util::to_iso8601(c.cooldown_until_ms)},
        {"cooldown_until_ms", c.cooldown_until_ms}
    };
}
