#include "strategy.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>
#include <fstream>

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

void read_timeframe(const nlohmann::json& j, Timeframe& tf) {
    if (!j.is_object()) {
        throw ConfigurationError("timeframe must be a JSON object");
    }
    read_field(j, "interval", tf.interval);
    read_field(j, "minutes", tf.minutes);
    read_field(j, "limit", tf.limit);
    read_field(j, "min_candles", tf.min_candles);
}

void read_weights(const nlohmann::json& j, ScoringWeights& w) {
    if (!j.is_object()) {
        throw ConfigurationError("weights must be a JSON object");
    }
    read_field(j, "ema_stack", w.ema_stack);
    read_field(j, "vwap", w.vwap);
    read_field(j, "macd", w.macd);
    read_field(j, "volume", w.volume);
    read_field(j, "pullback_setup", w.pullback_setup);
    read_field(j, "breakout_setup", w.breakout_setup);
    read_field(j, "rr_bonus", w.rr_bonus);
    read_field(j, "order_book", w.order_book);
    read_field(j, "divergence_penalty", w.divergence_penalty);
    read_field(j, "sr_penalty", w.sr_penalty);
}

void read_rsi_band(const nlohmann::json& j, RsiBand& band) {
    if (!j.is_object()) {
        throw ConfigurationError("rsi_band must be a JSON object");
    }
    read_field(j, "enabled", band.enabled);
    read_field(j, "long_min", band.long_min);
    read_field(j, "long_max", band.long_max);
    read_field(j, "short_min", band.short_min);
    read_field(j, "short_max", band.short_max);
}

// Tiers shared by the classic variants, strict to exploratory
std::vector<ScanProfile> classic_profiles(int max_signals) {
    ScanProfile strict;
    strict.name = "strict";
    strict.min_turnover = 10'000'000.0;
    strict.top_volume_count = 40;
    strict.min_rr = 1.6;
    strict.atr_stop_k = 0.8;
    strict.min_volume_zscore = 1.0;
    strict.min_volume_multiple = 1.2;
    strict.pullback_volume_zscore = 0.5;
    strict.pullback_volume_multiple = 1.0;
    strict.ema_touch_tolerance_pct = 0.2;
    strict.sr_distance_multiplier = 0.5;
    strict.min_confidence = 60.0;
    strict.block_on_divergence = true;
    strict.require_execution_agreement = true;
    strict.check_sr_proximity = true;
    strict.max_signals = max_signals;

    ScanProfile balanced;
    balanced.name = "balanced";
    balanced.min_turnover = 5'000'000.0;
    balanced.top_volume_count = 60;
    balanced.min_rr = 1.4;
    balanced.atr_stop_k = 0.8;
    balanced.min_volume_zscore = 0.8;
    balanced.min_volume_multiple = 1.1;
    balanced.pullback_volume_zscore = 0.3;
    balanced.pullback_volume_multiple = 0.9;
    balanced.ema_touch_tolerance_pct = 0.5;
    balanced.sr_distance_multiplier = 0.4;
    balanced.min_confidence = 55.0;
    balanced.block_on_divergence = true;
    balanced.require_execution_agreement = true;
    balanced.check_sr_proximity = true;
    balanced.max_signals = max_signals;

    ScanProfile relaxed;
    relaxed.name = "relaxed";
    relaxed.min_turnover = 2'000'000.0;
    relaxed.top_volume_count = 80;
    relaxed.min_rr = 1.2;
    relaxed.atr_stop_k = 0.7;
    relaxed.min_volume_zscore = 0.5;
    relaxed.min_volume_multiple = 1.0;
    relaxed.pullback_volume_zscore = 0.0;
    relaxed.pullback_volume_multiple = 0.8;
    relaxed.ema_touch_tolerance_pct = 1.0;
    relaxed.sr_distance_multiplier = 0.25;
    relaxed.min_confidence = 50.0;
    relaxed.block_on_divergence = false;
    relaxed.require_execution_agreement = true;
    relaxed.check_sr_proximity = true;
    relaxed.max_signals = max_signals;

    // Last resort: S/R proximity and execution agreement are ignored
    ScanProfile exploratory;
    exploratory.name = "exploratory";
    exploratory.min_turnover = 1'000'000.0;
    exploratory.top_volume_count = 100;
    exploratory.min_rr = 1.0;
    exploratory.atr_stop_k = 0.6;
    exploratory.min_volume_zscore = 0.0;
    exploratory.min_volume_multiple = 0.8;
    exploratory.pullback_volume_zscore = 0.0;
    exploratory.pullback_volume_multiple = 0.6;
    exploratory.ema_touch_tolerance_pct = 1.5;
    exploratory.sr_distance_multiplier = 0.0;
    exploratory.min_confidence = 45.0;
    exploratory.block_on_divergence = false;
    exploratory.require_execution_agreement = false;
    exploratory.check_sr_proximity = false;
    exploratory.max_signals = max_signals;

    return {strict, balanced, relaxed, exploratory};
}

} // namespace

std::string Timeframe::label() const {
    if (minutes >= 60 && minutes % 60 == 0) {
        return fmt::format("{}h", minutes / 60);
    }
    return fmt::format("{}m", minutes);
}

int64_t StrategyConfig::cooldown_ms() const {
    return static_cast<int64_t>(cooldown_candles) * execution.minutes * 60 * 1000;
}

void StrategyConfig::validate() const {
    if (name.empty()) {
        throw ConfigurationError("strategy without a name");
    }

    auto check_tf = [this](const Timeframe& tf, const char* which) {
        if (tf.interval.empty() || tf.minutes <= 0) {
            throw ConfigurationError(fmt::format("{}: {} timeframe is incomplete", name, which));
        }
        // MACD signal line needs 26 + 9 candles
        if (tf.min_candles < 35 || tf.limit < tf.min_candles) {
            throw ConfigurationError(fmt::format(
                "{}: {} timeframe needs 35 <= min_candles <= limit", name, which));
        }
    };
    check_tf(trend, "trend");
    check_tf(execution, "execution");

    if (trend.minutes <= execution.minutes) {
        throw ConfigurationError(fmt::format(
            "{}: trend timeframe must be higher than the execution timeframe", name));
    }

    const double w[] = {weights.ema_stack, weights.vwap, weights.macd, weights.volume,
                        weights.pullback_setup, weights.breakout_setup, weights.rr_bonus,
                        weights.order_book, weights.divergence_penalty, weights.sr_penalty};
    for (double v : w) {
        if (v < 0.0) {
            throw ConfigurationError(fmt::format("{}: negative scoring weight", name));
        }
    }
    if (weights.breakout_setup > weights.pullback_setup) {
        throw ConfigurationError(fmt::format(
            "{}: breakout weight must not exceed pullback weight", name));
    }
    if (std::abs(weights.max_score() - 100.0) > 1e-6) {
        throw ConfigurationError(fmt::format(
            "{}: scoring weights sum to {:.2f}, expected 100", name, weights.max_score()));
    }
    if (!use_order_book && weights.order_book > 0.0) {
        throw ConfigurationError(fmt::format(
            "{}: order_book weight set but order book enrichment is disabled", name));
    }

    if (cooldown_candles < 0) {
        throw ConfigurationError(fmt::format("{}: cooldown_candles must be >= 0", name));
    }
    if (target_candidates <= 0 || max_signals <= 0) {
        throw ConfigurationError(fmt::format(
            "{}: target_candidates and max_signals must be > 0", name));
    }
    if (order_book_depth <= 0) {
        throw ConfigurationError(fmt::format("{}: order_book_depth must be > 0", name));
    }
    if (entry_zone_pct < 0.0 || entry_zone_pct >= 0.05) {
        throw ConfigurationError(fmt::format("{}: entry_zone_pct must be within [0, 0.05)", name));
    }
    if (rr_bonus_threshold <= 0.0) {
        throw ConfigurationError(fmt::format("{}: rr_bonus_threshold must be > 0", name));
    }
    if (breakout_lookback <= 2 || swing_lookback <= 0) {
        throw ConfigurationError(fmt::format(
            "{}: breakout_lookback must be > 2 and swing_lookback > 0", name));
    }
    if (sampling_rate <= 0.0 || sampling_rate > 1.0) {
        throw ConfigurationError(fmt::format("{}: sampling_rate must be within (0, 1]", name));
    }

    if (rsi_band.enabled) {
        auto in_range = [](double lo, double hi) { return 0.0 <= lo && lo <= hi && hi <= 100.0; };
        if (!in_range(rsi_band.long_min, rsi_band.long_max) ||
            !in_range(rsi_band.short_min, rsi_band.short_max)) {
            throw ConfigurationError(fmt::format(
                "{}: rsi_band bounds must satisfy 0 <= min <= max <= 100", name));
        }
    }

    ScanProfile::validate_sequence(profiles);
}

StrategyConfig StrategyConfig::classic_v2() {
    StrategyConfig s;
    s.name = "classic_v2";
    s.trend = Timeframe{"15", 15, 200, 50};
    s.execution = Timeframe{"5", 5, 100, 50};
    s.cooldown_candles = 5;
    s.target_candidates = 5;
    s.max_signals = 8;
    s.profiles = classic_profiles(8);
    return s;
}

StrategyConfig StrategyConfig::classic_crypto_pro_v3() {
    StrategyConfig s;
    s.name = "classic_crypto_pro_v3";
    s.trend = Timeframe{"60", 60, 200, 50};
    s.execution = Timeframe{"15", 15, 200, 50};

    s.use_order_book = true;
    s.weights.ema_stack = 20.0;
    s.weights.rr_bonus = 10.0;
    s.weights.order_book = 10.0;

    s.cooldown_candles = 24;
    s.target_candidates = 5;
    s.max_signals = 5;
    s.profiles = classic_profiles(5);
    return s;
}

StrategyConfig StrategyConfig::monster_v2() {
    StrategyConfig s;
    s.name = "monster_v2";
    s.trend = Timeframe{"60", 60, 200, 50};
    s.execution = Timeframe{"15", 15, 200, 50};
    s.cooldown_candles = 4;
    s.target_candidates = 5;
    s.max_signals = 5;

    s.profiles = classic_profiles(5);
    // Wider ATR stops on the upper tiers
    s.profiles[0].atr_stop_k = 1.2;
    s.profiles[1].atr_stop_k = 1.0;
    s.profiles[2].atr_stop_k = 0.8;

    // Longs only from a washed-out RSI, shorts only from a stretched one
    s.rsi_band.enabled = true;
    return s;
}

std::vector<std::string> StrategyConfig::preset_names() {
    return {"classic_v2", "classic_crypto_pro_v3", "monster_v2"};
}

StrategyConfig StrategyConfig::preset(const std::string& name) {
    if (name == "classic_v2") return classic_v2();
    if (name == "classic_crypto_pro_v3") return classic_crypto_pro_v3();
    if (name == "monster_v2") return monster_v2();
    throw ConfigurationError("unknown strategy preset: " + name);
}

StrategyConfig StrategyConfig::from_json(const nlohmann::json& j, const std::string& base) {
    if (!j.is_object()) {
        throw ConfigurationError("strategy document must be a JSON object");
    }

    StrategyConfig s;
    try {
        s = preset(j.value("preset", base));

        read_field(j, "name", s.name);
        if (j.contains("trend")) read_timeframe(j.at("trend"), s.trend);
        if (j.contains("execution")) read_timeframe(j.at("execution"), s.execution);
        if (j.contains("weights")) read_weights(j.at("weights"), s.weights);

        read_field(j, "cooldown_candles", s.cooldown_candles);
        read_field(j, "target_candidates", s.target_candidates);
        read_field(j, "max_signals", s.max_signals);
        read_field(j, "use_order_book", s.use_order_book);
        read_field(j, "order_book_depth", s.order_book_depth);
        read_field(j, "entry_zone_pct", s.entry_zone_pct);
        read_field(j, "rr_bonus_threshold", s.rr_bonus_threshold);
        read_field(j, "breakout_lookback", s.breakout_lookback);
        read_field(j, "swing_lookback", s.swing_lookback);
        read_field(j, "sampling_rate", s.sampling_rate);
        if (j.contains("rsi_band")) read_rsi_band(j.at("rsi_band"), s.rsi_band);

        // A profile list replaces the preset tiers; each entry overlays the
        // preset tier of the same name when there is one.
        if (j.contains("profiles")) {
            const auto& list = j.at("profiles");
            if (!list.is_array()) {
                throw ConfigurationError("profiles must be a JSON array");
            }

            std::vector<ScanProfile> profiles;
            for (const auto& item : list) {
                ScanProfile p;
                std::string pname = item.is_object() ? item.value("name", "") : "";
                for (const auto& existing : s.profiles) {
                    if (existing.name == pname) {
                        p = existing;
                        break;
                    }
                }
                ::from_json(item, p);
                profiles.push_back(p);
            }
            s.profiles = std::move(profiles);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(fmt::format("strategy document: {}", e.what()));
    }

    return s;
}

StrategyConfig StrategyConfig::from_file(const std::string& path, const std::string& base) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open strategy file: " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError(fmt::format("strategy file {}: {}", path, e.what()));
    }

    spdlog::info("Loading strategy overrides from {}", path);
    return from_json(doc, base);
}

void to_json(nlohmann::json& j, const StrategyConfig& s) {
    auto tf = [](const Timeframe& t) {
        return nlohmann::json{
            {"interval", t.interval},
            {"minutes", t.minutes},
            {"limit", t.limit},
            {"min_candles", t.min_candles}
        };
    };

    j = nlohmann::json{
        {"name", s.name},
        {"trend", tf(s.trend)},
        {"execution", tf(s.execution)},
        {"weights", {
            {"ema_stack", s.weights.ema_stack},
            {"vwap", s.weights.vwap},
            {"macd", s.weights.macd},
            {"volume", s.weights.volume},
            {"pullback_setup", s.weights.pullback_setup},
            {"breakout_setup", s.weights.breakout_setup},
            {"rr_bonus", s.weights.rr_bonus},
            {"order_book", s.weights.order_book},
            {"divergence_penalty", s.weights.divergence_penalty},
            {"sr_penalty", s.weights.sr_penalty}
        }},
        {"profiles", s.profiles},
        {"cooldown_candles", s.cooldown_candles},
        {"target_candidates", s.target_candidates},
        {"max_signals", s.max_signals},
        {"use_order_book", s.use_order_book},
        {"order_book_depth", s.order_book_depth},
        {"entry_zone_pct", s.entry_zone_pct},
        {"rr_bonus_threshold", s.rr_bonus_threshold},
        {"breakout_lookback", s.breakout_lookback},
        {"swing_lookback", s.swing_lookback},
        {"sampling_rate", s.sampling_rate},
        {"rsi_band", {
            {"enabled", s.rsi_band.enabled},
            {"long_min", s.rsi_band.long_min},
            {"long_max", s.rsi_band.long_max},
            {"short_min", s.rsi_band.short_min},
            {"short_max", s.rsi_band.short_max}
        }}
    };
}
