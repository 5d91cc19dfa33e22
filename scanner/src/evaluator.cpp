#include "evaluator.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

const char* to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "none";
        case RejectReason::Cooldown: return "cooldown";
        case RejectReason::DataUnavailable: return "data_unavailable";
        case RejectReason::InsufficientHistory: return "insufficient_history";
        case RejectReason::NoTrend: return "no_trend";
        case RejectReason::RsiOutOfBand: return "rsi_out_of_band";
        case RejectReason::ExecutionDisagrees: return "execution_disagrees";
        case RejectReason::MomentumAgainst: return "momentum_against";
        case RejectReason::NoEntryTrigger: return "no_entry_trigger";
        case RejectReason::DivergenceAgainstTrend: return "divergence_against_trend";
        case RejectReason::NearSupportResistance: return "near_support_resistance";
        case RejectReason::RiskRewardTooLow: return "risk_reward_too_low";
        case RejectReason::LowConfidence: return "low_confidence";
        case RejectReason::InvalidLevels: return "invalid_levels";
    }
    return "unknown";
}

CandidateEvaluator::CandidateEvaluator(MarketDataProvider& provider,
                                       CooldownTracker& cooldowns,
                                       const StrategyConfig& strategy)
    : provider_(provider)
    , cooldowns_(cooldowns)
    , strategy_(strategy)
    , scorer_(strategy.weights, strategy.rr_bonus_threshold) {}

TimeframeState CandidateEvaluator::timeframe_state(const KlineSeries& series) {
    TimeframeState state;
    if (series.empty()) return state;

    auto closes = closes_of(series);
    state.close = series.back().close;
    state.ema9 = indicators::ema(closes, 9);
    state.ema14 = indicators::ema(closes, 14);
    state.ema21 = indicators::ema(closes, 21);
    return state;
}

std::optional<Direction> CandidateEvaluator::trend_direction(const TimeframeState& trend) {
    if (indicators::ema_stack(trend.ema9, trend.ema14, trend.ema21, Direction::Long) &&
        trend.close > trend.ema9) {
        return Direction::Long;
    }
    if (indicators::ema_stack(trend.ema9, trend.ema14, trend.ema21, Direction::Short) &&
        trend.close < trend.ema9) {
        return Direction::Short;
    }
    return std::nullopt;
}

std::optional<IndicatorSnapshot> CandidateEvaluator::build_snapshot(
    const KlineSeries& trend,
    const KlineSeries& execution,
    const StrategyConfig& strategy,
    const std::optional<OrderBook>& book) {

    if (trend.size() < static_cast<size_t>(strategy.trend.min_candles) ||
        execution.size() < static_cast<size_t>(strategy.execution.min_candles)) {
        return std::nullopt;
    }

    IndicatorSnapshot snap;
    snap.trend = timeframe_state(trend);
    snap.execution = timeframe_state(execution);
    snap.last = execution.back();

    auto closes = closes_of(execution);
    snap.vwap = indicators::vwap(execution, 20);
    snap.macd = indicators::macd(closes);
    snap.atr = indicators::atr(execution, 14);
    snap.rsi = indicators::rsi(closes, 14);
    snap.volume = indicators::volume_metrics(volumes_of(execution), 20);
    snap.pivots = indicators::pivots(execution);
    snap.divergence = indicators::divergence(closes, indicators::macd_line(closes), 20);

    snap.breakout_range = indicators::recent_range(
        execution, static_cast<size_t>(strategy.breakout_lookback), 2);
    snap.swing_low = indicators::swing_low(execution, static_cast<size_t>(strategy.swing_lookback));
    snap.swing_high = indicators::swing_high(execution, static_cast<size_t>(strategy.swing_lookback));

    if (strategy.use_order_book) {
        snap.order_book = OrderBookScorer::analyze(book, static_cast<size_t>(strategy.order_book_depth));
    }

    return snap;
}

EvaluationOutcome CandidateEvaluator::evaluate(const std::string& symbol,
                                               const ScanProfile& profile,
                                               SeriesCache& cache) const {
    if (cooldowns_.is_cooling_down(symbol, strategy_.name)) {
        spdlog::debug("{} [{}] skipped: cooldown active", symbol, profile.name);
        return EvaluationOutcome::reject(RejectReason::Cooldown);
    }

    auto trend = cache.klines(provider_, symbol, strategy_.trend);
    if (!trend) return EvaluationOutcome::reject(RejectReason::DataUnavailable);
    if (trend->size() < static_cast<size_t>(strategy_.trend.min_candles)) {
        spdlog::debug("{} [{}] rejected: {} trend candles, need {}", symbol, profile.name,
                      trend->size(), strategy_.trend.min_candles);
        return EvaluationOutcome::reject(RejectReason::InsufficientHistory);
    }

    // No trend means the execution series is never requested
    if (!trend_direction(timeframe_state(*trend))) {
        spdlog::debug("{} [{}] rejected: no trend on {}", symbol, profile.name,
                      strategy_.trend.label());
        return EvaluationOutcome::reject(RejectReason::NoTrend);
    }

    auto execution = cache.klines(provider_, symbol, strategy_.execution);
    if (!execution) return EvaluationOutcome::reject(RejectReason::DataUnavailable);

    std::optional<OrderBook> book;
    if (strategy_.use_order_book) {
        book = cache.order_book(provider_, symbol, strategy_.order_book_depth);
    }

    auto snapshot = build_snapshot(*trend, *execution, strategy_, book);
    if (!snapshot) {
        spdlog::debug("{} [{}] rejected: {} execution candles, need {}", symbol, profile.name,
                      execution->size(), strategy_.execution.min_candles);
        return EvaluationOutcome::reject(RejectReason::InsufficientHistory);
    }

    return evaluate_snapshot(symbol, *snapshot, profile);
}

EvaluationOutcome CandidateEvaluator::evaluate_snapshot(const std::string& symbol,
                                                        const IndicatorSnapshot& snap,
                                                        const ScanProfile& profile) const {
    auto reject = [&](RejectReason reason) {
        spdlog::debug("{} [{}] rejected: {}", symbol, profile.name, to_string(reason));
        return EvaluationOutcome::reject(reason);
    };

    if (snap.atr <= 0.0 || snap.last.close <= 0.0) {
        return reject(RejectReason::InsufficientHistory);
    }

    // Trend filter
    auto direction = trend_direction(snap.trend);
    if (!direction) return reject(RejectReason::NoTrend);
    const bool is_long = *direction == Direction::Long;

    if (strategy_.rsi_band.enabled && !strategy_.rsi_band.allows(*direction, snap.rsi)) {
        spdlog::debug("{} [{}] RSI {:.1f} outside the {} band", symbol, profile.name,
                      snap.rsi, to_string(*direction));
        return reject(RejectReason::RsiOutOfBand);
    }

    // Execution agreement, VWAP reclaim/reject may stand in
    const auto& ex = snap.execution;
    const bool exec_stack = indicators::ema_stack(ex.ema9, ex.ema14, ex.ema21, *direction);
    if (!exec_stack && profile.require_execution_agreement) {
        bool vwap_substitute = is_long ? snap.vwap.reclaimed : snap.vwap.rejected;
        if (!vwap_substitute) return reject(RejectReason::ExecutionDisagrees);
    }

    // Momentum
    const bool momentum = is_long ? snap.macd.slope > 0 : snap.macd.slope < 0;
    if (!momentum) return reject(RejectReason::MomentumAgainst);

    // Entry trigger
    const double close = snap.last.close;
    const double tol = profile.ema_touch_tolerance_pct / 100.0;
    const auto& vol = snap.volume;

    const bool volume_condition = vol.zscore >= profile.min_volume_zscore ||
                                  vol.current >= vol.sma20 * profile.min_volume_multiple;
    const bool pullback_volume = vol.zscore >= profile.pullback_volume_zscore ||
                                 vol.current >= vol.sma20 * profile.pullback_volume_multiple;

    // Close on the trend side of EMA21, otherwise the ATR stop can cross the entry
    const bool beyond_ema21 = is_long ? close > ex.ema21 : close < ex.ema21;
    if (!beyond_ema21) return reject(RejectReason::NoEntryTrigger);

    std::optional<SetupType> setup;

    const bool touches_ema21 = is_long ? snap.last.low <= ex.ema21 * (1.0 + tol)
                                       : snap.last.high >= ex.ema21 * (1.0 - tol);
    const bool closes_with_trend = is_long ? close > ex.ema9 : close < ex.ema9;
    if (touches_ema21 && closes_with_trend && pullback_volume) {
        setup = SetupType::PullbackEma21;
    } else if (snap.breakout_range.valid && volume_condition) {
        const auto& range = snap.breakout_range;
        bool broke = is_long ? close > range.high : close < range.low;
        bool retest = is_long ? snap.last.low <= range.high * (1.0 + tol)
                              : snap.last.high >= range.low * (1.0 - tol);
        if (broke && retest) {
            setup = SetupType::BreakoutRetest;
        }
    }
    if (!setup) return reject(RejectReason::NoEntryTrigger);

    // Divergence
    const bool divergence_against = snap.divergence.confirmed &&
                                    (is_long ? snap.divergence.bearish : snap.divergence.bullish);
    if (divergence_against && profile.block_on_divergence) {
        return reject(RejectReason::DivergenceAgainstTrend);
    }

    // Support/resistance proximity
    const double min_sr_distance = snap.atr * profile.atr_stop_k * profile.sr_distance_multiplier;
    auto proximity = indicators::sr_proximity(close, snap.pivots, min_sr_distance);
    if (profile.check_sr_proximity && proximity.too_close) {
        return reject(RejectReason::NearSupportResistance);
    }

    // Stop: tighter of the swing extreme and EMA21 -/+ k * ATR
    const double atr_stop = is_long ? ex.ema21 - profile.atr_stop_k * snap.atr
                                    : ex.ema21 + profile.atr_stop_k * snap.atr;
    double stop = atr_stop;
    if (is_long && snap.swing_low < close) {
        stop = std::max(atr_stop, snap.swing_low);
    } else if (!is_long && snap.swing_high > close) {
        stop = std::min(atr_stop, snap.swing_high);
    }

    const double risk = is_long ? close - stop : stop - close;
    if (risk <= 0.0) return reject(RejectReason::InvalidLevels);

    const double side = is_long ? 1.0 : -1.0;
    const double tp1 = close + side * snap.atr;
    const double tp2 = close + side * 2.0 * snap.atr;
    const double tp3 = close + side * 3.0 * snap.atr;
    const double rr = std::abs(tp1 - close) / risk;

    if (rr < profile.min_rr) {
        spdlog::debug("{} [{}] R/R {:.2f} below {:.2f}", symbol, profile.name, rr, profile.min_rr);
        return reject(RejectReason::RiskRewardTooLow);
    }

    // Confidence
    ScoreInputs inputs;
    inputs.ema_stack = exec_stack;
    inputs.vwap_condition = is_long ? (snap.vwap.above || snap.vwap.reclaimed)
                                    : (snap.vwap.vwap > 0.0 && (!snap.vwap.above || snap.vwap.rejected));
    inputs.macd_confirmed = std::abs(snap.macd.histogram) > 0.1 * std::abs(snap.macd.value);
    inputs.volume_condition = volume_condition;
    inputs.setup = *setup;
    inputs.risk_reward = rr;
    inputs.order_book_score = snap.order_book.score;
    inputs.divergence_against = divergence_against;
    inputs.near_support_resistance = proximity.has_level && proximity.distance < snap.atr;

    auto confidence = scorer_.compute_confidence(inputs);
    if (confidence.final_score < profile.min_confidence) {
        spdlog::debug("{} [{}] score {:.1f} below {:.1f}", symbol, profile.name,
                      confidence.final_score, profile.min_confidence);
        return reject(RejectReason::LowConfidence);
    }

    SignalCandidate c;
    c.symbol = symbol;
    c.strategy = strategy_.name;
    c.profile = profile.name;
    c.direction = *direction;
    c.trend_timeframe = strategy_.trend.label();
    c.execution_timeframe = strategy_.execution.label();

    c.entry = close;
    c.entry_min = close * (1.0 - strategy_.entry_zone_pct);
    c.entry_max = close * (1.0 + strategy_.entry_zone_pct);
    c.stop_loss = stop;
    c.take_profit_1 = tp1;
    c.take_profit_2 = tp2;
    c.take_profit_3 = tp3;
    c.risk_reward = rr;
    c.rr_min = profile.min_rr;

    c.setup = *setup;
    c.score = confidence.final_score;
    c.reasons.reserve(confidence.reasons.size() + 1);
    c.reasons.push_back(fmt::format("Profile {} ({} {})", profile.name, to_string(*direction),
                                    to_string(*setup)));
    for (auto& r : confidence.reasons) c.reasons.push_back(std::move(r));

    c.cooldown_until_ms = cooldowns_.now_ms() + strategy_.cooldown_ms();
    c.snapshot = snap;
    if (proximity.has_level) {
        c.nearest_level.type = proximity.nearest_level >= close ? "resistance" : "support";
        c.nearest_level.price = proximity.nearest_level;
        c.nearest_level.distance = proximity.distance;
    }

    if (!c.levels_valid()) return reject(RejectReason::InvalidLevels);

    return EvaluationOutcome{std::move(c), RejectReason::None};
}
