#pragma once

#include "candle.hpp"
#include "cooldown.hpp"
#include "market_data.hpp"
#include "scan_profile.hpp"
#include "scoring.hpp"
#include "series_cache.hpp"
#include "signal.hpp"
#include "strategy.hpp"
#include <optional>
#include <string>

enum class RejectReason {
    None,
    Cooldown,
    DataUnavailable,
    InsufficientHistory,
    NoTrend,
    RsiOutOfBand,
    ExecutionDisagrees,
    MomentumAgainst,
    NoEntryTrigger,
    DivergenceAgainstTrend,
    NearSupportResistance,
    RiskRewardTooLow,
    LowConfidence,
    InvalidLevels
};

const char* to_string(RejectReason reason);

struct EvaluationOutcome {
    std::optional<SignalCandidate> candidate;
    RejectReason reason = RejectReason::None;

    bool accepted() const { return candidate.has_value(); }

    static EvaluationOutcome reject(RejectReason r) {
        EvaluationOutcome o;
        o.reason = r;
        return o;
    }
};

// Runs the screening pipeline for one symbol under one profile:
// cooldown, trend, RSI band, execution agreement, momentum, entry trigger,
// divergence, S/R proximity, risk/reward and confidence.
class CandidateEvaluator {
public:
    CandidateEvaluator(MarketDataProvider& provider,
                       CooldownTracker& cooldowns,
                       const StrategyConfig& strategy);

    // Fetches through `cache`; the cooldown gate runs before any fetch
    EvaluationOutcome evaluate(const std::string& symbol,
                               const ScanProfile& profile,
                               SeriesCache& cache) const;

    // Pure decision on precomputed indicators
    EvaluationOutcome evaluate_snapshot(const std::string& symbol,
                                        const IndicatorSnapshot& snapshot,
                                        const ScanProfile& profile) const;

    static std::optional<IndicatorSnapshot> build_snapshot(
        const KlineSeries& trend,
        const KlineSeries& execution,
        const StrategyConfig& strategy,
        const std::optional<OrderBook>& book = std::nullopt);

    static TimeframeState timeframe_state(const KlineSeries& series);

    // EMA stack plus close on the EMA9 side; nullopt when there is no trend
    static std::optional<Direction> trend_direction(const TimeframeState& trend);

    const StrategyConfig& strategy() const { return strategy_; }

private:
    MarketDataProvider& provider_;
    CooldownTracker& cooldowns_;
    StrategyConfig strategy_;
    ConfidenceScorer scorer_;
};
