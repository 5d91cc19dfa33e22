#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/evaluator.hpp"
#include "fake_market_data.hpp"
#include <cmath>

using Catch::Matchers::WithinAbs;

namespace {

// BTCUSDT: 15m trend up, 5m candle wicks into EMA21 and closes above EMA9
IndicatorSnapshot btc_long() {
    IndicatorSnapshot s;
    s.trend = TimeframeState{101.5, 101.0, 100.0, 99.0};
    s.execution = TimeframeState{99.2, 99.0, 98.8, 98.6};
    s.last = Candle{1'700'000'000'000, 99.0, 99.4, 98.5, 99.2, 1400.0};
    s.vwap = indicators::VwapResult{99.0, true, false, false};
    s.macd = indicators::MacdResult{0.5, 0.3, 0.2, 1};
    s.atr = 2.0;
    s.rsi = 35.0;
    s.volume = indicators::VolumeMetrics{1400.0, 1000.0, 1.4};
    s.swing_low = 98.5;
    s.swing_high = 100.2;
    return s;
}

IndicatorSnapshot eth_short() {
    IndicatorSnapshot s;
    s.trend = TimeframeState{98.5, 99.0, 100.0, 101.0};
    s.execution = TimeframeState{100.8, 101.0, 101.2, 101.4};
    s.last = Candle{1'700'000'000'000, 101.0, 101.5, 100.6, 100.8, 1400.0};
    s.vwap = indicators::VwapResult{101.0, false, false, false};
    s.macd = indicators::MacdResult{-0.5, -0.3, -0.2, -1};
    s.atr = 2.0;
    s.rsi = 65.0;
    s.volume = indicators::VolumeMetrics{1400.0, 1000.0, 1.4};
    s.swing_low = 100.0;
    s.swing_high = 101.5;
    return s;
}

ScanProfile profile_named(const StrategyConfig& s, const std::string& name) {
    for (const auto& p : s.profiles) {
        if (p.name == name) return p;
    }
    throw std::runtime_error("no profile " + name);
}

// Execution EMAs stacked against the trend with the close under EMA21;
// only the VWAP reclaim lets it past the agreement check
IndicatorSnapshot btc_under_ema21() {
    auto s = btc_long();
    s.execution = TimeframeState{99.2, 99.0, 99.8, 100.5};
    s.vwap.reclaimed = true;
    s.swing_low = 97.0;
    return s;
}

} // namespace

TEST_CASE("Candidate evaluation on snapshots", "[evaluator]") {
    int64_t now = 1'700'000'000'000;
    FakeMarketData feed;
    CooldownTracker cooldowns([&now] { return now; });
    auto strategy = StrategyConfig::classic_v2();
    CandidateEvaluator evaluator(feed, cooldowns, strategy);

    auto strict = profile_named(strategy, "strict");

    SECTION("Pullback long accepted, stop bounded by the swing low") {
        strict.ema_touch_tolerance_pct = 1.0;
        auto out = evaluator.evaluate_snapshot("BTCUSDT", btc_long(), strict);

        REQUIRE(out.accepted());
        const auto& c = *out.candidate;
        REQUIRE(c.direction == Direction::Long);
        REQUIRE(c.setup == SetupType::PullbackEma21);
        REQUIRE_THAT(c.stop_loss, WithinAbs(98.5, 1e-9));
        REQUIRE_THAT(c.take_profit_1, WithinAbs(101.2, 1e-9));
        REQUIRE_THAT(c.take_profit_2, WithinAbs(103.2, 1e-9));
        REQUIRE_THAT(c.take_profit_3, WithinAbs(105.2, 1e-9));
        REQUIRE_THAT(c.risk_reward, WithinAbs(2.0 / 0.7, 1e-9));
        REQUIRE_THAT(c.entry_min, WithinAbs(99.2 * 0.999, 1e-9));
        REQUIRE_THAT(c.entry_max, WithinAbs(99.2 * 1.001, 1e-9));
        REQUIRE(c.score >= 60.0);
        REQUIRE(c.score == 100.0);
        REQUIRE(c.reasons.front().rfind("Profile strict", 0) == 0);
        REQUIRE(c.trend_timeframe == "15m");
        REQUIRE(c.execution_timeframe == "5m");
        REQUIRE(c.cooldown_until_ms == now + 25 * 60 * 1000);
    }

    SECTION("ATR stop leaves too little reward") {
        auto snap = btc_long();
        snap.swing_low = 95.0;
        auto out = evaluator.evaluate_snapshot("BTCUSDT", snap, strict);
        REQUIRE_FALSE(out.accepted());
        REQUIRE(out.reason == RejectReason::RiskRewardTooLow);
    }

    SECTION("Short mirror") {
        auto out = evaluator.evaluate_snapshot("ETHUSDT", eth_short(), strict);
        REQUIRE(out.accepted());
        const auto& c = *out.candidate;
        REQUIRE(c.direction == Direction::Short);
        REQUIRE_THAT(c.stop_loss, WithinAbs(101.5, 1e-9));
        REQUIRE_THAT(c.take_profit_1, WithinAbs(98.8, 1e-9));
        REQUIRE(c.take_profit_3 < c.take_profit_2);
        REQUIRE(c.levels_valid());
    }

    SECTION("No trend") {
        auto snap = btc_long();
        snap.trend.close = 100.5;
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).reason == RejectReason::NoTrend);
    }

    SECTION("Momentum against the trend") {
        auto snap = btc_long();
        snap.macd.slope = 0;
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).reason ==
                RejectReason::MomentumAgainst);
    }

    SECTION("Execution disagreement needs a VWAP reclaim") {
        auto snap = btc_long();
        snap.execution.ema9 = 98.5;
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).reason ==
                RejectReason::ExecutionDisagrees);

        auto exploratory = evaluator.evaluate_snapshot("BTCUSDT", snap,
                                                       profile_named(strategy, "exploratory"));
        REQUIRE(exploratory.accepted());
        REQUIRE(exploratory.candidate->score == 75.0);

        snap.vwap.reclaimed = true;
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).accepted());
    }

    SECTION("No entry trigger") {
        auto snap = btc_long();
        snap.last.low = 99.1;
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).reason ==
                RejectReason::NoEntryTrigger);
    }

    SECTION("Close under EMA21 is never an entry") {
        for (const auto& name : StrategyConfig::preset_names()) {
            auto preset = StrategyConfig::preset(name);
            CandidateEvaluator preset_evaluator(feed, cooldowns, preset);
            for (const auto& p : preset.profiles) {
                INFO(name << " " << p.name);
                REQUIRE(preset_evaluator.evaluate_snapshot("BTCUSDT", btc_under_ema21(), p).reason ==
                        RejectReason::NoEntryTrigger);
            }
        }
    }

    SECTION("Breakout and retest") {
        auto snap = btc_long();
        snap.last = Candle{1'700'000'000'000, 99.95, 100.4, 99.9, 100.2, 1400.0};
        snap.breakout_range = indicators::Range{99.8, 97.0, true};
        snap.swing_low = 99.5;

        auto out = evaluator.evaluate_snapshot("BTCUSDT", snap, strict);
        REQUIRE(out.accepted());
        REQUIRE(out.candidate->setup == SetupType::BreakoutRetest);
        REQUIRE(out.candidate->score == 95.0);
    }

    SECTION("Divergence blocks strict, costs points when relaxed") {
        auto snap = btc_long();
        snap.divergence = indicators::Divergence{false, true, true};
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).reason ==
                RejectReason::DivergenceAgainstTrend);

        auto relaxed = evaluator.evaluate_snapshot("BTCUSDT", snap, profile_named(strategy, "relaxed"));
        REQUIRE(relaxed.accepted());
        REQUIRE(relaxed.candidate->score == 90.0);
    }

    SECTION("Support/resistance proximity") {
        auto snap = btc_long();
        snap.pivots.resistance = {99.5};
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).reason ==
                RejectReason::NearSupportResistance);

        auto loose = evaluator.evaluate_snapshot("BTCUSDT", snap, profile_named(strategy, "exploratory"));
        REQUIRE(loose.accepted());
        REQUIRE(loose.candidate->score == 90.0);
        REQUIRE(loose.candidate->nearest_level.type == "resistance");
        REQUIRE_THAT(loose.candidate->nearest_level.distance, WithinAbs(0.3, 1e-9));
    }

    SECTION("Confidence below the profile minimum") {
        auto snap = btc_long();
        snap.vwap.above = false;
        snap.vwap.vwap = 99.5;
        snap.macd.histogram = 0.01;
        snap.swing_low = 98.0;

        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).reason ==
                RejectReason::LowConfidence);

        auto balanced = evaluator.evaluate_snapshot("BTCUSDT", snap, profile_named(strategy, "balanced"));
        REQUIRE(balanced.accepted());
        REQUIRE(balanced.candidate->score == 55.0);
    }

    SECTION("Missing ATR is insufficient history") {
        auto snap = btc_long();
        snap.atr = 0.0;
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).reason ==
                RejectReason::InsufficientHistory);
    }
}

TEST_CASE("Relaxation is monotonic", "[evaluator]") {
    std::vector<IndicatorSnapshot> snapshots;
    snapshots.push_back(btc_long());
    snapshots.push_back(eth_short());
    {
        auto s = btc_long();
        s.divergence = indicators::Divergence{false, true, true};
        snapshots.push_back(s);
    }
    {
        auto s = btc_long();
        s.pivots.support = {98.9};
        snapshots.push_back(s);
    }
    {
        auto s = btc_long();
        s.execution.ema9 = 98.5;
        snapshots.push_back(s);
    }
    {
        auto s = btc_long();
        s.volume = indicators::VolumeMetrics{900.0, 1000.0, 0.2};
        s.swing_low = 97.9;
        snapshots.push_back(s);
    }
    {
        auto s = btc_long();
        s.last.low = 98.7;
        snapshots.push_back(s);
    }
    snapshots.push_back(btc_under_ema21());

    FakeMarketData feed;
    CooldownTracker cooldowns([] { return int64_t{0}; });

    for (const auto& name : StrategyConfig::preset_names()) {
        auto strategy = StrategyConfig::preset(name);
        CandidateEvaluator evaluator(feed, cooldowns, strategy);

        for (size_t n = 0; n < snapshots.size(); ++n) {
            for (size_t i = 0; i + 1 < strategy.profiles.size(); ++i) {
                const auto& stricter = strategy.profiles[i];
                const auto& looser = strategy.profiles[i + 1];

                auto a = evaluator.evaluate_snapshot("SYM", snapshots[n], stricter);
                auto b = evaluator.evaluate_snapshot("SYM", snapshots[n], looser);
                INFO(name << " snapshot " << n << " " << stricter.name << " -> " << looser.name);
                if (a.accepted()) {
                    REQUIRE(b.accepted());
                }

                for (const auto* out : {&a, &b}) {
                    if (!out->accepted()) continue;
                    const auto& c = *out->candidate;
                    const auto& p = out == &a ? stricter : looser;
                    REQUIRE(std::abs(c.take_profit_1 - c.entry) / std::abs(c.entry - c.stop_loss) >=
                            p.min_rr - 1e-12);
                    REQUIRE(c.score >= 0.0);
                    REQUIRE(c.score <= 100.0);
                    REQUIRE(c.score >= p.min_confidence);
                }
            }
        }
    }
}

TEST_CASE("RSI band gate", "[evaluator]") {
    FakeMarketData feed;
    CooldownTracker cooldowns([] { return int64_t{0}; });

    auto monster = StrategyConfig::monster_v2();
    CandidateEvaluator evaluator(feed, cooldowns, monster);
    const auto& strict = monster.profiles.front();

    SECTION("Long inside the band, edges included") {
        auto snap = btc_long();
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).accepted());
        snap.rsi = 40.0;
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).accepted());
        snap.rsi = 25.0;
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).accepted());
    }

    SECTION("Long outside the band") {
        auto snap = btc_long();
        snap.rsi = 45.0;
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, strict).reason ==
                RejectReason::RsiOutOfBand);
        snap.rsi = 20.0;
        REQUIRE(evaluator.evaluate_snapshot("BTCUSDT", snap, monster.profiles.back()).reason ==
                RejectReason::RsiOutOfBand);
    }

    SECTION("Short band mirrors") {
        auto snap = eth_short();
        REQUIRE(evaluator.evaluate_snapshot("ETHUSDT", snap, strict).accepted());
        snap.rsi = 55.0;
        REQUIRE(evaluator.evaluate_snapshot("ETHUSDT", snap, strict).reason ==
                RejectReason::RsiOutOfBand);
        snap.rsi = 80.0;
        REQUIRE(evaluator.evaluate_snapshot("ETHUSDT", snap, strict).reason ==
                RejectReason::RsiOutOfBand);
    }

    SECTION("Classic strategies do not gate on RSI") {
        auto classic = StrategyConfig::classic_v2();
        CandidateEvaluator classic_evaluator(feed, cooldowns, classic);
        auto snap = btc_long();
        snap.rsi = 45.0;
        REQUIRE(classic_evaluator.evaluate_snapshot("BTCUSDT", snap, classic.profiles.front()).accepted());
    }
}

TEST_CASE("Candidate evaluation against feeds", "[evaluator]") {
    int64_t now = 1'700'000'000'000;
    FakeMarketData feed;
    CooldownTracker cooldowns([&now] { return now; });
    auto strategy = StrategyConfig::classic_v2();
    CandidateEvaluator evaluator(feed, cooldowns, strategy);
    auto strict = strategy.profiles.front();
    SeriesCache cache;

    feed.set_series("GOODUSDT", "15", fixtures::uptrend(60, 100.0, 0.05, 15));
    feed.set_series("GOODUSDT", "5", fixtures::pullback(60, 50.0, 5));
    feed.set_series("FLATUSDT", "15", fixtures::flat(60, 20.0, 15));
    feed.set_series("FLATUSDT", "5", fixtures::flat(60, 20.0, 5));
    feed.set_series("NEWUSDT", "15", fixtures::uptrend(30, 10.0, 0.05, 15));

    SECTION("Pullback found through the indicator pipeline") {
        auto out = evaluator.evaluate("GOODUSDT", strict, cache);
        REQUIRE(out.accepted());
        REQUIRE(out.candidate->setup == SetupType::PullbackEma21);
        REQUIRE(out.candidate->direction == Direction::Long);
        REQUIRE(out.candidate->score >= strict.min_confidence);
        REQUIRE(out.candidate->risk_reward >= strict.min_rr);
        REQUIRE(feed.klines_requested("GOODUSDT") == 2);

        // Second profile reuses the cached series
        evaluator.evaluate("GOODUSDT", strategy.profiles[1], cache);
        REQUIRE(feed.klines_requested("GOODUSDT") == 2);
    }

    SECTION("No trend skips the execution fetch") {
        auto out = evaluator.evaluate("FLATUSDT", strict, cache);
        REQUIRE(out.reason == RejectReason::NoTrend);
        REQUIRE(feed.klines_requested("FLATUSDT") == 1);
    }

    SECTION("Cooldown short-circuits before any fetch") {
        cooldowns.record("GOODUSDT", strategy.name, now + strategy.cooldown_ms());
        auto out = evaluator.evaluate("GOODUSDT", strict, cache);
        REQUIRE(out.reason == RejectReason::Cooldown);
        REQUIRE(feed.klines_requested("GOODUSDT") == 0);
    }

    SECTION("Short history") {
        REQUIRE(evaluator.evaluate("NEWUSDT", strict, cache).reason ==
                RejectReason::InsufficientHistory);
    }

    SECTION("Unknown symbol") {
        REQUIRE(evaluator.evaluate("GONEUSDT", strict, cache).reason ==
                RejectReason::DataUnavailable);
    }
}
