#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/scoring.hpp"

using Catch::Matchers::WithinAbs;

namespace {

ScoreInputs everything_aligned() {
    ScoreInputs in;
    in.ema_stack = true;
    in.vwap_condition = true;
    in.macd_confirmed = true;
    in.volume_condition = true;
    in.setup = SetupType::PullbackEma21;
    in.risk_reward = 2.5;
    return in;
}

} // namespace

TEST_CASE("Confidence scoring", "[scoring]") {
    ConfidenceScorer scorer;

    SECTION("Every confirmation on a pullback scores the maximum") {
        auto result = scorer.compute_confidence(everything_aligned());
        REQUIRE(result.final_score == 100.0);
        REQUIRE(result.penalties == 0.0);
        REQUIRE(result.reasons.size() == 6);
    }

    SECTION("Breakout setup is worth less than a pullback") {
        auto in = everything_aligned();
        in.setup = SetupType::BreakoutRetest;
        REQUIRE(scorer.compute_confidence(in).final_score == 95.0);
    }

    SECTION("R/R bonus starts at the threshold") {
        auto in = everything_aligned();
        in.risk_reward = 1.99;
        REQUIRE(scorer.compute_confidence(in).final_score == 85.0);
        in.risk_reward = 2.0;
        REQUIRE(scorer.compute_confidence(in).final_score == 100.0);
    }

    SECTION("Penalties are itemized and the score never drops below zero") {
        auto in = everything_aligned();
        in.divergence_against = true;
        in.near_support_resistance = true;
        auto result = scorer.compute_confidence(in);
        REQUIRE(result.penalties == 20.0);
        REQUIRE(result.final_score == 80.0);
        REQUIRE(result.reasons.back().find("support/resistance") != std::string::npos);

        ScoreInputs bare;
        bare.setup = SetupType::BreakoutRetest;
        bare.divergence_against = true;
        bare.near_support_resistance = true;
        REQUIRE(scorer.compute_confidence(bare).final_score == 0.0);
    }

    SECTION("Order book contribution scales with the micro-score") {
        auto pro = StrategyConfig::classic_crypto_pro_v3();
        ConfidenceScorer pro_scorer(pro.weights, pro.rr_bonus_threshold);

        auto in = everything_aligned();
        in.order_book_score = 1.0;
        REQUIRE_THAT(pro_scorer.compute_confidence(in).final_score, WithinAbs(100.0, 1e-9));

        in.order_book_score = 0.5;
        REQUIRE_THAT(pro_scorer.compute_confidence(in).final_score, WithinAbs(95.0, 1e-9));
    }
}
