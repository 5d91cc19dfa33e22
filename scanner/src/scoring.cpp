#include "scoring.hpp"
#include <fmt/format.h>
#include <algorithm>

ConfidenceScorer::ConfidenceScorer(const ScoringWeights& weights, double rr_bonus_threshold)
    : weights_(weights)
    , rr_bonus_threshold_(rr_bonus_threshold) {}

ConfidenceResult ConfidenceScorer::compute_confidence(const ScoreInputs& inputs) const {
    ConfidenceResult result;
    auto& reasons = result.reasons;

    if (inputs.ema_stack) {
        result.raw_score += weights_.ema_stack;
        reasons.push_back(fmt::format("EMA 9/14/21 stack aligned (+{:.0f})", weights_.ema_stack));
    }

    if (inputs.vwap_condition) {
        result.raw_score += weights_.vwap;
        reasons.push_back(fmt::format("VWAP confirms direction (+{:.0f})", weights_.vwap));
    }

    if (inputs.macd_confirmed) {
        result.raw_score += weights_.macd;
        reasons.push_back(fmt::format("MACD momentum confirmed (+{:.0f})", weights_.macd));
    }

    if (inputs.volume_condition) {
        result.raw_score += weights_.volume;
        reasons.push_back(fmt::format("Volume above threshold (+{:.0f})", weights_.volume));
    }

    if (inputs.setup == SetupType::PullbackEma21) {
        result.raw_score += weights_.pullback_setup;
        reasons.push_back(fmt::format("Pullback to EMA21 (+{:.0f})", weights_.pullback_setup));
    } else {
        result.raw_score += weights_.breakout_setup;
        reasons.push_back(fmt::format("Breakout and retest (+{:.0f})", weights_.breakout_setup));
    }

    if (inputs.risk_reward >= rr_bonus_threshold_) {
        result.raw_score += weights_.rr_bonus;
        reasons.push_back(fmt::format("R/R {:.2f} >= {:.1f} (+{:.0f})",
                                      inputs.risk_reward, rr_bonus_threshold_, weights_.rr_bonus));
    }

    if (weights_.order_book > 0.0) {
        double contribution = weights_.order_book * std::clamp(inputs.order_book_score, 0.0, 1.0);
        result.raw_score += contribution;
        reasons.push_back(fmt::format("Order book score {:.2f} (+{:.1f})",
                                      inputs.order_book_score, contribution));
    }

    result.penalties = compute_penalties(inputs, reasons);
    result.final_score = std::clamp(result.raw_score - result.penalties, 0.0, 100.0);

    return result;
}

double ConfidenceScorer::compute_penalties(const ScoreInputs& inputs,
                                           std::vector<std::string>& reasons) const {
    double penalties = 0.0;

    if (inputs.divergence_against) {
        penalties += weights_.divergence_penalty;
        reasons.push_back(fmt::format("Divergence against trend (-{:.0f})",
                                      weights_.divergence_penalty));
    }

    if (inputs.near_support_resistance) {
        penalties += weights_.sr_penalty;
        reasons.push_back(fmt::format("Close to support/resistance (-{:.0f})",
                                      weights_.sr_penalty));
    }

    return penalties;
}
