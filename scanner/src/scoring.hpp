#pragma once

#include "candle.hpp"
#include "strategy.hpp"
#include <string>
#include <vector>

// Confirmation flags gathered by the evaluator for one candidate
struct ScoreInputs {
    bool ema_stack = false;
    bool vwap_condition = false;
    bool macd_confirmed = false;
    bool volume_condition = false;
    SetupType setup = SetupType::PullbackEma21;
    double risk_reward = 0.0;
    double order_book_score = 0.5;

    bool divergence_against = false;
    bool near_support_resistance = false;
};

struct ConfidenceResult {
    double raw_score = 0.0;       // sum of bonuses
    double penalties = 0.0;
    double final_score = 0.0;     // clamp(raw - penalties, 0, 100)
    std::vector<std::string> reasons;
};

class ConfidenceScorer {
public:
    explicit ConfidenceScorer(const ScoringWeights& weights = ScoringWeights(),
                              double rr_bonus_threshold = 2.0);

    ConfidenceResult compute_confidence(const ScoreInputs& inputs) const;

    const ScoringWeights& weights() const { return weights_; }

private:
    ScoringWeights weights_;
    double rr_bonus_threshold_;

    double compute_penalties(const ScoreInputs& inputs, std::vector<std::string>& reasons) const;
};
