#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Raised for malformed strategy/profile parameters and service settings.
// Fatal at startup.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

// Named screening thresholds for one tier of the scan. Tiers run strict to
// relaxed; a later tier must never be stricter than an earlier one.
struct ScanProfile {
    std::string name = "balanced";

    // Universe selection
    double min_turnover = 5'000'000.0;   // 24h quote turnover
    int top_volume_count = 60;

    // Risk
    double min_rr = 1.4;
    double atr_stop_k = 0.8;             // stop = EMA21 -/+ k * ATR

    // Volume thresholds: breakout (stricter) and pullback (looser)
    double min_volume_zscore = 0.8;
    double min_volume_multiple = 1.1;
    double pullback_volume_zscore = 0.3;
    double pullback_volume_multiple = 0.9;

    double ema_touch_tolerance_pct = 0.5;
    double sr_distance_multiplier = 0.4;
    double min_confidence = 55.0;

    bool block_on_divergence = true;
    bool require_execution_agreement = true;
    bool check_sr_proximity = true;

    int max_signals = 8;

    // Throws ConfigurationError
    void validate() const;

    // Checks each profile and that rejection thresholds only loosen along
    // the sequence.
    static void validate_sequence(const std::vector<ScanProfile>& profiles);
};

void to_json(nlohmann::json& j, const ScanProfile& p);

// Overlays the fields present in `j` onto `p`
void from_json(const nlohmann::json& j, ScanProfile& p);
