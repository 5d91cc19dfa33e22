#include "scan_profile.hpp"
#include <fmt/format.h>

namespace {

void require(bool condition, const std::string& profile, const char* message) {
    if (!condition) {
        throw ConfigurationError(fmt::format("scan profile '{}': {}", profile, message));
    }
}

// `later` may only be looser than `earlier`
void require_looser(bool ok, const ScanProfile& earlier, const ScanProfile& later,
                    const char* field) {
    if (!ok) {
        throw ConfigurationError(fmt::format(
            "scan profile '{}' is stricter than '{}' on {}", later.name, earlier.name, field));
    }
}

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

void ScanProfile::validate() const {
    if (name.empty()) {
        throw ConfigurationError("scan profile without a name");
    }

    require(min_turnover >= 0.0, name, "min_turnover must be >= 0");
    require(top_volume_count > 0, name, "top_volume_count must be > 0");
    require(min_rr > 0.0, name, "min_rr must be > 0");
    require(atr_stop_k > 0.0, name, "atr_stop_k must be > 0");
    require(min_volume_multiple >= 0.0, name, "min_volume_multiple must be >= 0");
    require(pullback_volume_multiple >= 0.0, name, "pullback_volume_multiple must be >= 0");
    require(ema_touch_tolerance_pct >= 0.0, name, "ema_touch_tolerance_pct must be >= 0");
    require(sr_distance_multiplier >= 0.0, name, "sr_distance_multiplier must be >= 0");
    require(min_confidence >= 0.0 && min_confidence <= 100.0, name,
            "min_confidence must be within [0, 100]");
    require(max_signals > 0, name, "max_signals must be > 0");

    // Pullback volume threshold is the looser of the two
    require(pullback_volume_zscore <= min_volume_zscore, name,
            "pullback_volume_zscore must not exceed min_volume_zscore");
    require(pullback_volume_multiple <= min_volume_multiple, name,
            "pullback_volume_multiple must not exceed min_volume_multiple");
}

void ScanProfile::validate_sequence(const std::vector<ScanProfile>& profiles) {
    if (profiles.empty()) {
        throw ConfigurationError("at least one scan profile is required");
    }

    for (const auto& p : profiles) {
        p.validate();
    }

    for (size_t i = 1; i < profiles.size(); ++i) {
        const auto& a = profiles[i - 1];
        const auto& b = profiles[i];

        require_looser(b.min_turnover <= a.min_turnover, a, b, "min_turnover");
        require_looser(b.top_volume_count >= a.top_volume_count, a, b, "top_volume_count");
        require_looser(b.min_rr <= a.min_rr, a, b, "min_rr");
        require_looser(b.atr_stop_k <= a.atr_stop_k, a, b, "atr_stop_k");
        require_looser(b.min_volume_zscore <= a.min_volume_zscore, a, b, "min_volume_zscore");
        require_looser(b.min_volume_multiple <= a.min_volume_multiple, a, b,
                       "min_volume_multiple");
        require_looser(b.pullback_volume_zscore <= a.pullback_volume_zscore, a, b,
                       "pullback_volume_zscore");
        require_looser(b.pullback_volume_multiple <= a.pullback_volume_multiple, a, b,
                       "pullback_volume_multiple");
        require_looser(b.ema_touch_tolerance_pct >= a.ema_touch_tolerance_pct, a, b,
                       "ema_touch_tolerance_pct");
        require_looser(b.sr_distance_multiplier <= a.sr_distance_multiplier, a, b,
                       "sr_distance_multiplier");
        require_looser(b.min_confidence <= a.min_confidence, a, b, "min_confidence");
        require_looser(a.block_on_divergence || !b.block_on_divergence, a, b,
                       "block_on_divergence");
        require_looser(a.require_execution_agreement || !b.require_execution_agreement, a, b,
                       "require_execution_agreement");
        require_looser(a.check_sr_proximity || !b.check_sr_proximity, a, b,
                       "check_sr_proximity");
    }
}

void to_json(nlohmann::json& j, const ScanProfile& p) {
    j = nlohmann::json{
        {"name", p.name},
        {"min_turnover", p.min_turnover},
        {"top_volume_count", p.top_volume_count},
        {"min_rr", p.min_rr},
        {"atr_stop_k", p.atr_stop_k},
        {"min_volume_zscore", p.min_volume_zscore},
        {"min_volume_multiple", p.min_volume_multiple},
        {"pullback_volume_zscore", p.pullback_volume_zscore},
        {"pullback_volume_multiple", p.pullback_volume_multiple},
        {"ema_touch_tolerance_pct", p.ema_touch_tolerance_pct},
        {"sr_distance_multiplier", p.sr_distance_multiplier},
        {"min_confidence", p.min_confidence},
        {"block_on_divergence", p.block_on_divergence},
        {"require_execution_agreement", p.require_execution_agreement},
        {"check_sr_proximity", p.check_sr_proximity},
        {"max_signals", p.max_signals}
    };
}

void from_json(const nlohmann::json& j, ScanProfile& p) {
    if (!j.is_object()) {
        throw ConfigurationError("scan profile must be a JSON object");
    }

    try {
        read_field(j, "name", p.name);
        read_field(j, "min_turnover", p.min_turnover);
        read_field(j, "top_volume_count", p.top_volume_count);
        read_field(j, "min_rr", p.min_rr);
        read_field(j, "atr_stop_k", p.atr_stop_k);
        read_field(j, "min_volume_zscore", p.min_volume_zscore);
        read_field(j, "min_volume_multiple", p.min_volume_multiple);
        read_field(j, "pullback_volume_zscore", p.pullback_volume_zscore);
        read_field(j, "pullback_volume_multiple", p.pullback_volume_multiple);
        read_field(j, "ema_touch_tolerance_pct", p.ema_touch_tolerance_pct);
        read_field(j, "sr_distance_multiplier", p.sr_distance_multiplier);
        read_field(j, "min_confidence", p.min_confidence);
        read_field(j, "block_on_divergence", p.block_on_divergence);
        read_field(j, "require_execution_agreement", p.require_execution_agreement);
        read_field(j, "check_sr_proximity", p.check_sr_proximity);
        read_field(j, "max_signals", p.max_signals);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(fmt::format("scan profile '{}': {}", p.name, e.what()));
    }
}
