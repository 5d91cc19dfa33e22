#include <catch2/catch_test_macros.hpp>
#include "../src/strategy.hpp"

TEST_CASE("Strategy presets", "[strategy]") {
    for (const auto& name : StrategyConfig::preset_names()) {
        SECTION(name) {
            auto s = StrategyConfig::preset(name);
            REQUIRE(s.name == name);
            REQUIRE_NOTHROW(s.validate());
            REQUIRE(s.profiles.size() == 4);
            REQUIRE(s.profiles.front().name == "strict");
            REQUIRE(s.profiles.back().name == "exploratory");
            REQUIRE_FALSE(s.profiles.back().check_sr_proximity);
        }
    }

    SECTION("Unknown preset") {
        REQUIRE_THROWS_AS(StrategyConfig::preset("martingale"), ConfigurationError);
    }

    SECTION("Classic v2 cooldown window") {
        auto s = StrategyConfig::classic_v2();
        REQUIRE(s.cooldown_ms() == 25 * 60 * 1000);
        REQUIRE(s.trend.label() == "15m");
        REQUIRE(s.execution.label() == "5m");
        REQUIRE(s.target_candidates == 5);
    }

    SECTION("Pro variant scores the order book") {
        auto s = StrategyConfig::classic_crypto_pro_v3();
        REQUIRE(s.use_order_book);
        REQUIRE(s.weights.order_book > 0.0);
        REQUIRE(s.weights.max_score() == 100.0);
        REQUIRE(s.trend.label() == "1h");
    }

    SECTION("Only monster v2 gates on RSI") {
        auto monster = StrategyConfig::monster_v2();
        REQUIRE(monster.rsi_band.enabled);
        REQUIRE(monster.rsi_band.allows(Direction::Long, 25.0));
        REQUIRE(monster.rsi_band.allows(Direction::Long, 40.0));
        REQUIRE_FALSE(monster.rsi_band.allows(Direction::Long, 40.5));
        REQUIRE(monster.rsi_band.allows(Direction::Short, 75.0));
        REQUIRE_FALSE(monster.rsi_band.allows(Direction::Short, 59.9));
        REQUIRE_FALSE(StrategyConfig::classic_v2().rsi_band.enabled);
        REQUIRE_FALSE(StrategyConfig::classic_crypto_pro_v3().rsi_band.enabled);
    }
}

TEST_CASE("Scan profile validation", "[strategy]") {
    auto s = StrategyConfig::classic_v2();

    SECTION("Negative stop coefficient") {
        s.profiles[1].atr_stop_k = -0.5;
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }

    SECTION("Pullback threshold stricter than breakout threshold") {
        s.profiles[0].pullback_volume_zscore = s.profiles[0].min_volume_zscore + 1.0;
        REQUIRE_THROWS_AS(s.profiles[0].validate(), ConfigurationError);
    }

    SECTION("Later profile may not be stricter") {
        s.profiles[2].min_rr = s.profiles[1].min_rr + 0.1;
        REQUIRE_THROWS_AS(ScanProfile::validate_sequence(s.profiles), ConfigurationError);
    }

    SECTION("Divergence block cannot come back on") {
        s.profiles[3].block_on_divergence = true;
        REQUIRE_THROWS_AS(ScanProfile::validate_sequence(s.profiles), ConfigurationError);
    }

    SECTION("Empty sequence") {
        REQUIRE_THROWS_AS(ScanProfile::validate_sequence({}), ConfigurationError);
    }

    SECTION("Weights must add up to 100") {
        s.weights.macd = 20.0;
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }

    SECTION("RSI band bounds out of order") {
        s.rsi_band.enabled = true;
        s.rsi_band.long_min = 45.0;
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }

    SECTION("RSI band past 100") {
        s.rsi_band.enabled = true;
        s.rsi_band.short_max = 120.0;
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }

    SECTION("Execution timeframe must be lower than trend") {
        s.execution = s.trend;
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }
}

TEST_CASE("Strategy JSON overrides", "[strategy]") {
    SECTION("Fields left out keep the preset value") {
        auto doc = nlohmann::json::parse(R"({
            "preset": "classic_v2",
            "cooldown_candles": 10,
            "execution": {"limit": 150}
        })");

        auto s = StrategyConfig::from_json(doc, "monster_v2");
        REQUIRE(s.name == "classic_v2");
        REQUIRE(s.cooldown_candles == 10);
        REQUIRE(s.execution.limit == 150);
        REQUIRE(s.execution.interval == "5");
        REQUIRE(s.profiles.size() == 4);
        REQUIRE_NOTHROW(s.validate());
    }

    SECTION("Profile list replaces the tiers and overlays by name") {
        auto doc = nlohmann::json::parse(R"({
            "profiles": [
                {"name": "strict", "min_confidence": 70},
                {"name": "fallback", "min_turnover": 500000, "min_rr": 1.0,
                 "atr_stop_k": 0.5, "min_volume_zscore": 0.0, "min_volume_multiple": 0.5,
                 "pullback_volume_zscore": 0.0, "pullback_volume_multiple": 0.5,
                 "ema_touch_tolerance_pct": 2.0, "sr_distance_multiplier": 0.0,
                 "min_confidence": 40, "block_on_divergence": false,
                 "require_execution_agreement": false, "check_sr_proximity": false,
                 "top_volume_count": 150}
            ]
        })");

        auto s = StrategyConfig::from_json(doc, "classic_v2");
        REQUIRE(s.profiles.size() == 2);
        REQUIRE(s.profiles[0].min_confidence == 70.0);
        REQUIRE(s.profiles[0].min_turnover == 10'000'000.0);
        REQUIRE(s.profiles[1].name == "fallback");
        REQUIRE_NOTHROW(s.validate());
    }

    SECTION("Wrong field type") {
        auto doc = nlohmann::json::parse(R"({"cooldown_candles": "many"})");
        REQUIRE_THROWS_AS(StrategyConfig::from_json(doc, "classic_v2"), ConfigurationError);
    }

    SECTION("Preset name must be a string") {
        auto doc = nlohmann::json::parse(R"({"preset": 5})");
        REQUIRE_THROWS_AS(StrategyConfig::from_json(doc, "classic_v2"), ConfigurationError);
    }

    SECTION("RSI band overlays field by field") {
        auto doc = nlohmann::json::parse(R"({"rsi_band": {"enabled": true, "long_max": 45}})");
        auto s = StrategyConfig::from_json(doc, "classic_v2");
        REQUIRE(s.rsi_band.enabled);
        REQUIRE(s.rsi_band.long_max == 45.0);
        REQUIRE(s.rsi_band.long_min == 25.0);
        REQUIRE(s.rsi_band.short_min == 60.0);

        auto bad = nlohmann::json::parse(R"({"rsi_band": [25, 40]})");
        REQUIRE_THROWS_AS(StrategyConfig::from_json(bad, "classic_v2"), ConfigurationError);
    }

    SECTION("Round trip through to_json") {
        auto original = StrategyConfig::monster_v2();
        nlohmann::json j = original;
        auto copy = StrategyConfig::from_json(j, "classic_v2");
        REQUIRE(copy.name == "monster_v2");
        REQUIRE(copy.profiles[0].atr_stop_k == 1.2);
        REQUIRE(copy.cooldown_candles == original.cooldown_candles);
        REQUIRE(copy.rsi_band.enabled);
        REQUIRE(copy.rsi_band.short_max == 75.0);
    }
}
