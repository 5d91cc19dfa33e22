#pragma once

#include "assembler.hpp"
#include "cooldown.hpp"
#include "evaluator.hpp"
#include "market_data.hpp"
#include "series_cache.hpp"
#include "signal.hpp"
#include "strategy.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct ProfileSummary {
    std::string name;
    size_t pool_size = 0;
    size_t accepted = 0;
};

struct ScanStats {
    std::string strategy;
    int64_t started_ms = 0;
    int64_t finished_ms = 0;
    size_t universe_size = 0;
    size_t candidates = 0;
    size_t emitted = 0;
    std::vector<ProfileSummary> profiles;
    std::map<std::string, size_t> rejections;
};

// Walks the strategy's profiles strict to relaxed until enough candidates
// are found, then ranks, caps, records cooldowns and assembles signals.
class ScanEngine {
public:
    ScanEngine(MarketDataProvider& provider,
               CooldownTracker& cooldowns,
               SignalAssembler& assembler,
               int worker_threads = 4,
               uint64_t sampling_seed = 0);

    // Empty when the universe is unavailable or nothing qualifies.
    // Throws ConfigurationError for an invalid strategy.
    std::vector<TradingSignal> generate_signals(const StrategyConfig& strategy);

    // Turnover filter, top-N by turnover (ties by symbol), minus `exclude`
    static std::vector<std::string> select_pool(const std::vector<UniverseEntry>& universe,
                                                const ScanProfile& profile,
                                                const std::set<std::string>& exclude);

    ScanStats last_stats() const;

private:
    MarketDataProvider& provider_;
    CooldownTracker& cooldowns_;
    SignalAssembler& assembler_;
    int worker_threads_;
    uint64_t sampling_seed_;
    uint64_t pass_count_ = 0;

    mutable std::mutex stats_mutex_;
    ScanStats last_stats_;

    std::vector<SignalCandidate> evaluate_batch(const CandidateEvaluator& evaluator,
                                                const std::vector<std::string>& symbols,
                                                const ScanProfile& profile,
                                                SeriesCache& cache,
                                                ScanStats& stats) const;
};
