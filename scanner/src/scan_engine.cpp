#include "scan_engine.hpp"
#include "sampling.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <thread>

namespace {

// Score descending, symbol ascending on ties
bool ranks_before(const SignalCandidate& a, const SignalCandidate& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.symbol < b.symbol;
}

} // namespace

ScanEngine::ScanEngine(MarketDataProvider& provider,
                       CooldownTracker& cooldowns,
                       SignalAssembler& assembler,
                       int worker_threads,
                       uint64_t sampling_seed)
    : provider_(provider)
    , cooldowns_(cooldowns)
    , assembler_(assembler)
    , worker_threads_(std::max(1, worker_threads))
    , sampling_seed_(sampling_seed) {}

std::vector<std::string> ScanEngine::select_pool(const std::vector<UniverseEntry>& universe,
                                                 const ScanProfile& profile,
                                                 const std::set<std::string>& exclude) {
    std::vector<UniverseEntry> eligible;
    for (const auto& entry : universe) {
        if (entry.turnover_24h >= profile.min_turnover) {
            eligible.push_back(entry);
        }
    }

    std::sort(eligible.begin(), eligible.end(),
              [](const UniverseEntry& a, const UniverseEntry& b) {
                  if (a.turnover_24h != b.turnover_24h) return a.turnover_24h > b.turnover_24h;
                  return a.symbol < b.symbol;
              });

    if (eligible.size() > static_cast<size_t>(profile.top_volume_count)) {
        eligible.resize(static_cast<size_t>(profile.top_volume_count));
    }

    std::vector<std::string> pool;
    pool.reserve(eligible.size());
    for (const auto& entry : eligible) {
        if (exclude.count(entry.symbol) == 0) {
            pool.push_back(entry.symbol);
        }
    }
    return pool;
}

std::vector<SignalCandidate> ScanEngine::evaluate_batch(const CandidateEvaluator& evaluator,
                                                        const std::vector<std::string>& symbols,
                                                        const ScanProfile& profile,
                                                        SeriesCache& cache,
                                                        ScanStats& stats) const {
    std::vector<EvaluationOutcome> outcomes(symbols.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next++; i < symbols.size(); i = next++) {
            try {
                outcomes[i] = evaluator.evaluate(symbols[i], profile, cache);
            } catch (const std::exception& e) {
                spdlog::error("Evaluation of {} under {} failed: {}", symbols[i], profile.name,
                              e.what());
                outcomes[i] = EvaluationOutcome::reject(RejectReason::DataUnavailable);
            }
        }
    };

    size_t thread_count = std::min(static_cast<size_t>(worker_threads_), symbols.size());
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (size_t t = 0; t < thread_count; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    // Whole batch done before the stop rule is consulted
    std::vector<SignalCandidate> accepted;
    for (auto& outcome : outcomes) {
        if (outcome.accepted()) {
            accepted.push_back(std::move(*outcome.candidate));
        } else {
            stats.rejections[to_string(outcome.reason)]++;
        }
    }
    return accepted;
}

std::vector<TradingSignal> ScanEngine::generate_signals(const StrategyConfig& strategy) {
    strategy.validate();

    ScanStats stats;
    stats.strategy = strategy.name;
    stats.started_ms = util::current_timestamp_ms();

    size_t expired = cooldowns_.cleanup_expired();
    if (expired > 0) {
        spdlog::debug("Dropped {} expired cooldowns", expired);
    }

    std::vector<TradingSignal> signals;

    auto universe = provider_.fetch_universe();
    if (!universe) {
        spdlog::warn("Symbol universe unavailable, skipping scan pass");
        stats.finished_ms = util::current_timestamp_ms();
        std::lock_guard<std::mutex> lock(stats_mutex_);
        last_stats_ = stats;
        return signals;
    }
    stats.universe_size = universe->size();

    CandidateEvaluator evaluator(provider_, cooldowns_, strategy);
    SeriesCache cache;
    SamplingPolicy sampling(strategy.sampling_rate, sampling_seed_ + pass_count_++);

    std::vector<SignalCandidate> accepted;
    std::set<std::string> accepted_symbols;

    for (const auto& profile : strategy.profiles) {
        auto pool = sampling.apply(select_pool(*universe, profile, accepted_symbols));

        ProfileSummary summary;
        summary.name = profile.name;
        summary.pool_size = pool.size();

        if (!pool.empty()) {
            auto batch = evaluate_batch(evaluator, pool, profile, cache, stats);
            std::stable_sort(batch.begin(), batch.end(), ranks_before);
            if (batch.size() > static_cast<size_t>(profile.max_signals)) {
                batch.resize(static_cast<size_t>(profile.max_signals));
            }

            summary.accepted = batch.size();
            for (auto& c : batch) {
                accepted_symbols.insert(c.symbol);
                accepted.push_back(std::move(c));
            }
        }

        stats.profiles.push_back(summary);
        spdlog::info("[{}] profile {}: {} accepted from {} symbols (total {})",
                     strategy.name, profile.name, summary.accepted, summary.pool_size,
                     accepted.size());

        if (accepted.size() >= static_cast<size_t>(strategy.target_candidates)) {
            break;
        }
    }

    stats.candidates = accepted.size();

    if (accepted.empty()) {
        spdlog::info("[{}] no qualifying candidates after {} profiles",
                     strategy.name, stats.profiles.size());
    }

    std::stable_sort(accepted.begin(), accepted.end(), ranks_before);
    if (accepted.size() > static_cast<size_t>(strategy.max_signals)) {
        accepted.resize(static_cast<size_t>(strategy.max_signals));
    }

    const int64_t now = cooldowns_.now_ms();
    for (auto& c : accepted) {
        c.cooldown_until_ms = now + strategy.cooldown_ms();
        cooldowns_.record(c.symbol, strategy.name, c.cooldown_until_ms);

        auto signal = assembler_.assemble(c);
        spdlog::info("Signal {} {} {} entry={} stop={} tp1={} score={:.1f} ({})",
                     signal.id, c.symbol, to_string(c.direction),
                     util::format_price(c.entry), util::format_price(c.stop_loss),
                     util::format_price(c.take_profit_1), c.score, c.profile);
        signals.push_back(std::move(signal));
    }

    stats.emitted = signals.size();
    stats.finished_ms = util::current_timestamp_ms();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        last_stats_ = stats;
    }

    return signals;
}

ScanStats ScanEngine::last_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_stats_;
}
