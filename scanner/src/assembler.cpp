#include "assembler.hpp"
#include "util.hpp"
#include <algorithm>

SignalAssembler::SignalAssembler(uint64_t seed, Clock clock)
    : clock_(clock ? std::move(clock) : Clock(util::current_timestamp_ms))
    , rng_(seed) {}

std::string SignalAssembler::make_id(const SignalCandidate& candidate, int64_t created_at_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    return candidate.strategy + "-" + candidate.symbol + "-" +
           std::to_string(created_at_ms) + "-" + util::random_suffix(rng_, 9);
}

TradingSignal SignalAssembler::assemble(const SignalCandidate& candidate) {
    TradingSignal signal;
    signal.created_at_ms = clock_();
    signal.id = make_id(candidate, signal.created_at_ms);
    signal.confidence = std::clamp(candidate.score / 100.0, 0.0, 1.0);
    signal.rationale = util::join(candidate.reasons, "; ");
    signal.candidate = candidate;
    return signal;
}
