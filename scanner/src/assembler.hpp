#pragma once

#include "signal.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>

// Maps accepted candidates onto the published TradingSignal record
class SignalAssembler {
public:
    using Clock = std::function<int64_t()>;

    explicit SignalAssembler(uint64_t seed, Clock clock = Clock());

    TradingSignal assemble(const SignalCandidate& candidate);

    // "<strategy>-<symbol>-<created ms>-<9 base36 chars>"
    std::string make_id(const SignalCandidate& candidate, int64_t created_at_ms);

private:
    Clock clock_;
    std::mutex mutex_;
    std::mt19937_64 rng_;
};
