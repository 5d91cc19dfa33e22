#include "sampling.hpp"
#include <algorithm>

SamplingPolicy::SamplingPolicy(double rate, uint64_t seed)
    : rate_(std::clamp(rate, 0.0, 1.0))
    , rng_(seed) {}

std::vector<std::string> SamplingPolicy::apply(const std::vector<std::string>& symbols) {
    if (rate_ >= 1.0) {
        return symbols;
    }

    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::vector<std::string> kept;
    kept.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        if (dist(rng_) < rate_) {
            kept.push_back(symbol);
        }
    }
    return kept;
}
