#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

// Deterministic pool thinning. Rate 1.0 keeps every symbol; for a fixed
// seed the same input always yields the same subset.
class SamplingPolicy {
public:
    explicit SamplingPolicy(double rate = 1.0, uint64_t seed = 0);

    std::vector<std::string> apply(const std::vector<std::string>& symbols);

    double rate() const { return rate_; }

private:
    double rate_;
    std::mt19937_64 rng_;
};
