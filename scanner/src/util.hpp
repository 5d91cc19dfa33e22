#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <random>

namespace util {
    std::string current_iso8601();
    std::string to_iso8601(int64_t timestamp_ms);
    int64_t current_timestamp_ms();
    std::string random_suffix(std::mt19937_64& rng, size_t length = 9);
    std::string join(const std::vector<std::string>& parts, const std::string& sep);
    std::string format_price(double value);
}
