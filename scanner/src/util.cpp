#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace util {

std::string current_iso8601() {
    return to_iso8601(current_timestamp_ms());
}

std::string to_iso8601(int64_t timestamp_ms) {
    std::time_t secs = static_cast<std::time_t>(timestamp_ms / 1000);
    int millis = static_cast<int>(timestamp_ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%T") << '.'
       << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string random_suffix(std::mt19937_64& rng, size_t length) {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(alphabet[pick(rng)]);
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string combined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) combined += sep;
        combined += parts[i];
    }
    return combined;
}

std::string format_price(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6) << value;
    return ss.str();
}

} // namespace util
