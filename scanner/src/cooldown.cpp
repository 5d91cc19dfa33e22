#include "cooldown.hpp"
#include "util.hpp"

CooldownTracker::CooldownTracker(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(util::current_timestamp_ms)) {}

std::string CooldownTracker::make_key(const std::string& symbol, const std::string& strategy) {
    return strategy + ":" + symbol;
}

bool CooldownTracker::is_cooling_down(const std::string& symbol,
                                      const std::string& strategy) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = until_ms_.find(make_key(symbol, strategy));
    if (it == until_ms_.end()) return false;

    return clock_() < it->second;
}

void CooldownTracker::record(const std::string& symbol, const std::string& strategy,
                             int64_t until_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    until_ms_[make_key(symbol, strategy)] = until_ms;
}

std::optional<int64_t> CooldownTracker::cooldown_until(const std::string& symbol,
                                                       const std::string& strategy) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = until_ms_.find(make_key(symbol, strategy));
    if (it == until_ms_.end()) return std::nullopt;
    return it->second;
}

size_t CooldownTracker::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    const int64_t now = clock_();
    size_t removed = 0;
    for (auto it = until_ms_.begin(); it != until_ms_.end();) {
        if (it->second <= now) {
            it = until_ms_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t CooldownTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return until_ms_.size();
}
