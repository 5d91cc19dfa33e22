#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

// Earliest next-eligible time per symbol and strategy. Lives for the
// process; one writer per key, last acceptance wins.
class CooldownTracker {
public:
    using Clock = std::function<int64_t()>;

    // Defaults to wall-clock milliseconds
    explicit CooldownTracker(Clock clock = Clock());

    bool is_cooling_down(const std::string& symbol, const std::string& strategy) const;

    void record(const std::string& symbol, const std::string& strategy, int64_t until_ms);

    std::optional<int64_t> cooldown_until(const std::string& symbol,
                                          const std::string& strategy) const;

    // Drops expired entries, returns how many were removed
    size_t cleanup_expired();

    size_t size() const;

    int64_t now_ms() const { return clock_(); }

private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, int64_t> until_ms_;

    static std::string make_key(const std::string& symbol, const std::string& strategy);
};
