#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// Caps concurrent upstream requests and spaces out their start times
class RequestLimiter {
public:
    RequestLimiter(int max_in_flight, int min_spacing_ms);

    // Released on destruction
    class Permit {
    public:
        explicit Permit(RequestLimiter* owner) : owner_(owner) {}
        ~Permit();
        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit& operator=(Permit&&) = delete;

    private:
        RequestLimiter* owner_;
    };

    // Blocks until a slot is free and the spacing since the previous start
    // has elapsed
    Permit acquire();

    int in_flight() const;

private:
    void release();

    int max_in_flight_;
    std::chrono::milliseconds min_spacing_;

    mutable std::mutex mutex_;
    std::condition_variable slot_free_;
    int in_flight_ = 0;
    std::chrono::steady_clock::time_point next_start_;
};
