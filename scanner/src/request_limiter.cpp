#include "request_limiter.hpp"
#include <algorithm>
#include <thread>

RequestLimiter::RequestLimiter(int max_in_flight, int min_spacing_ms)
    : max_in_flight_(std::max(1, max_in_flight))
    , min_spacing_(std::max(0, min_spacing_ms))
    , next_start_(std::chrono::steady_clock::now()) {}

RequestLimiter::Permit::~Permit() {
    if (owner_) {
        owner_->release();
    }
}

RequestLimiter::Permit RequestLimiter::acquire() {
    std::chrono::steady_clock::time_point start;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        slot_free_.wait(lock, [this] { return in_flight_ < max_in_flight_; });
        in_flight_++;

        start = std::max(std::chrono::steady_clock::now(), next_start_);
        next_start_ = start + min_spacing_;
    }

    std::this_thread::sleep_until(start);
    return Permit(this);
}

int RequestLimiter::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

void RequestLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_--;
    }
    slot_free_.notify_one();
}
