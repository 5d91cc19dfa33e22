#include <catch2/catch_test_macros.hpp>
#include "../src/request_limiter.hpp"
#include <atomic>
#include <thread>
#include <vector>

TEST_CASE("Request limiter", "[request_limiter]") {
    SECTION("Permits release their slot") {
        RequestLimiter limiter(2, 0);
        {
            auto a = limiter.acquire();
            auto b = limiter.acquire();
            REQUIRE(limiter.in_flight() == 2);
        }
        REQUIRE(limiter.in_flight() == 0);
    }

    SECTION("Starts are spaced apart") {
        RequestLimiter limiter(4, 20);
        auto begin = std::chrono::steady_clock::now();
        for (int i = 0; i < 4; ++i) {
            auto permit = limiter.acquire();
        }
        auto elapsed = std::chrono::steady_clock::now() - begin;
        REQUIRE(elapsed >= std::chrono::milliseconds(60));
    }

    SECTION("Concurrency never exceeds the cap") {
        RequestLimiter limiter(2, 0);
        std::atomic<int> active{0};
        std::atomic<int> peak{0};

        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 5; ++i) {
                    auto permit = limiter.acquire();
                    int now = ++active;
                    int seen = peak.load();
                    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    --active;
                }
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(peak.load() <= 2);
        REQUIRE(limiter.in_flight() == 0);
    }
}
