#include <catch2/catch_test_macros.hpp>
#include "../src/stop_signal.hpp"
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

namespace {

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

TEST_CASE("Stop signal waits", "[stop_signal]") {
    StopSignal stop;  // default 250ms poll slice
    
    SECTION("Full wait without a stop returns true") {
        auto start = std::chrono::steady_clock::now();
        REQUIRE(stop.wait_for(300ms));
        REQUIRE(elapsed_since(start) >= 300ms);
        REQUIRE_FALSE(stop.stop_requested());
    }
    
    SECTION("Stop raised from a signal handler is seen within a poll slice") {
        std::thread raiser([&stop]() {
            std::this_thread::sleep_for(100ms);
            stop.request_stop_from_signal();
        });
        
        auto start = std::chrono::steady_clock::now();
        bool completed = stop.wait_for(60000ms);
        auto waited = elapsed_since(start);
        raiser.join();
        
        REQUIRE_FALSE(completed);
        REQUIRE(stop.stop_requested());
        REQUIRE(waited < 2000ms);
    }
    
    SECTION("request_stop wakes the waiter") {
        std::thread raiser([&stop]() {
            std::this_thread::sleep_for(50ms);
            stop.request_stop();
        });
        
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(stop.wait_for(60000ms));
        auto waited = elapsed_since(start);
        raiser.join();
        
        REQUIRE(waited < 2000ms);
    }
    
    SECTION("Already stopped returns at once") {
        stop.request_stop();
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(stop.wait_for(60000ms));
        REQUIRE(elapsed_since(start) < 1000ms);
    }
}
