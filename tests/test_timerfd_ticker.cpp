#include <catch2/catch_test_macros.hpp>

#include "platform/linux/timerfd_ticker.hpp"

#include <chrono>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("Timerfd ticker", "[ticker]") {
    TimerfdTicker ticker;
    REQUIRE(ticker.fd() >= 0);
    REQUIRE_FALSE(ticker.armed());

    SECTION("NothingPendingWhenIdle") {
        REQUIRE(ticker.consume() == 0);
    }

    SECTION("ArmedTickerExpires") {
        REQUIRE(ticker.arm(5ms));
        REQUIRE(ticker.armed());
        std::this_thread::sleep_for(30ms);
        REQUIRE(ticker.consume() >= 1);
    }

    SECTION("DisarmDropsPendingExpirations") {
        REQUIRE(ticker.arm(5ms));
        std::this_thread::sleep_for(20ms);
        ticker.disarm();
        REQUIRE_FALSE(ticker.armed());
        REQUIRE(ticker.consume() == 0);
        std::this_thread::sleep_for(20ms);
        REQUIRE(ticker.consume() == 0);
    }

    SECTION("RejectsNonPositivePeriod") {
        REQUIRE_FALSE(ticker.arm(0ms));
        REQUIRE_FALSE(ticker.armed());
    }

    SECTION("Rearm") {
        REQUIRE(ticker.arm(5ms));
        ticker.disarm();
        REQUIRE(ticker.arm(5ms));
        std::this_thread::sleep_for(20ms);
        REQUIRE(ticker.consume() >= 1);
    }
}
