#include <catch2/catch_test_macros.hpp>

#include "infrastructure/network/AsioContext.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace reconpulse::infra;
using namespace std::chrono_literals;

TEST_CASE("AsioContext lifecycle", "[AsioContext]") {
    AsioContext context(2);

    REQUIRE_FALSE(context.isRunning());
    REQUIRE(context.threadCount() == 2);

    context.start();
    REQUIRE(context.isRunning());

    context.stop();
    REQUIRE_FALSE(context.isRunning());

    SECTION("Zero threads is raised to one") {
        AsioContext single(0);
        REQUIRE(single.threadCount() == 1);
    }
}

TEST_CASE("AsioContext submit", "[AsioContext]") {
    AsioContext context(2);
    context.start();

    SECTION("Returns the callable's result") {
        auto future = context.submit([] { return 42; });
        REQUIRE(future.wait_for(5s) == std::future_status::ready);
        REQUIRE(future.get() == 42);
    }

    SECTION("Delivers exceptions through the future") {
        auto future = context.submit([]() -> int { throw std::runtime_error("boom"); });
        REQUIRE(future.wait_for(5s) == std::future_status::ready);
        REQUIRE_THROWS_AS(future.get(), std::runtime_error);
    }

    SECTION("Void tasks") {
        bool ran = false;
        auto future = context.submit([&ran] { ran = true; });
        future.get();
        REQUIRE(ran);
    }

    SECTION("Finished tasks are no longer in flight") {
        auto future = context.submit([] { return 1; });
        future.get();
        // The counter is decremented after the value is published.
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (context.inFlight() != 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(context.inFlight() == 0);
    }

    context.stop();
}
