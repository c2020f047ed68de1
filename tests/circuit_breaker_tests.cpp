#include "wakeify/playback/circuit_breaker.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "support/manual_clock.hpp"

using namespace std::chrono_literals;
using wakeify::playback::CircuitBreakerPolicy;
using wakeify::playback::CircuitBreakerRegistry;

TEST_CASE("Breaker opens after three failures and closes after the cooldown", "[circuit_breaker]") {
    wakeify::testing::ManualClock clock;
    CircuitBreakerRegistry breakers(clock);

    breakers.record_failure("Kitchen");
    breakers.record_failure("Kitchen");
    REQUIRE_FALSE(breakers.should_bypass_primary("Kitchen"));

    breakers.record_failure("Kitchen");
    REQUIRE(breakers.should_bypass_primary("Kitchen"));
    REQUIRE(breakers.state("Kitchen").failure_count == 3);

    clock.advance(599s);
    REQUIRE(breakers.should_bypass_primary("Kitchen"));

    clock.advance(2s);
    REQUIRE_FALSE(breakers.should_bypass_primary("Kitchen"));
    const auto state = breakers.state("Kitchen");
    REQUIRE_FALSE(state.is_open);
    REQUIRE(state.failure_count == 0);
}

TEST_CASE("Success resets the failure count", "[circuit_breaker]") {
    wakeify::testing::ManualClock clock;
    CircuitBreakerRegistry breakers(clock);

    breakers.record_failure("Kitchen");
    breakers.record_failure("Kitchen");
    breakers.record_success("Kitchen");
    breakers.record_failure("Kitchen");
    REQUIRE_FALSE(breakers.should_bypass_primary("Kitchen"));
    REQUIRE(breakers.state("Kitchen").failure_count == 1);
}

TEST_CASE("Breakers are independent per device", "[circuit_breaker]") {
    wakeify::testing::ManualClock clock;
    CircuitBreakerRegistry breakers(clock, CircuitBreakerPolicy{.failure_threshold = 1, .cooldown = 60s});

    breakers.record_failure("Kitchen");
    REQUIRE(breakers.should_bypass_primary("Kitchen"));
    REQUIRE_FALSE(breakers.should_bypass_primary("Office"));

    const auto entries = breakers.snapshot();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].device_name == "kitchen");
    REQUIRE(entries[0].state.is_open);
    REQUIRE(entries[1].device_name == "office");

    breakers.reset("Kitchen");
    REQUIRE_FALSE(breakers.should_bypass_primary("Kitchen"));
    REQUIRE_FALSE(breakers.state("Unknown").last_failure_time);
}

TEST_CASE("Spellings of one device share a breaker", "[circuit_breaker]") {
    wakeify::testing::ManualClock clock;
    CircuitBreakerRegistry breakers(clock);

    breakers.record_failure("Bedroom Speaker");
    breakers.record_failure("bedroom speaker");
    breakers.record_failure("  BEDROOM SPEAKER ");

    REQUIRE(breakers.should_bypass_primary("Bedroom Speaker"));
    REQUIRE(breakers.state("bedroom speaker").failure_count == 3);
    REQUIRE(breakers.snapshot().size() == 1);

    breakers.reset("BEDROOM speaker");
    REQUIRE_FALSE(breakers.should_bypass_primary("bedroom speaker"));
}
