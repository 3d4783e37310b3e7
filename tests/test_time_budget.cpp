/*
===============================================================================
TEST TIME BUDGET — Tests for time_budget.h
===============================================================================

OVERVIEW
--------
Validates the derivation of the solver budget from an external elapsed-time
query: cap, reserve, exhaustion and argument checks.

TEST STRATEGY
-------------
• Drive the budget with a controllable fake clock
• One smoke test on the steady-clock factory

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• time_budget.h - System under test

===============================================================================
*/

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <memory>
#include <stdexcept>

#include <wavepick/time_budget.h>

using namespace wavepick;

namespace {

    /// Budget on a clock the test moves by hand
    struct FakeClock {
        std::shared_ptr<double> now = std::make_shared<double>(0.0);

        TimeBudget budget(double total, double cap, double reserve) const {
            auto t = now;
            return TimeBudget(total, cap, reserve, [t] { return *t; });
        }
    };

} // namespace

// ============================================================================
// SECTION A: DERIVATION
// ============================================================================

/**
 * @test TimeBudget::CapAppliesAtStart
 * @brief At t=0 the engine gets the cap, not total minus reserve
 */
TEST_CASE("A1: TimeBudget::CapAppliesAtStart", "[TimeBudget][derive]")
{
    FakeClock clock;
    const TimeBudget budget = clock.budget(600, 540, 30);

    REQUIRE(budget.elapsed() == Catch::Approx(0.0));
    REQUIRE(budget.remaining() == Catch::Approx(600.0));
    REQUIRE(budget.solverBudget() == Catch::Approx(540.0));
    REQUIRE_FALSE(budget.reserveReached());
}

/**
 * @test TimeBudget::ReserveAppliesLater
 * @brief Once total − elapsed − reserve drops below the cap it binds
 */
TEST_CASE("A2: TimeBudget::ReserveAppliesLater", "[TimeBudget][derive]")
{
    FakeClock clock;
    const TimeBudget budget = clock.budget(600, 540, 30);

    *clock.now = 100.0;
    REQUIRE(budget.remaining() == Catch::Approx(500.0));
    REQUIRE(budget.solverBudget() == Catch::Approx(470.0));

    *clock.now = 569.0;
    REQUIRE(budget.solverBudget() == Catch::Approx(1.0));
    REQUIRE_FALSE(budget.reserveReached());
}

/**
 * @test TimeBudget::Exhausted
 * @brief Nothing is left for the engine once the reserve is reached
 */
TEST_CASE("A3: TimeBudget::Exhausted", "[TimeBudget][derive]")
{
    FakeClock clock;
    const TimeBudget budget = clock.budget(600, 540, 30);

    *clock.now = 570.0;
    REQUIRE(budget.solverBudget() == Catch::Approx(0.0));
    REQUIRE(budget.reserveReached());

    *clock.now = 700.0;
    REQUIRE(budget.remaining() == Catch::Approx(0.0));
    REQUIRE(budget.solverBudget() == Catch::Approx(0.0));
}

/**
 * @test TimeBudget::Accessors
 */
TEST_CASE("A4: TimeBudget::Accessors", "[TimeBudget][derive]")
{
    FakeClock clock;
    const TimeBudget budget = clock.budget(60, 50, 5);

    REQUIRE(budget.total() == Catch::Approx(60.0));
    REQUIRE(budget.solverCap() == Catch::Approx(50.0));
    REQUIRE(budget.reserve() == Catch::Approx(5.0));
}

// ============================================================================
// SECTION B: CONSTRUCTION
// ============================================================================

/**
 * @test TimeBudget::RejectsBadArguments
 */
TEST_CASE("B1: TimeBudget::RejectsBadArguments", "[TimeBudget][errors]")
{
    auto zero = [] { return 0.0; };

    REQUIRE_THROWS_AS(TimeBudget(-1, 10, 1, zero), std::invalid_argument);
    REQUIRE_THROWS_AS(TimeBudget(10, -1, 1, zero), std::invalid_argument);
    REQUIRE_THROWS_AS(TimeBudget(10, 10, -1, zero), std::invalid_argument);
    REQUIRE_THROWS_AS(TimeBudget(10, 10, 1, TimeBudget::ElapsedFn{}), std::invalid_argument);
}

/**
 * @test TimeBudget::RejectsNonFiniteDurations
 */
TEST_CASE("B2: TimeBudget::RejectsNonFiniteDurations", "[TimeBudget][errors]")
{
    auto zero = [] { return 0.0; };
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    REQUIRE_THROWS_AS(TimeBudget(nan, 10, 1, zero), std::invalid_argument);
    REQUIRE_THROWS_AS(TimeBudget(10, inf, 1, zero), std::invalid_argument);
    REQUIRE_THROWS_AS(TimeBudget(10, 10, nan, zero), std::invalid_argument);
}

/**
 * @test TimeBudget::StartingNow
 * @brief The steady-clock budget starts near zero elapsed
 */
TEST_CASE("B3: TimeBudget::StartingNow", "[TimeBudget][clock]")
{
    const TimeBudget budget = TimeBudget::startingNow(600, 540, 30);

    REQUIRE(budget.elapsed() >= 0.0);
    REQUIRE(budget.elapsed() < 5.0);
    REQUIRE(budget.solverBudget() == Catch::Approx(540.0).margin(5.0));
}
