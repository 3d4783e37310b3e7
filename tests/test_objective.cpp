/*
===============================================================================
TEST OBJECTIVE — Tests for objective.h
===============================================================================

OVERVIEW
--------
Validates the true wave ratio: units of the selected orders divided by the
number of visited aisles, its exact integer form, and the empty-wave rule.

TEST ORGANIZATION
-----------------
• Section A: Scores of known waves
• Section B: Exact ratio comparison
• Section C: Empty waves and purity

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• objective.h - System under test
• wave_fixtures.h - Shared instances

===============================================================================
*/

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <set>

#include <wavepick/feasibility.h>
#include <wavepick/objective.h>

#include "wave_fixtures.h"

using namespace wavepick;

// ============================================================================
// SECTION A: SCORES OF KNOWN WAVES
// ============================================================================

/**
 * @test Objective::Scenarios
 * @brief Scenario waves score their documented ratios
 */
TEST_CASE("A1: Objective::Scenarios", "[Objective][scenario]")
{
    REQUIRE(score(wavepick::testing::scenarioA(), CandidateSolution({ 0 }, { 0 })) == Catch::Approx(5.0));
    REQUIRE(score(wavepick::testing::scenarioC(), CandidateSolution({ 1 }, { 0 })) == Catch::Approx(6.0));
    REQUIRE(score(wavepick::testing::scenarioD(), CandidateSolution({ 0 }, { 1 })) == Catch::Approx(5.0));
    REQUIRE(score(wavepick::testing::scenarioD(), CandidateSolution({ 0 }, { 0, 1 })) == Catch::Approx(2.5));
}

/**
 * @test Objective::SumOverOrders
 * @brief Units are summed over every item of every selected order
 *
 * @given Orders 0 (3 units), 2 (4 units), 3 (6 units) and 3 aisles
 * @then score = 13 / 3
 */
TEST_CASE("A2: Objective::SumOverOrders", "[Objective][ratio]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    const CandidateSolution wave({ 0, 2, 3 }, { 0, 1, 2 });

    REQUIRE(unitsPicked(inst, wave) == 13);
    REQUIRE(score(inst, wave) == Catch::Approx(13.0 / 3.0));
}

/**
 * @test Objective::ExactScore
 * @brief exactScore keeps numerator and denominator as integers
 */
TEST_CASE("A3: Objective::ExactScore", "[Objective][ratio]")
{
    const Instance inst = wavepick::testing::mixedInstance();

    const WaveRatio ratio = exactScore(inst, CandidateSolution({ 0, 1, 3 }, { 0, 2 }));
    REQUIRE(ratio.units == 12);
    REQUIRE(ratio.aisles == 2);
    REQUIRE(ratio.value() == Catch::Approx(6.0));
}

/**
 * @test Objective::FeasibleWavesMatchDefinition
 * @brief For every feasible wave of the mixed instance the score equals
 *        the sum of order units over the number of aisles
 *
 * @given All 15 x 7 non-empty (orders, aisles) subsets
 */
TEST_CASE("A4: Objective::FeasibleWavesMatchDefinition", "[Objective][ratio]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    const long long units[] = { 3, 3, 4, 6 };
    int feasibleWaves = 0;

    for (int om = 1; om < (1 << 4); ++om) {
        for (int am = 1; am < (1 << 3); ++am) {
            std::set<int> orders;
            std::set<int> aisles;
            long long expectedUnits = 0;
            for (int o = 0; o < 4; ++o) {
                if (om & (1 << o)) {
                    orders.insert(o);
                    expectedUnits += units[o];
                }
            }
            for (int a = 0; a < 3; ++a) {
                if (am & (1 << a)) aisles.insert(a);
            }

            const CandidateSolution wave(orders, aisles);
            if (!isFeasible(inst, wave)) {
                continue;
            }
            ++feasibleWaves;

            const WaveRatio ratio = exactScore(inst, wave);
            REQUIRE(ratio.units == expectedUnits);
            REQUIRE(ratio.aisles == static_cast<long long>(aisles.size()));
            REQUIRE(score(inst, wave) ==
                Catch::Approx(static_cast<double>(expectedUnits) / static_cast<double>(aisles.size())));
        }
    }
    REQUIRE(feasibleWaves > 0);
}

// ============================================================================
// SECTION B: EXACT RATIO COMPARISON
// ============================================================================

/**
 * @test WaveRatio::Comparison
 * @brief Ratios compare by value, not by representation
 */
TEST_CASE("B1: WaveRatio::Comparison", "[Objective][WaveRatio]")
{
    REQUIRE(WaveRatio{ 6, 1 } == WaveRatio{ 12, 2 });
    REQUIRE(WaveRatio{ 5, 2 } < WaveRatio{ 3, 1 });
    REQUIRE_FALSE(WaveRatio{ 3, 1 } < WaveRatio{ 5, 2 });
    REQUIRE(WaveRatio{} < WaveRatio{ 1, 4 });
    REQUIRE(WaveRatio{} == WaveRatio{ 0, 3 });
}

/**
 * @test WaveRatio::LargeValues
 * @brief Cross-multiplication of large totals stays exact
 */
TEST_CASE("B2: WaveRatio::LargeValues", "[Objective][WaveRatio]")
{
    const WaveRatio a{ 3'000'000'001, 3 };
    const WaveRatio b{ 1'000'000'000, 1 };

    REQUIRE(b < a);
    REQUIRE_FALSE(a == b);
}

// ============================================================================
// SECTION C: EMPTY WAVES AND PURITY
// ============================================================================

/**
 * @test Objective::EmptyWaves
 * @brief Either empty side scores 0
 */
TEST_CASE("C1: Objective::EmptyWaves", "[Objective][edge]")
{
    const Instance inst = wavepick::testing::mixedInstance();

    REQUIRE(score(inst, CandidateSolution({}, { 0 })) == 0.0);
    REQUIRE(score(inst, CandidateSolution({ 0 }, {})) == 0.0);
    REQUIRE(score(inst, CandidateSolution()) == 0.0);

    const WaveRatio empty = exactScore(inst, CandidateSolution({ 1 }, {}));
    REQUIRE(empty.units == 0);
    REQUIRE(empty.aisles == 0);
}

/**
 * @test Objective::Idempotent
 * @brief Scoring twice gives the same value
 */
TEST_CASE("C2: Objective::Idempotent", "[Objective][purity]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    const CandidateSolution wave({ 0, 1 }, { 0 });

    const double first = score(inst, wave);
    const double second = score(inst, wave);

    REQUIRE(first == second);
    REQUIRE(exactScore(inst, wave) == exactScore(inst, wave));
}
