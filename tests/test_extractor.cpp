/*
===============================================================================
TEST EXTRACTOR — Tests for extractor.h
===============================================================================

OVERVIEW
--------
Validates the mapping from engine values to a candidate wave: an index is
selected iff its value is strictly greater than 0.5.

TEST ORGANIZATION
-----------------
• Section A: Threshold
• Section B: Shapes and noise

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• extractor.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <vector>

#include <wavepick/extractor.h>

using namespace wavepick;

// ============================================================================
// SECTION A: THRESHOLD
// ============================================================================

/**
 * @test Extractor::StrictThreshold
 * @brief 0.5 itself is not selected, anything above is
 */
TEST_CASE("A1: Extractor::StrictThreshold", "[Extractor][threshold]")
{
    REQUIRE(selectedIndices({ 0.5 }).empty());
    REQUIRE(selectedIndices({ 0.5000001 }) == std::set<int>{ 0 });
    REQUIRE(selectedIndices({ 0.0, 1.0, 0.49, 0.51 }) == std::set<int>{ 1, 3 });
}

/**
 * @test Extractor::OrdersAndAisles
 * @brief Both sides are extracted independently
 */
TEST_CASE("A2: Extractor::OrdersAndAisles", "[Extractor][threshold]")
{
    const CandidateSolution wave = extractSolution({ 1.0, 0.0, 1.0 }, { 0.0, 1.0 });

    REQUIRE(wave.orders() == std::set<int>{ 0, 2 });
    REQUIRE(wave.aisles() == std::set<int>{ 1 });
}

// ============================================================================
// SECTION B: SHAPES AND NOISE
// ============================================================================

/**
 * @test Extractor::IntegralityNoise
 * @brief Values within solver tolerance of 0 or 1 round to their intent
 */
TEST_CASE("B1: Extractor::IntegralityNoise", "[Extractor][noise]")
{
    const CandidateSolution wave = extractSolution(
        { 0.9999999, 1e-9, -1e-7, 1.0000002 },
        { 2e-6, 0.999995 });

    REQUIRE(wave.orders() == std::set<int>{ 0, 3 });
    REQUIRE(wave.aisles() == std::set<int>{ 1 });
}

/**
 * @test Extractor::EmptyInputs
 * @brief No values, or all zero, give empty sides
 */
TEST_CASE("B2: Extractor::EmptyInputs", "[Extractor][edge]")
{
    const CandidateSolution none = extractSolution({}, {});
    REQUIRE(none.orders().empty());
    REQUIRE(none.aisles().empty());
    REQUIRE(none.empty());

    const CandidateSolution zeros = extractSolution({ 0.0, 0.0 }, { 1.0 });
    REQUIRE(zeros.orders().empty());
    REQUIRE(zeros.empty());
}
