/*
===============================================================================
TEST WAVE MODEL — Tests for wave_model.h
===============================================================================

OVERVIEW
--------
Validates the MILP built by WaveModelBuilder: variable types and bounds, the
sparse capacity rows, the coefficients of the linking rows and of the ratio
cut, the metadata recorded in the store, and the optimum of the surrogate
objective on the scenario instances.

TEST ORGANIZATION
-----------------
• Section A: Variables
• Section B: Constraint rows and coefficients
• Section C: Parameters and metadata
• Section D: Optimizing the scenarios

TEST STRATEGY
-------------
• Inspect the built model through Gurobi attributes before any solve
• Solve the scenario models directly and compare against the hand-derived
  optimum of Z = N + UB·(numAisles − D)

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• wave_model.h - System under test
• diagnostics.h - Model statistics
• wave_fixtures.h - Shared instances
• Gurobi C++ API - Solver backend

===============================================================================
*/

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <numeric>
#include <stdexcept>
#include <vector>

#include <wavepick/diagnostics.h>
#include <wavepick/wave_model.h>

#include "wave_fixtures.h"

using namespace wavepick;

// ============================================================================
// UTILITY
// ============================================================================

namespace {

    double coeff(WaveModelBuilder& builder, const GRBConstr& row, const GRBVar& var) {
        return builder.model().getCoeff(row, var);
    }

    double total(const std::vector<double>& v) {
        return std::accumulate(v.begin(), v.end(), 0.0);
    }

} // namespace

// ============================================================================
// SECTION A: VARIABLES
// ============================================================================

/**
 * @test WaveModel::VariableCounts
 * @brief One binary per order and aisle plus N, D (integer) and Z (continuous)
 *
 * @given mixedInstance: 4 orders, 3 aisles
 * @then 10 variables: 7 binary, 2 integer, 1 continuous
 */
TEST_CASE("A1: WaveModel::VariableCounts", "[WaveModel][variables]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    WaveModelBuilder builder(inst);
    const ModelStatistics stats = computeStatistics(builder.build());

    REQUIRE(stats.numVars == 10);
    REQUIRE(stats.numBinary == 7);
    REQUIRE(stats.numInteger == 2);
    REQUIRE(stats.numContinuous == 1);

    REQUIRE(builder.orderVars().size() == 4);
    REQUIRE(builder.aisleVars().size() == 3);
}

/**
 * @test WaveModel::VariableBounds
 * @brief N in [lower, upper], D in [1, numAisles], Z in [0, +inf)
 */
TEST_CASE("A2: WaveModel::VariableBounds", "[WaveModel][variables]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    WaveModelBuilder builder(inst);
    builder.build();

    REQUIRE(builder.unitsVar().get(GRB_DoubleAttr_LB) == Catch::Approx(4.0));
    REQUIRE(builder.unitsVar().get(GRB_DoubleAttr_UB) == Catch::Approx(12.0));
    REQUIRE(builder.unitsVar().get(GRB_CharAttr_VType) == GRB_INTEGER);

    REQUIRE(builder.aislesVar().get(GRB_DoubleAttr_LB) == Catch::Approx(1.0));
    REQUIRE(builder.aislesVar().get(GRB_DoubleAttr_UB) == Catch::Approx(3.0));
    REQUIRE(builder.aislesVar().get(GRB_CharAttr_VType) == GRB_INTEGER);

    REQUIRE(builder.ratioVar().get(GRB_DoubleAttr_LB) == Catch::Approx(0.0));
    REQUIRE(builder.ratioVar().get(GRB_DoubleAttr_UB) >= GRB_INFINITY);
    REQUIRE(builder.ratioVar().get(GRB_CharAttr_VType) == GRB_CONTINUOUS);

    REQUIRE(builder.orderVars()(0).get(GRB_CharAttr_VType) == GRB_BINARY);
    REQUIRE(builder.aisleVars()(2).get(GRB_CharAttr_VType) == GRB_BINARY);
}

/**
 * @test WaveModel::ObjectiveIsRatioVariable
 * @brief maximize Z, with no other objective terms
 */
TEST_CASE("A3: WaveModel::ObjectiveIsRatioVariable", "[WaveModel][objective]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    WaveModelBuilder builder(inst);
    builder.build();

    REQUIRE(builder.model().get(GRB_IntAttr_ModelSense) == GRB_MAXIMIZE);
    REQUIRE(builder.ratioVar().get(GRB_DoubleAttr_Obj) == Catch::Approx(1.0));
    REQUIRE(builder.unitsVar().get(GRB_DoubleAttr_Obj) == Catch::Approx(0.0));
    REQUIRE(builder.orderVars()(1).get(GRB_DoubleAttr_Obj) == Catch::Approx(0.0));
}

// ============================================================================
// SECTION B: CONSTRAINT ROWS AND COEFFICIENTS
// ============================================================================

/**
 * @test WaveModel::RowCounts
 * @brief One capacity row per active item plus three linking rows
 */
TEST_CASE("B1: WaveModel::RowCounts", "[WaveModel][constraints]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    WaveModelBuilder builder(inst);
    builder.build();

    REQUIRE(builder.constraints()(WaveCons::Capacity).size() == 4);
    REQUIRE(builder.constraints()(WaveCons::AisleCount).isScalar());
    REQUIRE(builder.constraints()(WaveCons::UnitCount).isScalar());
    REQUIRE(builder.constraints()(WaveCons::RatioCut).isScalar());
    REQUIRE(builder.constraints().rowCount() == 7);
    REQUIRE(builder.model().get(GRB_IntAttr_NumConstrs) == 7);
}

/**
 * @test WaveModel::UnusedItemsHaveNoRow
 * @brief Items in no order and no aisle get no capacity row
 *
 * @given 4 items, only items 0 and 3 occur
 */
TEST_CASE("B2: WaveModel::UnusedItemsHaveNoRow", "[WaveModel][constraints]")
{
    using wavepick::testing::items;
    const Instance inst({ items({ { 0, 2 } }), items({ { 3, 1 } }) },
                        { items({ { 0, 5 }, { 3, 5 } }) }, 4, WaveBounds{ 1, 5 });
    WaveModelBuilder builder(inst);
    builder.build();

    const ConstraintGroup& cap = builder.constraints()(WaveCons::Capacity);
    REQUIRE(cap.size() == 2);

    std::vector<int> rowItems;
    cap.forEach([&](const GRBConstr&, int item) { rowItems.push_back(item); });
    REQUIRE(rowItems == std::vector<int>{ 0, 3 });
    REQUIRE_THROWS_AS(cap.at(1), std::out_of_range);
    REQUIRE_THROWS_AS(cap.at(2), std::out_of_range);
}

/**
 * @test WaveModel::CapacityCoefficients
 * @brief Demand enters with +q on orders, supply with −q on aisles, rhs 0
 *
 * @given item 1: order 0 needs 1, order 1 needs 3; aisle 0 has 4, aisle 2 has 1
 */
TEST_CASE("B3: WaveModel::CapacityCoefficients", "[WaveModel][constraints]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    WaveModelBuilder builder(inst);
    builder.build();

    const GRBConstr& row = builder.constraints()(WaveCons::Capacity)(1);
    auto& X = builder.orderVars();
    auto& Y = builder.aisleVars();

    REQUIRE(sense(row) == GRB_LESS_EQUAL);
    REQUIRE(rhs(row) == Catch::Approx(0.0));

    REQUIRE(coeff(builder, row, X(0)) == Catch::Approx(1.0));
    REQUIRE(coeff(builder, row, X(1)) == Catch::Approx(3.0));
    REQUIRE(coeff(builder, row, X(2)) == Catch::Approx(0.0));
    REQUIRE(coeff(builder, row, X(3)) == Catch::Approx(0.0));

    REQUIRE(coeff(builder, row, Y(0)) == Catch::Approx(-4.0));
    REQUIRE(coeff(builder, row, Y(1)) == Catch::Approx(0.0));
    REQUIRE(coeff(builder, row, Y(2)) == Catch::Approx(-1.0));

    REQUIRE(builder.model().getRow(row).size() == 4);
}

/**
 * @test WaveModel::LinkingRows
 * @brief Σ aisle = D and Σ orderUnits·order = N
 */
TEST_CASE("B4: WaveModel::LinkingRows", "[WaveModel][constraints]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    WaveModelBuilder builder(inst);
    builder.build();

    const GRBConstr& aisles = builder.constraints()(WaveCons::AisleCount).scalar();
    REQUIRE(sense(aisles) == GRB_EQUAL);
    REQUIRE(rhs(aisles) == Catch::Approx(0.0));
    for (int a = 0; a < 3; ++a) {
        REQUIRE(coeff(builder, aisles, builder.aisleVars()(a)) == Catch::Approx(1.0));
    }
    REQUIRE(coeff(builder, aisles, builder.aislesVar()) == Catch::Approx(-1.0));

    const GRBConstr& units = builder.constraints()(WaveCons::UnitCount).scalar();
    REQUIRE(sense(units) == GRB_EQUAL);
    REQUIRE(rhs(units) == Catch::Approx(0.0));
    const double expected[] = { 3.0, 3.0, 4.0, 6.0 };
    for (int o = 0; o < 4; ++o) {
        REQUIRE(coeff(builder, units, builder.orderVars()(o)) == Catch::Approx(expected[o]));
    }
    REQUIRE(coeff(builder, units, builder.unitsVar()) == Catch::Approx(-1.0));
}

/**
 * @test WaveModel::RatioCut
 * @brief Z − N + UB·D ≤ UB·numAisles
 *
 * @given UB = 12, 3 aisles
 * @then coefficients (1, −1, 12), rhs 36
 */
TEST_CASE("B5: WaveModel::RatioCut", "[WaveModel][constraints]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    WaveModelBuilder builder(inst);
    builder.build();

    const GRBConstr& cut = builder.constraints()(WaveCons::RatioCut).scalar();

    REQUIRE(sense(cut) == GRB_LESS_EQUAL);
    REQUIRE(rhs(cut) == Catch::Approx(36.0));
    REQUIRE(coeff(builder, cut, builder.ratioVar()) == Catch::Approx(1.0));
    REQUIRE(coeff(builder, cut, builder.unitsVar()) == Catch::Approx(-1.0));
    REQUIRE(coeff(builder, cut, builder.aislesVar()) == Catch::Approx(12.0));
    REQUIRE(builder.model().getRow(cut).size() == 3);
}

// ============================================================================
// SECTION C: PARAMETERS AND METADATA
// ============================================================================

/**
 * @test WaveModel::StoreMetadata
 * @brief Capacity row and entry counts are recorded at build time
 */
TEST_CASE("C1: WaveModel::StoreMetadata", "[WaveModel][store]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    WaveModelBuilder builder(inst);
    builder.build();

    REQUIRE(builder.store()["model:capacityRows"].get<int>() == 4);
    REQUIRE(builder.store()["model:entries"].get<int>() == 12);
}

/**
 * @test WaveModel::LimitsApplied
 * @brief setLimits values reach Gurobi and the store on optimize()
 */
TEST_CASE("C2: WaveModel::LimitsApplied", "[WaveModel][parameters]")
{
    const Instance inst = wavepick::testing::scenarioA();
    WaveModelBuilder builder(inst);

    SolveLimits limits;
    limits.timeLimit = 30.0;
    limits.mipGap = 1e-6;
    limits.threads = 1;
    builder.setLimits(limits);
    builder.optimize();

    REQUIRE(builder.store()["param:TimeLimit"].get<double>() == Catch::Approx(30.0));
    REQUIRE(builder.store()["param:MIPGap"].get<double>() == Catch::Approx(1e-6));
    REQUIRE(builder.store()["param:Threads"].get<int>() == 1);
    REQUIRE(builder.store()["param:OutputFlag"].get<int>() == 0);

    REQUIRE(builder.model().get(GRB_DoubleParam_TimeLimit) == Catch::Approx(30.0));
    REQUIRE(builder.model().get(GRB_IntParam_Threads) == 1);
}

// ============================================================================
// SECTION D: OPTIMIZING THE SCENARIOS
// ============================================================================

/**
 * @test WaveModel::ScenarioA
 * @brief Single order, single aisle: Z = N = 5
 */
TEST_CASE("D1: WaveModel::ScenarioA", "[WaveModel][solve]")
{
    const Instance inst = wavepick::testing::scenarioA();
    WaveModelBuilder builder(inst);
    builder.optimize();

    REQUIRE(builder.isOptimal());
    REQUIRE(builder.objVal() == Catch::Approx(5.0));
    REQUIRE(values(builder.orderVars())[0] > 0.5);
    REQUIRE(values(builder.aisleVars())[0] > 0.5);
}

/**
 * @test WaveModel::ScenarioB
 * @brief Supply 3 against demand 5 leaves N = 0 below the lower bound
 */
TEST_CASE("D2: WaveModel::ScenarioB", "[WaveModel][solve]")
{
    const Instance inst = wavepick::testing::scenarioB();
    WaveModelBuilder builder(inst);
    builder.optimize();

    REQUIRE(builder.isInfeasible());
    REQUIRE_FALSE(builder.hasSolution());
}

/**
 * @test WaveModel::ScenarioC
 * @brief Only the 6-unit order fits the [5, 8] band
 */
TEST_CASE("D3: WaveModel::ScenarioC", "[WaveModel][solve]")
{
    const Instance inst = wavepick::testing::scenarioC();
    WaveModelBuilder builder(inst);
    builder.optimize();

    REQUIRE(builder.isOptimal());
    REQUIRE(builder.objVal() == Catch::Approx(6.0));

    const std::vector<double> orders = values(builder.orderVars());
    REQUIRE(orders[0] < 0.5);
    REQUIRE(orders[1] > 0.5);
    REQUIRE(value(builder.unitsVar()) == Catch::Approx(6.0));
}

/**
 * @test WaveModel::ScenarioD
 * @brief Two identical aisles: the cut rewards visiting exactly one
 *
 * @then D = 1 and Z = 5 + 10·(2 − 1) = 15
 */
TEST_CASE("D4: WaveModel::ScenarioD", "[WaveModel][solve]")
{
    const Instance inst = wavepick::testing::scenarioD();
    WaveModelBuilder builder(inst);
    builder.optimize();

    REQUIRE(builder.isOptimal());
    REQUIRE(builder.objVal() == Catch::Approx(15.0));
    REQUIRE(value(builder.aislesVar()) == Catch::Approx(1.0));
    REQUIRE(total(values(builder.aisleVars())) == Catch::Approx(1.0));
}

/**
 * @test WaveModel::MixedInstance
 * @brief Orders {0, 1} from aisle 0 give the largest surrogate, Z = 30
 */
TEST_CASE("D5: WaveModel::MixedInstance", "[WaveModel][solve]")
{
    const Instance inst = wavepick::testing::mixedInstance();
    WaveModelBuilder builder(inst);
    builder.optimize();

    REQUIRE(builder.isOptimal());
    REQUIRE(builder.objVal() == Catch::Approx(30.0));

    const std::vector<double> orders = values(builder.orderVars());
    const std::vector<double> aisles = values(builder.aisleVars());
    REQUIRE(orders[0] > 0.5);
    REQUIRE(orders[1] > 0.5);
    REQUIRE(orders[2] < 0.5);
    REQUIRE(orders[3] < 0.5);
    REQUIRE(aisles[0] > 0.5);
    REQUIRE(aisles[1] < 0.5);
    REQUIRE(aisles[2] < 0.5);

    // item 1: 1 + 3 picked of 4 stocked; item 0: 2 picked of 3
    const ConstraintGroup& cap = builder.constraints()(WaveCons::Capacity);
    REQUIRE(slack(cap(1)) == Catch::Approx(0.0).margin(1e-6));
    REQUIRE(slack(cap(0)) == Catch::Approx(1.0));
}

/**
 * @test WaveModel::NoSolution
 * @brief Total demand 10 cannot reach the lower bound 100
 */
TEST_CASE("D6: WaveModel::NoSolution", "[WaveModel][solve]")
{
    const Instance inst = wavepick::testing::noSolutionInstance();
    WaveModelBuilder builder(inst);
    builder.optimize();

    REQUIRE(builder.isInfeasible());
}
