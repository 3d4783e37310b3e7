#pragma once
/*
===============================================================================
WAVE MODEL — MILP formulation of one picking wave
===============================================================================

Variables
---------
    order[o]   binary        1 iff order o is in the wave
    aisle[a]   binary        1 iff aisle a is visited
    N          integer       [lower, upper]        units picked
    D          integer       [1, numAisles]        aisles visited
    Z          continuous    [0, +inf)             surrogate of N / D

Constraints
-----------
    cap[i]     Σ_o req(o,i)·order[o] − Σ_a avail(a,i)·aisle[a] ≤ 0
               one row per item that occurs in some order or aisle
    aisles     Σ_a aisle[a] = D
    units      Σ_o orderUnits(o)·order[o] = N
    ratio      Z − N + UB·D ≤ UB·numAisles

Objective
---------
    maximize Z

The ratio row is a single linear cut that bounds Z by N + UB·(numAisles − D);
it is not an exact reformulation of N / D. Answers are therefore re-checked
and re-scored from the instance (feasibility.h, objective.h).

Sparsity
--------
The capacity rows are assembled by first bucketing the (order, item) and
(aisle, item) entries per item, so building the model costs
O(numItems + entries) and never touches an order/aisle/item triple that has
no quantity.

Usage
-----
    WaveModelBuilder formulation(instance);
    formulation.setLimits(limits);
    formulation.optimize();
    auto picks = values(formulation.orderVars());

Each builder owns its own environment and model; build a new one per solve.

===============================================================================
*/

#include <cstddef>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "constraints.h"
#include "engine.h"
#include "enum_utils.h"
#include "expressions.h"
#include "indexing.h"
#include "instance.h"
#include "model_builder.h"
#include "variables.h"

namespace wavepick {

    WAVEPICK_DECLARE_ENUM_WITH_COUNT(WaveVars, Order, Aisle, Units, Aisles, Ratio);
    WAVEPICK_DECLARE_ENUM_WITH_COUNT(WaveCons, Capacity, AisleCount, UnitCount, RatioCut);

    class WaveModelBuilder : public ModelBuilder<WaveVars, WaveCons> {
    public:
        explicit WaveModelBuilder(const Instance& instance)
            : instance_(instance) {
        }

        const Instance& instance() const noexcept { return instance_; }

        /// @brief Limits applied on the next optimize()
        void setLimits(const SolveLimits& limits) { limits_ = limits; }
        const SolveLimits& limits() const noexcept { return limits_; }

        VariableGroup& orderVars() { return variables()(WaveVars::Order); }
        VariableGroup& aisleVars() { return variables()(WaveVars::Aisle); }
        GRBVar& unitsVar() { return variables()(WaveVars::Units).scalar(); }
        GRBVar& aislesVar() { return variables()(WaveVars::Aisles).scalar(); }
        GRBVar& ratioVar() { return variables()(WaveVars::Ratio).scalar(); }

    protected:
        void configureEnvironment(GRBEnv& env) override {
            // Keeps the license banner off the console unless output was asked for
            env.set(GRB_IntParam_OutputFlag, limits_.solverOutput ? 1 : 0);
        }

        void addVariables() override {
            const WaveBounds& bounds = instance_.bounds();

            variables().set(WaveVars::Order,
                VariableFactory::add(model(), GRB_BINARY, 0.0, 1.0, "order", instance_.numOrders()));
            variables().set(WaveVars::Aisle,
                VariableFactory::add(model(), GRB_BINARY, 0.0, 1.0, "aisle", instance_.numAisles()));

            variables().set(WaveVars::Units,
                VariableFactory::add(model(), GRB_INTEGER,
                    static_cast<double>(bounds.lower), static_cast<double>(bounds.upper), "N"));
            variables().set(WaveVars::Aisles,
                VariableFactory::add(model(), GRB_INTEGER,
                    1.0, static_cast<double>(instance_.numAisles()), "D"));
            variables().set(WaveVars::Ratio,
                VariableFactory::add(model(), GRB_CONTINUOUS, 0.0, GRB_INFINITY, "Z"));
        }

        void addConstraints() override {
            addCapacity();

            auto& X = orderVars();
            auto& Y = aisleVars();
            auto& N = unitsVar();
            auto& D = aislesVar();
            auto& Z = ratioVar();

            constraints().set(WaveCons::AisleCount,
                ConstraintFactory::add(model(), "aisles", [&] {
                    return sum(Y) == D;
                }));

            constraints().set(WaveCons::UnitCount,
                ConstraintFactory::add(model(), "units", [&] {
                    return sum(range(0, instance_.numOrders()), [&](int o) {
                        return static_cast<double>(instance_.orderUnits(o)) * X(o);
                    }) == N;
                }));

            const double ub = static_cast<double>(instance_.bounds().upper);
            const double rhs = ub * static_cast<double>(instance_.numAisles());
            constraints().set(WaveCons::RatioCut,
                ConstraintFactory::add(model(), "ratio", [&] {
                    return Z - N + ub * D <= rhs;
                }));

            store()["model:capacityRows"] = static_cast<int>(instance_.activeItems().size());
            store()["model:entries"] = static_cast<int>(instance_.entryCount());
        }

        void addObjective() override {
            maximize(ratioVar());
        }

        void addParameters() override {
            timeLimit(limits_.timeLimit);
            mipGapLimit(limits_.mipGap);
            threads(limits_.threads);
            if (limits_.solverOutput) {
                verbose();
            }
            else {
                quiet();
            }
        }

    private:
        using Entries = std::vector<std::pair<int, double>>;

        /// Per-item capacity rows from entries bucketed by item
        void addCapacity() {
            const auto numItems = static_cast<std::size_t>(instance_.numItems());
            std::vector<Entries> demand(numItems);
            std::vector<Entries> supply(numItems);

            for (int o = 0; o < instance_.numOrders(); ++o) {
                for (const auto& [item, qty] : instance_.order(o)) {
                    demand[static_cast<std::size_t>(item)].emplace_back(o, static_cast<double>(qty));
                }
            }
            for (int a = 0; a < instance_.numAisles(); ++a) {
                for (const auto& [item, qty] : instance_.aisle(a)) {
                    supply[static_cast<std::size_t>(item)].emplace_back(a, static_cast<double>(qty));
                }
            }

            auto& X = orderVars();
            auto& Y = aisleVars();

            constraints().set(WaveCons::Capacity,
                ConstraintFactory::addIndexed(model(), "cap", instance_.activeItems(), [&](int item) {
                    GRBLinExpr lhs = 0;
                    for (const auto& [o, qty] : demand[static_cast<std::size_t>(item)]) {
                        lhs += qty * X(o);
                    }
                    for (const auto& [a, qty] : supply[static_cast<std::size_t>(item)]) {
                        lhs -= qty * Y(a);
                    }
                    return lhs <= 0.0;
                }));
        }

        const Instance& instance_;
        SolveLimits limits_;
    };

} // namespace wavepick
