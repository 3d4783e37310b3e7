#pragma once
/*
===============================================================================
OBJECTIVE — True wave ratio: units picked per aisle visited
===============================================================================

The MILP maximizes a surrogate variable Z. The reported quality of a wave is
always recomputed here from the instance, never taken from the engine:

    score = (sum of orderUnits over selected orders) / |visited aisles|

A wave with no orders or no aisles scores 0. Indices are not validated; run
checkFeasibility first.

WaveRatio keeps the numerator and denominator as integers for exact
comparison (a/b < c/d  <=>  a*d < c*b).

===============================================================================
*/

#include "instance.h"
#include "solution.h"

namespace wavepick {

    struct WaveRatio {
        long long units = 0;
        long long aisles = 0;

        double value() const noexcept {
            return aisles == 0 ? 0.0 : static_cast<double>(units) / static_cast<double>(aisles);
        }

        /// @brief Exact comparison by cross-multiplication; empty ratios compare as 0
        friend bool operator<(const WaveRatio& a, const WaveRatio& b) noexcept {
            if (a.aisles == 0 || b.aisles == 0) {
                return a.value() < b.value();
            }
            return a.units * b.aisles < b.units * a.aisles;
        }

        friend bool operator==(const WaveRatio& a, const WaveRatio& b) noexcept {
            if (a.aisles == 0 || b.aisles == 0) {
                return a.value() == b.value();
            }
            return a.units * b.aisles == b.units * a.aisles;
        }
    };

    /// @brief Sum of requested units over the selected orders
    inline long long unitsPicked(const Instance& instance, const CandidateSolution& solution) {
        long long units = 0;
        for (int o : solution.orders()) {
            units += instance.orderUnits(o);
        }
        return units;
    }

    inline WaveRatio exactScore(const Instance& instance, const CandidateSolution& solution) {
        if (solution.empty()) {
            return {};
        }
        return { unitsPicked(instance, solution), static_cast<long long>(solution.aisles().size()) };
    }

    inline double score(const Instance& instance, const CandidateSolution& solution) {
        return exactScore(instance, solution).value();
    }

} // namespace wavepick
