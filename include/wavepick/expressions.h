#pragma once
/*
===============================================================================
EXPRESSIONS — Linear expression accumulation over index domains
===============================================================================

    sum_{i in I} f(i)   ->   sum(I, f)

f may return anything GRBLinExpr::operator+= accepts: GRBVar, a scaled
variable (coef * x), a GRBLinExpr or a constant.

    GRBLinExpr picked = sum(range(0, numOrders), [&](int o) {
        return instance.orderUnits(o) * X(o);
    });

    GRBLinExpr all = sum(Y);   // every variable of a group, coefficient 1

Each call builds a fresh expression; nothing is cached.

===============================================================================
*/

#include <utility>

#include "gurobi_c++.h"
#include "indexing.h"
#include "variables.h"

namespace wavepick {

    /**
     * @brief Sum of f(i) over the domain
     * @tparam Domain Iterable yielding int
     * @tparam Func Callable (int) -> term
     */
    template<typename Domain, typename Func>
    GRBLinExpr sum(const Domain& domain, Func&& f) {
        GRBLinExpr expr = 0;
        for (int i : domain) {
            expr += f(i);
        }
        return expr;
    }

    /// @brief Sum of all variables of a group with coefficient 1
    inline GRBLinExpr sum(const VariableGroup& vg) {
        GRBLinExpr expr = 0;
        vg.forEach([&](const GRBVar& v, int) {
            expr += v;
        });
        return expr;
    }

} // namespace wavepick
