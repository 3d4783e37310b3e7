#pragma once
/*
===============================================================================
CALLBACKS — MIP callback base with named events
===============================================================================

Overview
--------
Gurobi reports search events through a single GRBCallback::callback() with a
`where` code. MIPCallback turns the events the wave solver cares about into
named virtual methods:

| Method         | When Called              | Wave solver use                       |
|----------------|--------------------------|---------------------------------------|
| onIncumbent()  | new incumbent (MIPSOL)   | log surrogate Z next to the true ratio|
| onProgress()   | periodically (MIP)       | stop at the caller's time budget      |

CallbackSolution gives read access to the incumbent inside onIncumbent();
abort() asks Gurobi to stop, after which the model reports GRB_INTERRUPTED
and keeps its best incumbent.

Thread Safety
-------------
Gurobi calls back from its own threads; overrides must not touch shared state
without synchronization (wavepick's logging is synchronized).

Exception Safety
----------------
std::exception thrown by an override is rethrown as GRBException with
GRB_ERROR_CALLBACK, which ends the optimization with an error.

===============================================================================
*/

#include <cmath>
#include <exception>
#include <string>
#include <vector>

#include "gurobi_c++.h"
#include "variables.h"

namespace wavepick {

    /**
     * @brief Search metrics available in MIP callbacks
     *
     * @note Values not reported at the current callback point keep their
     *       defaults.
     */
    struct Progress {
        double runtime = 0.0;
        double bestObj = GRB_INFINITY;
        double bestBound = -GRB_INFINITY;
        double gap = GRB_INFINITY;
        int nodeCount = 0;
        int solutionCount = 0;

        bool hasSolution() const noexcept {
            return solutionCount > 0;
        }
    };

    class MIPCallback;

    /**
     * @brief Incumbent values inside onIncumbent()
     *
     * @note Valid only during the callback invocation.
     */
    class CallbackSolution {
    public:
        /// @brief Values of a group in position order
        std::vector<double> getValues(const VariableGroup& vg) const;

    private:
        friend class MIPCallback;

        explicit CallbackSolution(MIPCallback* cb) : callback_(cb) {}

        MIPCallback* callback_;
    };

    class MIPCallback : public GRBCallback {
    public:
        virtual ~MIPCallback() = default;

        double getSolutionValue(const GRBVar& v) {
            return getSolution(v);
        }

    protected:
        virtual void onIncumbent(const CallbackSolution& sol) {
            (void)sol;
        }

        virtual void onProgress(const Progress& p) {
            (void)p;
        }

        /**
         * @brief Metrics at the current callback point
         */
        Progress progress() {
            Progress p;
            if (where == GRB_CB_MIP) {
                p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
                p.bestObj = getDoubleInfo(GRB_CB_MIP_OBJBST);
                p.bestBound = getDoubleInfo(GRB_CB_MIP_OBJBND);
                p.nodeCount = static_cast<int>(getDoubleInfo(GRB_CB_MIP_NODCNT));
                p.solutionCount = getIntInfo(GRB_CB_MIP_SOLCNT);
            }
            else if (where == GRB_CB_MIPSOL) {
                p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
                p.bestObj = getDoubleInfo(GRB_CB_MIPSOL_OBJBST);
                p.bestBound = getDoubleInfo(GRB_CB_MIPSOL_OBJBND);
                p.nodeCount = static_cast<int>(getDoubleInfo(GRB_CB_MIPSOL_NODCNT));
                p.solutionCount = getIntInfo(GRB_CB_MIPSOL_SOLCNT);
            }

            if (p.solutionCount > 0 && std::abs(p.bestObj) > 1e-10) {
                p.gap = std::abs(p.bestObj - p.bestBound) / std::abs(p.bestObj);
            }
            return p;
        }

        /// @brief Objective of the solution being reported in onIncumbent()
        double incumbentObjective() {
            return getDoubleInfo(GRB_CB_MIPSOL_OBJ);
        }

        /**
         * @brief Stop the optimization at the next opportunity
         */
        void abort() {
            GRBCallback::abort();
        }

    private:
        void callback() override {
            try {
                switch (where) {
                    case GRB_CB_MIPSOL: {
                        CallbackSolution sol(this);
                        onIncumbent(sol);
                        break;
                    }

                    case GRB_CB_MIP:
                        onProgress(progress());
                        break;

                    default:
                        break;
                }
            } catch (GRBException&) {
                throw;
            } catch (std::exception& e) {
                throw GRBException(e.what(), GRB_ERROR_CALLBACK);
            }
        }
    };

    inline std::vector<double> CallbackSolution::getValues(const VariableGroup& vg) const {
        std::vector<double> result;
        result.reserve(vg.size());
        vg.forEach([&](const GRBVar& v, int) {
            result.push_back(callback_->getSolutionValue(v));
        });
        return result;
    }

} // namespace wavepick
