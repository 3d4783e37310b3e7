#pragma once
/*
===============================================================================
ENGINE — Optimization engine capability interface
===============================================================================

The wave solver never calls Gurobi directly. It hands a built-on-demand
WaveModelBuilder and a set of limits to an OptimizationEngine and gets back
an EngineResult:

    Optimal                 assignment, proven optimal within the gap
    Incumbent               assignment, search stopped early (time limit,
                            interruption, other limits)
    Infeasible              the model has no feasible point
    TimeLimitNoIncumbent    stopped before any assignment was found
    Error                   engine failure (numerics, license, resources)

Order and aisle values are filled only when hasAssignment() is true.
GurobiEngine is the production implementation; tests substitute scripted
engines.

===============================================================================
*/

#include <string>
#include <string_view>
#include <vector>

#include "time_budget.h"

namespace wavepick {

    class WaveModelBuilder;

    enum class EngineStatus {
        Optimal,
        Incumbent,
        Infeasible,
        TimeLimitNoIncumbent,
        Error
    };

    inline std::string_view engineStatusName(EngineStatus status) {
        switch (status) {
            case EngineStatus::Optimal:              return "OPTIMAL";
            case EngineStatus::Incumbent:            return "INCUMBENT";
            case EngineStatus::Infeasible:           return "INFEASIBLE";
            case EngineStatus::TimeLimitNoIncumbent: return "TIME_LIMIT_NO_INCUMBENT";
            case EngineStatus::Error:                return "ERROR";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Knobs passed through to the engine unchanged
     *
     * @details deadline, when set, is the caller's overall budget; the engine
     *          may consult it during the search to stop before the reserve is
     *          consumed.
     */
    struct SolveLimits {
        double timeLimit = 540.0;
        double mipGap = 1e-15;
        int threads = 0;
        bool solverOutput = false;
        const TimeBudget* deadline = nullptr;
    };

    struct EngineResult {
        EngineStatus status = EngineStatus::Error;

        std::vector<double> orderValues;
        std::vector<double> aisleValues;

        double objective = 0.0;   ///< surrogate Z, not the wave ratio
        double bound = 0.0;
        double gap = 0.0;
        double runtime = 0.0;

        /// the search was cut short because the caller's deadline hit its reserve
        bool stoppedAtReserve = false;

        std::string detail;

        bool hasAssignment() const noexcept {
            return status == EngineStatus::Optimal || status == EngineStatus::Incumbent;
        }
    };

    class OptimizationEngine {
    public:
        virtual ~OptimizationEngine() = default;

        /**
         * @brief Solve the formulation within the limits
         *
         * @details Implementations report failures through EngineResult and
         *          do not throw.
         */
        virtual EngineResult solve(WaveModelBuilder& formulation, const SolveLimits& limits) = 0;
    };

} // namespace wavepick
