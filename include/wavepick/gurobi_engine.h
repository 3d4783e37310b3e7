#pragma once
/*
===============================================================================
GUROBI ENGINE — OptimizationEngine backed by the Gurobi C++ API
===============================================================================

solve() applies the limits to the formulation, attaches a
WaveProgressCallback, optimizes and translates the Gurobi status:

| Gurobi status                                   | EngineStatus           |
|-------------------------------------------------|------------------------|
| OPTIMAL                                         | Optimal                |
| TIME_LIMIT, INTERRUPTED, NODE_LIMIT,            | Incumbent if SolCount  |
| WORK_LIMIT, MEM_LIMIT, SOLUTION_LIMIT,          | > 0                    |
| SUBOPTIMAL                                      |                        |
| TIME_LIMIT, INTERRUPTED without a solution      | TimeLimitNoIncumbent   |
| INFEASIBLE, INF_OR_UNBD                         | Infeasible             |
| anything else (NUMERIC, ...), GRBException      | Error                  |

INF_OR_UNBD counts as infeasible: N and D are bounded, so the ratio row
bounds Z and the model cannot be unbounded.

===============================================================================
*/

#include <format>

#include "gurobi_c++.h"

#include "data_store.h"
#include "diagnostics.h"
#include "engine.h"
#include "logging.h"
#include "progress_callback.h"
#include "variables.h"
#include "wave_model.h"

namespace wavepick {

    class GurobiEngine : public OptimizationEngine {
    public:
        EngineResult solve(WaveModelBuilder& formulation, const SolveLimits& limits) override
        {
            EngineResult result;
            try {
                formulation.setLimits(limits);
                GRBModel& model = formulation.build();
                log::info("model: {}", modelSummary(model));

                const DataStore& meta = formulation.store();
                log::debug("formulation: {} capacity rows over {} instance entries",
                    meta.at("model:capacityRows").get<int>(), meta.at("model:entries").get<int>());

                WaveProgressCallback progress(formulation.instance(),
                    formulation.orderVars(), formulation.aisleVars(), limits.deadline);
                CallbackScope scope(model, progress);

                log::info("optimizing with {:.1f}s time limit, gap {:g}, threads {}",
                    limits.timeLimit, limits.mipGap, limits.threads);
                formulation.optimize();

                const int status = formulation.status();
                result.runtime = formulation.runtime();
                result.status = translate(status, formulation.solutionCount());
                result.detail = statusString(status);
                result.stoppedAtReserve = progress.abortedForBudget();
                log::info("gurobi status {} after {:.2f}s, {} incumbents",
                    result.detail, result.runtime, progress.incumbents());

                if (result.hasAssignment()) {
                    result.orderValues = values(formulation.orderVars());
                    result.aisleValues = values(formulation.aisleVars());
                    result.objective = formulation.objVal();
                    result.bound = formulation.objBound();
                    result.gap = formulation.mipGap();
                }
            }
            catch (const GRBException& e) {
                result = EngineResult{};
                result.status = EngineStatus::Error;
                result.detail = std::format("Gurobi error {}: {}", e.getErrorCode(), e.getMessage());
            }
            return result;
        }

        static EngineStatus translate(int status, int solutionCount)
        {
            switch (status) {
                case GRB_OPTIMAL:
                    return EngineStatus::Optimal;
                case GRB_INFEASIBLE:
                case GRB_INF_OR_UNBD:
                    return EngineStatus::Infeasible;
                case GRB_TIME_LIMIT:
                case GRB_INTERRUPTED:
                    return solutionCount > 0 ? EngineStatus::Incumbent : EngineStatus::TimeLimitNoIncumbent;
                case GRB_NODE_LIMIT:
                case GRB_WORK_LIMIT:
                case GRB_MEM_LIMIT:
                case GRB_SOLUTION_LIMIT:
                case GRB_SUBOPTIMAL:
                    return solutionCount > 0 ? EngineStatus::Incumbent : EngineStatus::Error;
                default:
                    return EngineStatus::Error;
            }
        }

    private:
        /// Detaches the callback when the solve ends, also on exceptions
        class CallbackScope {
        public:
            CallbackScope(GRBModel& model, GRBCallback& callback) : model_(model) {
                model_.setCallback(&callback);
            }

            ~CallbackScope() {
                try {
                    model_.setCallback(nullptr);
                }
                catch (const GRBException& e) {
                    log::warning("could not detach callback: {}", e.getMessage());
                }
            }

            CallbackScope(const CallbackScope&) = delete;
            CallbackScope& operator=(const CallbackScope&) = delete;

        private:
            GRBModel& model_;
        };
    };

} // namespace wavepick
