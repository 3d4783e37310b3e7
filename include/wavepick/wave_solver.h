#pragma once
/*
===============================================================================
WAVE SOLVER — Formulate, solve, extract, verify, score
===============================================================================

Overview
--------
WaveSolver runs one solve attempt for one instance:

    budget   = timeBudget.solverBudget()        0 -> TimeBudgetExhausted
    model    = WaveModelBuilder(instance)       fresh env + model
    answer   = engine.solve(model, limits)
    wave     = extractSolution(answer)          order/aisle values > 0.5
    report   = checkFeasibility(instance, wave) rejected -> PostSolveInfeasible
    score    = score(instance, wave)            true ratio, never Z

Outcome mapping
---------------
| Engine status          | SolveStatus                                   |
|------------------------|-----------------------------------------------|
| Optimal                | Solved, provenOptimal = true                  |
| Incumbent              | Solved, provenOptimal = false                 |
| Infeasible             | NoFeasibleAssignment                          |
| TimeLimitNoIncumbent   | TimeBudgetExhausted                           |
| Error                  | EngineFailure                                 |

A Solved result always carries a wave that passed the feasibility re-check;
every other status carries none. Nothing is retried.

===============================================================================
*/

#include <format>
#include <optional>
#include <string>

#include "gurobi_c++.h"

#include "config.h"
#include "diagnostics.h"
#include "engine.h"
#include "errors.h"
#include "extractor.h"
#include "feasibility.h"
#include "instance.h"
#include "logging.h"
#include "objective.h"
#include "solution.h"
#include "time_budget.h"
#include "wave_model.h"

namespace wavepick {

    struct SolveResult {
        SolveStatus status = SolveStatus::EngineFailure;
        std::optional<CandidateSolution> solution;

        double score = 0.0;             ///< true units / aisles ratio
        double engineObjective = 0.0;   ///< surrogate Z reported by the engine
        double engineBound = 0.0;
        double runtime = 0.0;
        bool provenOptimal = false;

        std::string message;

        bool ok() const noexcept {
            return status == SolveStatus::Solved && solution.has_value();
        }
    };

    class WaveSolver {
    public:
        /**
         * @throws std::invalid_argument if the configuration is invalid
         */
        WaveSolver(const Instance& instance, OptimizationEngine& engine, SolverConfig config = {})
            : instance_(instance), engine_(engine), config_(config)
        {
            config_.validate();
        }

        const SolverConfig& config() const noexcept { return config_; }

        SolveResult solve(const TimeBudget& timeBudget)
        {
            SolveResult result;

            const double budget = timeBudget.solverBudget();
            if (budget <= 0.0) {
                result.status = SolveStatus::TimeBudgetExhausted;
                result.message = std::format("no solver time left ({:.1f}s elapsed of {:.1f}s, {:.1f}s reserved)",
                    timeBudget.elapsed(), timeBudget.total(), timeBudget.reserve());
                log::warning("{}", result.message);
                return result;
            }

            log::info("instance: {} orders, {} aisles, {} items, wave bounds [{}, {}]",
                instance_.numOrders(), instance_.numAisles(), instance_.numItems(),
                instance_.bounds().lower, instance_.bounds().upper);

            WaveModelBuilder formulation(instance_);
            SolveLimits limits;
            limits.timeLimit = budget;
            limits.mipGap = config_.mipGap;
            limits.threads = config_.threads;
            limits.solverOutput = config_.solverOutput;
            limits.deadline = &timeBudget;

            const EngineResult answer = engine_.solve(formulation, limits);
            result.runtime = answer.runtime;

            switch (answer.status) {
                case EngineStatus::Infeasible:
                    return fail(result, SolveStatus::NoFeasibleAssignment,
                        "the model has no feasible wave");
                case EngineStatus::TimeLimitNoIncumbent:
                    return fail(result, SolveStatus::TimeBudgetExhausted,
                        std::format("{} reached after {:.1f}s without a feasible wave",
                            answer.stoppedAtReserve ? "time budget reserve" : "time limit", answer.runtime));
                case EngineStatus::Error:
                    return fail(result, SolveStatus::EngineFailure,
                        answer.detail.empty() ? std::string("engine error") : answer.detail);
                case EngineStatus::Optimal:
                case EngineStatus::Incumbent:
                    break;
            }

            result.engineObjective = answer.objective;
            result.engineBound = answer.bound;

            CandidateSolution wave = extractSolution(answer.orderValues, answer.aisleValues);
            const FeasibilityReport report = checkFeasibility(instance_, wave);
            if (!report.feasible) {
                log::error("engine answer rejected by feasibility check: {}", report.describe());
                logViolations(formulation);
                return fail(result, SolveStatus::PostSolveInfeasible, report.describe());
            }

            result.status = SolveStatus::Solved;
            result.provenOptimal = answer.status == EngineStatus::Optimal;
            result.score = score(instance_, wave);
            result.message = std::format("{} orders, {} aisles, {} units",
                wave.orders().size(), wave.aisles().size(), report.totalUnits);
            result.solution = std::move(wave);

            log::info("wave: {}, ratio {:.4f} (surrogate Z {:.4f}){}",
                result.message, result.score, result.engineObjective,
                result.provenOptimal ? "" : ", not proven optimal");
            log::info("time remaining: {:.1f}s", timeBudget.remaining());
            return result;
        }

    private:
        static SolveResult fail(SolveResult& result, SolveStatus status, std::string message)
        {
            result.status = status;
            result.solution.reset();
            result.message = std::move(message);
            if (status == SolveStatus::EngineFailure) {
                log::error("{}: {}", solveStatusName(status), result.message);
            }
            else {
                log::warning("{}: {}", solveStatusName(status), result.message);
            }
            return result;
        }

        /// Gurobi's own violation metrics, when the engine left a solved model behind
        static void logViolations(WaveModelBuilder& formulation)
        {
            if (!formulation.isBuilt()) {
                return;
            }
            try {
                if (!formulation.hasSolution()) {
                    return;
                }
                const SolutionQuality quality = computeSolutionQuality(formulation.model());
                log::error("solver violations: constraint max {:g} sum {:g}, bound {:g}, integrality {:g}",
                    quality.maxConstrViolation, quality.sumConstrViolation,
                    quality.maxBoundViolation, quality.maxIntViolation);
                formulation.constraints()(WaveCons::Capacity).forEach([](const GRBConstr& row, int item) {
                    const double s = slack(row);
                    if (s < -1e-6) {
                        log::error("solver violates capacity of item {} by {:g}", item, -s);
                    }
                });
            }
            catch (const GRBException& e) {
                log::warning("solver violations unavailable: {}", e.getMessage());
            }
        }

        const Instance& instance_;
        OptimizationEngine& engine_;
        SolverConfig config_;
    };

} // namespace wavepick
