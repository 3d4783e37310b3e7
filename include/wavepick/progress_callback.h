#pragma once
/*
===============================================================================
PROGRESS CALLBACK — Incumbent logging and budget enforcement
===============================================================================

Attached by GurobiEngine to every solve.

• onIncumbent: the incumbent's order/aisle values are turned into a candidate
  wave and its true ratio is logged next to the surrogate Z, which makes the
  gap between the linearized objective and the real one visible during the
  search.
• onProgress and onIncumbent: once the caller's TimeBudget has only its
  reserve left, the search is aborted. Gurobi then stops with
  GRB_INTERRUPTED and keeps the best incumbent.

===============================================================================
*/

#include "callbacks.h"
#include "extractor.h"
#include "instance.h"
#include "logging.h"
#include "objective.h"
#include "time_budget.h"
#include "variables.h"

namespace wavepick {

    class WaveProgressCallback : public MIPCallback {
    public:
        /**
         * @param deadline caller's overall budget, or nullptr to rely on
         *                 Gurobi's TimeLimit alone
         */
        WaveProgressCallback(const Instance& instance,
                             const VariableGroup& orders,
                             const VariableGroup& aisles,
                             const TimeBudget* deadline)
            : instance_(instance), orders_(orders), aisles_(aisles), deadline_(deadline) {
        }

        int incumbents() const noexcept { return incumbents_; }
        bool abortedForBudget() const noexcept { return aborted_; }

    protected:
        void onIncumbent(const CallbackSolution& sol) override {
            ++incumbents_;
            const CandidateSolution wave = extractSolution(sol.getValues(orders_), sol.getValues(aisles_));
            log::info("incumbent {}: Z = {:.4f}, ratio = {:.4f} ({} orders, {} aisles)",
                incumbents_, incumbentObjective(), score(instance_, wave),
                wave.orders().size(), wave.aisles().size());
            stopAtReserve(progress());
        }

        void onProgress(const Progress& p) override {
            stopAtReserve(p);
        }

    private:
        void stopAtReserve(const Progress& p) {
            if (aborted_ || deadline_ == nullptr || !deadline_->reserveReached()) {
                return;
            }
            aborted_ = true;
            log::warning("time budget reserve reached after {:.1f}s of search ({} incumbents), stopping",
                p.runtime, p.solutionCount);
            abort();
        }

        const Instance& instance_;
        const VariableGroup& orders_;
        const VariableGroup& aisles_;
        const TimeBudget* deadline_;

        int incumbents_ = 0;
        bool aborted_ = false;
    };

} // namespace wavepick
