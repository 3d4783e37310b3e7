#pragma once
/*
===============================================================================
TIME BUDGET — Solver time derived from an external clock
===============================================================================

The caller owns the wall clock. TimeBudget only asks it, through the elapsed
query supplied at construction, how many seconds have passed, and derives

    remaining()     = max(0, total - elapsed)
    solverBudget()  = max(0, min(cap, remaining - reserve))

With the defaults (600 s total, 540 s cap, 30 s reserve) a solve started at
t=0 gets 540 s, one started at t=100 gets 470 s.

    auto budget = TimeBudget::startingNow(600, 540, 30);
    ...
    double seconds = budget.solverBudget();

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <functional>
#include <stdexcept>
#include <utility>

namespace wavepick {

    class TimeBudget {
    public:
        /// @brief Seconds elapsed since the process (or harness) started
        using ElapsedFn = std::function<double()>;

        /**
         * @throws std::invalid_argument for negative or non-finite durations or a missing clock
         */
        TimeBudget(double totalSeconds, double solverCapSeconds, double reserveSeconds, ElapsedFn elapsed)
            : total_(totalSeconds),
              cap_(solverCapSeconds),
              reserve_(reserveSeconds),
              elapsed_(std::move(elapsed))
        {
            if (!(total_ >= 0.0 && cap_ >= 0.0 && reserve_ >= 0.0) ||
                !std::isfinite(total_) || !std::isfinite(cap_) || !std::isfinite(reserve_)) {
                throw std::invalid_argument(
                    std::format("TimeBudget: durations must be finite and non-negative (total {}, cap {}, reserve {})",
                        total_, cap_, reserve_));
            }
            if (!elapsed_) {
                throw std::invalid_argument("TimeBudget: elapsed-time query is empty");
            }
        }

        /// @brief Budget measured from now on a steady clock
        static TimeBudget startingNow(double totalSeconds, double solverCapSeconds, double reserveSeconds)
        {
            const auto start = std::chrono::steady_clock::now();
            return TimeBudget(totalSeconds, solverCapSeconds, reserveSeconds, [start] {
                return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            });
        }

        double total() const noexcept { return total_; }
        double solverCap() const noexcept { return cap_; }
        double reserve() const noexcept { return reserve_; }

        double elapsed() const { return elapsed_(); }

        double remaining() const {
            return std::max(0.0, total_ - elapsed());
        }

        /// @brief Seconds the engine may use now; 0 when nothing is left
        double solverBudget() const {
            return std::max(0.0, std::min(cap_, remaining() - reserve_));
        }

        /// @brief True once only the reserve (or less) is left
        bool reserveReached() const {
            return remaining() <= reserve_;
        }

    private:
        double total_;
        double cap_;
        double reserve_;
        ElapsedFn elapsed_;
    };

} // namespace wavepick
