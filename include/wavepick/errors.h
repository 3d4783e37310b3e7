#pragma once
/*
===============================================================================
ERRORS — Exception types and solve outcome codes
===============================================================================

Two families:

• Exceptions for inputs that must never reach the solver:
    ModelConstructionError  invalid instance (bad item index, negative
                            quantity, inverted wave bounds)
    InstanceFormatError     unreadable instance or solution text

• SolveStatus codes for outcomes of a solve attempt. These are results, not
  exceptions: "no feasible wave" is a legitimate answer.

===============================================================================
*/

#include <stdexcept>
#include <string>
#include <string_view>

namespace wavepick {

    /**
     * @brief Instance data violates the input contract
     *
     * @details Thrown by Instance construction; nothing has been built or
     *          solved when it is raised.
     */
    class ModelConstructionError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /**
     * @brief Instance or solution text could not be parsed
     *
     * @details line() is 1-based; 0 means the error is not tied to a line
     *          (e.g. the file could not be opened).
     */
    class InstanceFormatError : public std::runtime_error {
    public:
        InstanceFormatError(const std::string& what, int line = 0)
            : std::runtime_error(line > 0
                ? "line " + std::to_string(line) + ": " + what
                : what),
              line_(line) {
        }

        int line() const noexcept { return line_; }

    private:
        int line_;
    };

    /**
     * @brief Outcome of WaveSolver::solve
     */
    enum class SolveStatus {
        Solved,                 ///< validated wave available (see provenOptimal)
        NoFeasibleAssignment,   ///< engine proved the model infeasible
        PostSolveInfeasible,    ///< engine answer rejected by the feasibility re-check
        TimeBudgetExhausted,    ///< budget spent without an incumbent
        EngineFailure           ///< engine error (numerics, license, resources)
    };

    inline std::string_view solveStatusName(SolveStatus status) {
        switch (status) {
            case SolveStatus::Solved:               return "SOLVED";
            case SolveStatus::NoFeasibleAssignment: return "NO_FEASIBLE_ASSIGNMENT";
            case SolveStatus::PostSolveInfeasible:  return "POST_SOLVE_INFEASIBLE";
            case SolveStatus::TimeBudgetExhausted:  return "TIME_BUDGET_EXHAUSTED";
            case SolveStatus::EngineFailure:        return "ENGINE_FAILURE";
        }
        return "UNKNOWN";
    }

} // namespace wavepick
