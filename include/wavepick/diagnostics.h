#pragma once
/*
===============================================================================
DIAGNOSTICS — Model statistics and solution quality for solve reports
===============================================================================

Overview
--------
Free functions over a GRBModel, used by the engine and the solver to report
what was built and what came back:

    * statusString()           Gurobi status code -> "OPTIMAL", "TIME_LIMIT", ...
    * computeStatistics()      variable/constraint counts by type
    * modelSummary()           one-line summary for the log
    * computeSolutionQuality() Gurobi's own violation metrics for the loaded
                               solution, logged next to a failed re-validation

Typical Usage
-------------
    log::info("model: {}", modelSummary(builder.model()));
    log::info("status: {}", statusString(builder.status()));

    if (!report.feasible) {
        auto q = computeSolutionQuality(builder.model());
        log::error("max constraint violation {}", q.maxConstrViolation);
    }

===============================================================================
*/

#include <cmath>
#include <memory>
#include <string>

#include "gurobi_c++.h"

namespace wavepick {

    // =============================================================================
    // STATUS STRING CONVERSION
    // =============================================================================

    inline std::string statusString(int status) {
        switch (status) {
            case GRB_LOADED:          return "LOADED";
            case GRB_OPTIMAL:         return "OPTIMAL";
            case GRB_INFEASIBLE:      return "INFEASIBLE";
            case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
            case GRB_UNBOUNDED:       return "UNBOUNDED";
            case GRB_CUTOFF:          return "CUTOFF";
            case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
            case GRB_NODE_LIMIT:      return "NODE_LIMIT";
            case GRB_TIME_LIMIT:      return "TIME_LIMIT";
            case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
            case GRB_INTERRUPTED:     return "INTERRUPTED";
            case GRB_NUMERIC:         return "NUMERIC";
            case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
            case GRB_INPROGRESS:      return "INPROGRESS";
            case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
            default:                  return "UNKNOWN(" + std::to_string(status) + ")";
        }
    }

    // =============================================================================
    // MODEL STATISTICS
    // =============================================================================

    struct ModelStatistics {
        int numVars = 0;
        int numConstrs = 0;
        int numBinary = 0;
        int numInteger = 0;     ///< general integers, binaries excluded
        int numContinuous = 0;
        int numNonZeros = 0;
    };

    /**
     * @brief Counts of the built model
     * @note Call after ModelBuilder::build() (which updates the model)
     */
    inline ModelStatistics computeStatistics(const GRBModel& model) {
        ModelStatistics stats;

        stats.numVars = model.get(GRB_IntAttr_NumVars);
        stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
        stats.numBinary = model.get(GRB_IntAttr_NumBinVars);
        // NumIntVars counts binaries as well
        stats.numInteger = model.get(GRB_IntAttr_NumIntVars) - stats.numBinary;
        stats.numNonZeros = model.get(GRB_IntAttr_NumNZs);
        stats.numContinuous = stats.numVars - stats.numBinary - stats.numInteger;

        return stats;
    }

    /// @brief e.g. "1205 vars (1203 bin, 2 int), 842 constrs, 9311 nz"
    inline std::string modelSummary(const GRBModel& model) {
        auto stats = computeStatistics(model);

        std::string result = std::to_string(stats.numVars) + " vars";

        if (stats.numBinary > 0 || stats.numInteger > 0) {
            result += " (";
            if (stats.numBinary > 0) {
                result += std::to_string(stats.numBinary) + " bin";
                if (stats.numInteger > 0) result += ", ";
            }
            if (stats.numInteger > 0) {
                result += std::to_string(stats.numInteger) + " int";
            }
            result += ")";
        }

        result += ", " + std::to_string(stats.numConstrs) + " constrs";
        result += ", " + std::to_string(stats.numNonZeros) + " nz";

        return result;
    }

    // =============================================================================
    // SOLUTION QUALITY
    // =============================================================================

    struct SolutionQuality {
        double maxConstrViolation = 0.0;
        double sumConstrViolation = 0.0;
        double maxBoundViolation = 0.0;
        double maxIntViolation = 0.0;
    };

    /**
     * @brief Violation metrics of the loaded solution
     * @throws GRBException if the model has no solution
     */
    inline SolutionQuality computeSolutionQuality(const GRBModel& model) {
        SolutionQuality quality;

        quality.maxConstrViolation = model.get(GRB_DoubleAttr_MaxVio);
        quality.maxBoundViolation = model.get(GRB_DoubleAttr_BoundVio);
        quality.maxIntViolation = model.get(GRB_DoubleAttr_IntVio);

        std::unique_ptr<GRBConstr[]> constrs(model.getConstrs());
        int numConstrs = model.get(GRB_IntAttr_NumConstrs);

        for (int i = 0; i < numConstrs; ++i) {
            double s = constrs[i].get(GRB_DoubleAttr_Slack);
            char sense = constrs[i].get(GRB_CharAttr_Sense);

            // Slack is rhs - lhs for every sense
            if (sense == GRB_EQUAL) {
                quality.sumConstrViolation += std::abs(s);
            }
            else if (sense == GRB_LESS_EQUAL && s < 0) {
                quality.sumConstrViolation += -s;
            }
            else if (sense == GRB_GREATER_EQUAL && s > 0) {
                quality.sumConstrViolation += s;
            }
        }

        return quality;
    }

} // namespace wavepick
