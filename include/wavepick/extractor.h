#pragma once
/*
===============================================================================
EXTRACTOR — Engine assignment to candidate wave
===============================================================================

Binary variables come back from the engine as doubles that sit at 0 or 1 up
to the integrality tolerance. Index k is selected iff its value is strictly
greater than SELECTION_THRESHOLD.

    auto wave = extractSolution(result.orderValues, result.aisleValues);

===============================================================================
*/

#include <cstddef>
#include <set>
#include <vector>

#include "solution.h"

namespace wavepick {

    inline constexpr double SELECTION_THRESHOLD = 0.5;

    /// @brief Positions whose value is strictly above the threshold
    inline std::set<int> selectedIndices(const std::vector<double>& values) {
        std::set<int> selected;
        for (std::size_t k = 0; k < values.size(); ++k) {
            if (values[k] > SELECTION_THRESHOLD) {
                selected.insert(static_cast<int>(k));
            }
        }
        return selected;
    }

    inline CandidateSolution extractSolution(const std::vector<double>& orderValues,
                                             const std::vector<double>& aisleValues) {
        return CandidateSolution(selectedIndices(orderValues), selectedIndices(aisleValues));
    }

} // namespace wavepick
