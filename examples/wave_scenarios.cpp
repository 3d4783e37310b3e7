/*
================================================================================
WAVE SCENARIOS - Small waves with known answers
================================================================================
PROBLEM TYPE: Mixed-Integer Programming (MIP), fractional objective

SCENARIOS
---------
    A   1 order of 5 units, 1 aisle with 5 units, bounds [1,10]
        -> orders {0}, aisles {0}, ratio 5
    B   as A, but the aisle holds 3 units
        -> no feasible wave
    C   orders of 4 and 6 units, 1 aisle with 10 units, bounds [5,8]
        -> only the 6-unit order fits the band, ratio 6
    D   1 order of 5 units, 2 aisles with 5 units each, bounds [1,10]
        -> one aisle suffices, ratio 5
    E   bounds [100,200], 10 units in stock
        -> no feasible wave

Each scenario is solved with its own model, a 60 s budget and the default
gap, then its wave is re-checked and printed.

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <wavepick/wavepick.h>

namespace {

    struct Scenario {
        std::string name;
        wavepick::Instance instance;
        std::string expected;
    };

    /// One catalog entry: item -> quantity
    wavepick::ItemQuantities stock(int item, int qty) {
        return wavepick::ItemQuantities{ { item, qty } };
    }

    std::vector<Scenario> buildScenarios() {
        using wavepick::Instance;
        using wavepick::WaveBounds;

        std::vector<Scenario> scenarios;
        scenarios.push_back({ "A: exact stock",
            Instance({ stock(0, 5) }, { stock(0, 5) }, 1, WaveBounds{ 1, 10 }),
            "orders {0}, aisles {0}, ratio 5" });
        scenarios.push_back({ "B: short stock",
            Instance({ stock(0, 5) }, { stock(0, 3) }, 1, WaveBounds{ 1, 10 }),
            "no feasible wave" });
        scenarios.push_back({ "C: wave band",
            Instance({ stock(0, 4), stock(0, 6) }, { stock(0, 10) }, 1, WaveBounds{ 5, 8 }),
            "orders {1}, aisles {0}, ratio 6" });
        scenarios.push_back({ "D: redundant aisles",
            Instance({ stock(0, 5) }, { stock(0, 5), stock(0, 5) }, 1, WaveBounds{ 1, 10 }),
            "orders {0}, one aisle, ratio 5" });
        scenarios.push_back({ "E: band above stock",
            Instance({ stock(0, 5), stock(0, 5) }, { stock(0, 10) }, 1, WaveBounds{ 100, 200 }),
            "no feasible wave" });
        return scenarios;
    }

} // namespace

int main() {
    using namespace wavepick;

    std::cout << "================================================================\n";
    std::cout << "WAVE SCENARIOS\n";
    std::cout << "================================================================\n\n";

    try {
        setLogLevel(LogLevel::Warning);

        SolverConfig config;
        config.totalBudgetSeconds = 60.0;
        config.solverCapSeconds = 50.0;
        config.reserveSeconds = 5.0;

        GurobiEngine engine;
        for (const Scenario& scenario : buildScenarios()) {
            const TimeBudget budget = TimeBudget::startingNow(
                config.totalBudgetSeconds, config.solverCapSeconds, config.reserveSeconds);

            WaveSolver solver(scenario.instance, engine, config);
            const SolveResult result = solver.solve(budget);

            std::cout << std::left << std::setw(22) << scenario.name << std::right
                      << solveStatusName(result.status) << "\n";
            std::cout << "    expected: " << scenario.expected << "\n";

            if (result.ok()) {
                const FeasibilityReport report = checkFeasibility(scenario.instance, *result.solution);
                std::cout << "    found:    " << *result.solution
                          << ", ratio " << std::fixed << std::setprecision(2) << result.score
                          << " (" << report.describe() << ")\n";
            }
            else {
                std::cout << "    found:    " << result.message << "\n";
            }
            std::cout << "\n";
        }

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "================================================================\n";
    return 0;
}
