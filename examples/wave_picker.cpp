/*
================================================================================
WAVE PICKER - Solve one wave from an instance file
================================================================================
PROBLEM TYPE: Mixed-Integer Programming (MIP), fractional objective

USAGE
-----
    wave_picker <instance> [<solution>] [options]

    Reads the instance, solves it within the time budget (600 s by default,
    measured from program start), prints a report and writes the wave to
    <solution> when one is accepted. See --help for the options.

EXIT CODES
----------
    0   a validated wave was found (and written, if a path was given)
    2   no wave: infeasible, time budget exhausted, engine failure or
        post-solve rejection
    1   bad arguments, unreadable input or other errors

MATHEMATICAL MODEL
------------------
Variables:
    x[o] in {0,1}   order o is picked
    y[a] in {0,1}   aisle a is visited
    N  in [LB, UB]  units picked (integer)
    D  in [1, |A|]  aisles visited (integer)
    Z >= 0          surrogate of N / D

Objective:
    max  Z

Constraints:
    Capacity:  sum_o req[o][i] x[o] - sum_a avail[a][i] y[a] <= 0   for every item i
    Aisles:    sum_a y[a] = D
    Units:     sum_o units[o] x[o] = N
    Ratio:     Z - N + UB D <= UB |A|

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <wavepick/wavepick.h>

int main(int argc, char** argv) {
    using namespace wavepick;

    try {
        const CommandLine cl = parseArguments(argc, argv);
        if (cl.help) {
            std::cout << usage(argv[0]);
            return 0;
        }
        const SolverConfig& config = cl.config;
        setLogLevel(config.logLevel);

        // The budget is measured from here, before any input is read
        const TimeBudget budget = TimeBudget::startingNow(
            config.totalBudgetSeconds, config.solverCapSeconds, config.reserveSeconds);

        std::cout << "================================================================\n";
        std::cout << "WAVE PICKER\n";
        std::cout << "================================================================\n\n";

        const Instance instance = loadInstance(cl.instancePath);

        std::cout << "INSTANCE\n";
        std::cout << "--------\n";
        std::cout << "File:        " << cl.instancePath << "\n";
        std::cout << "Orders:      " << instance.numOrders() << "\n";
        std::cout << "Aisles:      " << instance.numAisles() << "\n";
        std::cout << "Items:       " << instance.numItems()
                  << " (" << instance.activeItems().size() << " in use)\n";
        std::cout << "Wave bounds: [" << instance.bounds().lower << ", "
                  << instance.bounds().upper << "]\n\n";

        GurobiEngine engine;
        WaveSolver solver(instance, engine, config);
        const SolveResult result = solver.solve(budget);

        std::cout << "RESULT\n";
        std::cout << "------\n";
        std::cout << "Status:  " << solveStatusName(result.status) << "\n";
        std::cout << "Runtime: " << std::fixed << std::setprecision(2) << result.runtime << " s\n";

        if (!result.ok()) {
            std::cout << "Reason:  " << result.message << "\n";
            std::cout << "\n================================================================\n";
            return 2;
        }

        const CandidateSolution& wave = *result.solution;
        const WaveRatio ratio = exactScore(instance, wave);

        std::cout << "Orders:  " << wave.orders().size() << "\n";
        std::cout << "Aisles:  " << wave.aisles().size() << "\n";
        std::cout << "Units:   " << ratio.units << "\n";
        std::cout << "Ratio:   " << std::setprecision(4) << result.score
                  << (result.provenOptimal ? " (optimal)" : " (not proven optimal)") << "\n";
        std::cout << "Surrogate Z: " << result.engineObjective
                  << "  bound: " << result.engineBound << "\n";

        if (cl.solutionPath) {
            saveSolution(*cl.solutionPath, wave);
            std::cout << "\nWave written to " << *cl.solutionPath << "\n";
        }

        std::cout << "Time remaining: " << std::setprecision(1) << budget.remaining() << " s\n";

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
