/*
================================================================================
WAVE CHECKER - Validate and score a wave file against an instance
================================================================================
PROBLEM TYPE: none (no solver is run)

USAGE
-----
    wave_checker <instance> <solution> [--log-level <lvl>]

    Reads an instance and a wave in the solution file format, runs the
    feasibility check and prints the exact ratio of a feasible wave. Waves
    written by wave_picker, or by any other tool using the same format, can
    be checked this way.

EXIT CODES
----------
    0   the wave is feasible
    2   the wave violates a rule (the report names the first one)
    1   bad arguments, unreadable input or other errors

================================================================================
*/

#include <cstring>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <wavepick/wavepick.h>

namespace {

    void printUsage(const char* program) {
        std::cout << "usage: " << program << " <instance> <solution> [--log-level <lvl>]\n";
    }

} // namespace

int main(int argc, char** argv) {
    using namespace wavepick;

    try {
        std::vector<std::string> positionals;
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                printUsage(argv[0]);
                return 0;
            }
            if (std::strcmp(argv[i], "--log-level") == 0) {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("--log-level: missing value");
                }
                setLogLevel(config_detail::parseLogLevel(argv[++i]));
                continue;
            }
            positionals.emplace_back(argv[i]);
        }
        if (positionals.size() != 2) {
            printUsage(argv[0]);
            return 1;
        }

        const Instance instance = loadInstance(positionals[0]);
        const CandidateSolution wave = loadSolution(positionals[1]);
        log::info("checking {} orders and {} aisles from '{}'",
            wave.orders().size(), wave.aisles().size(), positionals[1]);

        std::cout << "================================================================\n";
        std::cout << "WAVE CHECKER\n";
        std::cout << "================================================================\n\n";

        std::cout << "Instance:    " << positionals[0] << " ("
                  << instance.numOrders() << " orders, "
                  << instance.numAisles() << " aisles)\n";
        std::cout << "Wave:        " << positionals[1] << "\n";
        std::cout << "Selection:   " << wave << "\n";
        std::cout << "Wave bounds: [" << instance.bounds().lower << ", "
                  << instance.bounds().upper << "]\n\n";

        const FeasibilityReport report = checkFeasibility(instance, wave);

        std::cout << "RESULT\n";
        std::cout << "------\n";
        if (!report.feasible) {
            std::cout << "Feasible: no\n";
            std::cout << "Reason:   " << report.describe() << "\n";
            std::cout << "\n================================================================\n";
            return 2;
        }

        const WaveRatio ratio = exactScore(instance, wave);
        std::cout << "Feasible: yes\n";
        std::cout << "Units:    " << ratio.units << "\n";
        std::cout << "Aisles:   " << ratio.aisles << "\n";
        std::cout << "Ratio:    " << std::fixed << std::setprecision(4) << ratio.value() << "\n";

    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
