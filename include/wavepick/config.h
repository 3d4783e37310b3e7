#pragma once
/*
===============================================================================
CONFIG — Solver settings and command-line parsing
===============================================================================

SolverConfig carries every knob of a wave solve with the defaults of the
production setup: a 600 s overall budget, at most 540 s for the engine, 30 s
kept in reserve for extraction, validation and reporting, a relative MIP gap
of 1e-15 and all available threads.

    wave_picker <instance> [<solution>] [options]

    --time-limit <s>     overall budget in seconds            (600)
    --solver-cap <s>     cap on the engine's share            (540)
    --reserve <s>        seconds kept after the solve         (30)
    --gap <g>            relative MIP gap                     (1e-15)
    --threads <n>        Gurobi threads, 0 = all              (0)
    --solver-output      show the Gurobi log
    --log-level <lvl>    debug | info | warning | error | off (info)
    --help               print usage

Malformed values throw std::invalid_argument with a message naming the flag.

===============================================================================
*/

#include <charconv>
#include <cmath>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "logging.h"

namespace wavepick {

    struct SolverConfig {
        double totalBudgetSeconds = 600.0;
        double solverCapSeconds = 540.0;
        double reserveSeconds = 30.0;
        double mipGap = 1e-15;
        int threads = 0;
        bool solverOutput = false;
        LogLevel logLevel = LogLevel::Info;

        /// @throws std::invalid_argument for negative or non-finite durations or gap, negative threads
        void validate() const {
            for (double seconds : { totalBudgetSeconds, solverCapSeconds, reserveSeconds }) {
                if (!std::isfinite(seconds) || seconds < 0.0) {
                    throw std::invalid_argument(
                        std::format("config: time budgets must be finite and non-negative, got {}", seconds));
                }
            }
            if (!std::isfinite(mipGap) || mipGap < 0.0) {
                throw std::invalid_argument(std::format("config: MIP gap must be finite and non-negative, got {}", mipGap));
            }
            if (threads < 0) {
                throw std::invalid_argument(std::format("config: thread count must be non-negative, got {}", threads));
            }
        }
    };

    struct CommandLine {
        std::string instancePath;
        std::optional<std::string> solutionPath;
        SolverConfig config;
        bool help = false;
    };

    inline std::string usage(std::string_view program) {
        return std::format(
            "usage: {} <instance> [<solution>] [options]\n"
            "  --time-limit <s>    overall time budget in seconds (default 600)\n"
            "  --solver-cap <s>    maximum seconds given to the solver (default 540)\n"
            "  --reserve <s>       seconds kept for validation and output (default 30)\n"
            "  --gap <g>           relative MIP gap (default 1e-15)\n"
            "  --threads <n>       solver threads, 0 = all (default 0)\n"
            "  --solver-output     show the Gurobi log\n"
            "  --log-level <lvl>   debug, info, warning, error or off (default info)\n"
            "  --help              show this message\n",
            program);
    }

    namespace config_detail {

        template<typename T>
        T parseNumber(std::string_view flag, std::string_view text) {
            T value{};
            const char* first = text.data();
            const char* last = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc() || ptr != last || text.empty()) {
                throw std::invalid_argument(std::format("{}: invalid value '{}'", flag, text));
            }
            return value;
        }

        inline LogLevel parseLogLevel(std::string_view text) {
            if (text == "debug")   return LogLevel::Debug;
            if (text == "info")    return LogLevel::Info;
            if (text == "warning") return LogLevel::Warning;
            if (text == "error")   return LogLevel::Error;
            if (text == "off")     return LogLevel::Off;
            throw std::invalid_argument(std::format("--log-level: unknown level '{}'", text));
        }

    } // namespace config_detail

    /**
     * @brief Parse argv into a CommandLine
     *
     * @details Positional arguments are the instance path and, optionally,
     *          the solution path. With --help the instance may be omitted.
     *
     * @throws std::invalid_argument for unknown flags, missing or malformed
     *         values, missing instance path or extra positionals
     */
    inline CommandLine parseArguments(int argc, const char* const* argv) {
        using config_detail::parseNumber;

        CommandLine cl;
        std::vector<std::string_view> positionals;

        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];

            auto next = [&]() -> std::string_view {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(std::format("{}: missing value", arg));
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                cl.help = true;
            }
            else if (arg == "--time-limit") {
                cl.config.totalBudgetSeconds = parseNumber<double>(arg, next());
            }
            else if (arg == "--solver-cap") {
                cl.config.solverCapSeconds = parseNumber<double>(arg, next());
            }
            else if (arg == "--reserve") {
                cl.config.reserveSeconds = parseNumber<double>(arg, next());
            }
            else if (arg == "--gap") {
                cl.config.mipGap = parseNumber<double>(arg, next());
            }
            else if (arg == "--threads") {
                cl.config.threads = parseNumber<int>(arg, next());
            }
            else if (arg == "--solver-output") {
                cl.config.solverOutput = true;
            }
            else if (arg == "--log-level") {
                cl.config.logLevel = config_detail::parseLogLevel(next());
            }
            else if (arg.size() > 1 && arg.front() == '-') {
                throw std::invalid_argument(std::format("unknown option '{}'", arg));
            }
            else {
                positionals.push_back(arg);
            }
        }

        if (cl.help) {
            return cl;
        }
        if (positionals.empty()) {
            throw std::invalid_argument("missing instance path");
        }
        if (positionals.size() > 2) {
            throw std::invalid_argument(std::format("unexpected argument '{}'", positionals[2]));
        }

        cl.instancePath = std::string(positionals[0]);
        if (positionals.size() == 2) {
            cl.solutionPath = std::string(positionals[1]);
        }

        cl.config.validate();
        return cl;
    }

} // namespace wavepick
