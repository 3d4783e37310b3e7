#pragma once
/*
===============================================================================
LOGGING — Leveled console messages for solver runs
===============================================================================

OVERVIEW
--------
Solver runs report a handful of lines: instance size, model size, engine
status, surrogate versus true objective, remaining time. These go to
std::clog with the elapsed wall time since the process started, so the
report lines can be lined up against the overall time budget.

    [00:01.3] INFO  model: 1204 vars (1203 bin, 2 int), 842 constrs
    [09:00.2] WARN  time limit reached, returning incumbent
    [09:00.4] ERROR extracted wave failed re-validation: item 17 over-picked

USAGE
-----
    wavepick::setLogLevel(wavepick::LogLevel::Debug);
    wavepick::log::info("loaded {} orders, {} aisles", o, a);
    wavepick::log::error("engine error {}: {}", code, msg);

Messages below the threshold are not formatted. Writes are serialized with a
mutex, so Gurobi callback threads may log too.

===============================================================================
*/

#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace wavepick {

    enum class LogLevel { Debug, Info, Warning, Error, Off };

    namespace log_detail {

        inline std::atomic<LogLevel>& threshold() {
            static std::atomic<LogLevel> level{ LogLevel::Info };
            return level;
        }

        inline std::mutex& sinkMutex() {
            static std::mutex m;
            return m;
        }

        inline std::chrono::steady_clock::time_point processStart() {
            static const auto start = std::chrono::steady_clock::now();
            return start;
        }

        inline std::string_view tag(LogLevel level) {
            switch (level) {
                case LogLevel::Debug:   return "DEBUG";
                case LogLevel::Info:    return "INFO ";
                case LogLevel::Warning: return "WARN ";
                case LogLevel::Error:   return "ERROR";
                default:                return "";
            }
        }

        /// @brief "[mm:ss.s]"
        inline std::string formatElapsed(double seconds) {
            const int minutes = static_cast<int>(seconds) / 60;
            return std::format("[{:02d}:{:04.1f}]", minutes, seconds - minutes * 60.0);
        }

        inline void write(LogLevel level, const std::string& message) {
            const std::chrono::duration<double> elapsed =
                std::chrono::steady_clock::now() - processStart();

            std::lock_guard<std::mutex> lock(sinkMutex());
            std::clog << formatElapsed(elapsed.count()) << ' ' << tag(level)
                      << ' ' << message << '\n';
        }

    } // namespace log_detail

    inline void setLogLevel(LogLevel level) noexcept {
        log_detail::threshold().store(level);
    }

    inline LogLevel logLevel() noexcept {
        return log_detail::threshold().load();
    }

    inline bool logEnabled(LogLevel level) noexcept {
        return level != LogLevel::Off && level >= logLevel();
    }

    namespace log {

        template<typename... Args>
        void message(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
            if (!logEnabled(level)) {
                return;
            }
            log_detail::write(level, std::format(fmt, std::forward<Args>(args)...));
        }

        template<typename... Args>
        void debug(std::format_string<Args...> fmt, Args&&... args) {
            message(LogLevel::Debug, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void info(std::format_string<Args...> fmt, Args&&... args) {
            message(LogLevel::Info, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void warning(std::format_string<Args...> fmt, Args&&... args) {
            message(LogLevel::Warning, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void error(std::format_string<Args...> fmt, Args&&... args) {
            message(LogLevel::Error, fmt, std::forward<Args>(args)...);
        }

    } // namespace log

} // namespace wavepick
