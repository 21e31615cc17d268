#pragma once

#include <chrono>
#include <cstdio>
#include <string>

namespace Lexicore {

/**
 * @brief Steady-clock stopwatch used for ingestion timings and progress throttling.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

    /**
     * @brief Elapsed time formatted for log lines ("412ms", "3.20s").
     */
    std::string pretty() const {
        char buf[32];
        double ms = elapsed_ms();
        if (ms < 1000.0) std::snprintf(buf, sizeof(buf), "%.0fms", ms);
        else std::snprintf(buf, sizeof(buf), "%.2fs", ms / 1000.0);
        return buf;
    }

private:
    TimePoint start_;
};

} // namespace Lexicore
