#pragma once

#include <chrono>
#include <cstdio>
#include <string>

namespace Commpute {

/**
 * @brief High-resolution timer for elapsed-time diagnostics.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    /**
     * @brief Reset the timer to the current time.
     */
    void reset() {
        start_ = Clock::now();
    }

    std::chrono::nanoseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_);
    }

    /**
     * @brief Get elapsed milliseconds since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    /**
     * @brief Get elapsed seconds since last reset or construction.
     */
    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

    /**
     * @brief Elapsed time rendered by format_duration().
     */
    std::string elapsed_str() const {
        return format_duration(elapsed());
    }

    /**
     * @brief Render a duration with the largest fitting unit, e.g. "1.25s",
     * "340.5ms", "12µs".
     */
    static std::string format_duration(std::chrono::nanoseconds d) {
        const double ns = static_cast<double>(d.count());
        char buf[64];
        if (ns >= 1e9) {
            std::snprintf(buf, sizeof(buf), "%.3fs", ns / 1e9);
        } else if (ns >= 1e6) {
            std::snprintf(buf, sizeof(buf), "%.3fms", ns / 1e6);
        } else if (ns >= 1e3) {
            std::snprintf(buf, sizeof(buf), "%.3fµs", ns / 1e3);
        } else {
            std::snprintf(buf, sizeof(buf), "%lldns", static_cast<long long>(d.count()));
        }
        return buf;
    }

private:
    TimePoint start_;
};

} // namespace Commpute
