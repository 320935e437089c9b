#pragma once

#include <chrono>

// Measures wall time since construction, or since the last restart()
class ScopedTimer {
public:
    using clock_t = std::chrono::steady_clock;

    ScopedTimer() = default;

    // in seconds, with millisecond precision
    double elapsed() const noexcept {
        return static_cast<double>(elapsedMs()) / 1000.0;
    }

    long long elapsedMs() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock_t::now() - start_time_).count();
    }

    void restart() noexcept {
        start_time_ = clock_t::now();
    }

private:
    clock_t::time_point start_time_{clock_t::now()};
};
