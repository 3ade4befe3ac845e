#pragma once
#include <chrono>

namespace netconn {

// Wall-clock stopwatch for the phase timings in the executables' summary lines.
// lap() returns the seconds since the previous lap (or construction) and starts
// the next one; total() keeps counting from construction.
class Stopwatch {
public:
    using clock = std::chrono::steady_clock;

    Stopwatch() : start_(clock::now()), lap_(start_) {}

    double lap() {
        const clock::time_point now = clock::now();
        const double s = std::chrono::duration<double>(now - lap_).count();
        lap_ = now;
        return s;
    }

    double total() const {
        return std::chrono::duration<double>(clock::now() - start_).count();
    }

private:
    clock::time_point start_;
    clock::time_point lap_;
};

} // namespace netconn
