#pragma once

#include <chrono>

namespace duel {

class Timer {
public:
    Timer() { start(); }

    void start() {
        start_ = std::chrono::steady_clock::now();
    }

    double elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(now - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace duel
