#include "engine/dice.hpp"
#include "engine/duel.hpp"
#include "utils/timer.hpp"
#include <iostream>
#include <iomanip>

using namespace duel;

int main() {
    std::cout << "=== Dice Benchmarks ===" << std::endl;
    std::cout << std::endl;

    DiceRoller roller(12345);

    // Raw face rolls
    {
        const u64 iterations = 100'000'000;
        Timer timer;

        u64 sum = 0;
        for (u64 i = 0; i < iterations; ++i) {
            sum += static_cast<u64>(roller.roll_face());
        }

        double ms = timer.elapsed_ms();
        double rolls_per_sec = iterations * 1000.0 / ms;

        std::cout << "Raw Face Rolls:" << std::endl;
        std::cout << "  Iterations: " << iterations << std::endl;
        std::cout << "  Time: " << std::fixed << std::setprecision(0) << ms << " ms" << std::endl;
        std::cout << "  Rate: " << std::setprecision(2)
                  << rolls_per_sec / 1e6 << " million/sec" << std::endl;
        std::cout << "  (Sum: " << sum << ")" << std::endl;
        std::cout << std::endl;
    }

    // Full hit decisions (computer 2 vs shield 1)
    {
        const u64 iterations = 100'000'000;
        Timer timer;

        u64 hits = 0;
        for (u64 i = 0; i < iterations; ++i) {
            hits += shot_hits(roller.roll_face(), 2, 1);
        }

        double ms = timer.elapsed_ms();
        double shots_per_sec = iterations * 1000.0 / ms;

        std::cout << "Hit Rolls (C2 vs S1):" << std::endl;
        std::cout << "  Iterations: " << iterations << std::endl;
        std::cout << "  Time: " << std::fixed << std::setprecision(0) << ms << " ms" << std::endl;
        std::cout << "  Rate: " << std::setprecision(2)
                  << shots_per_sec / 1e6 << " million/sec" << std::endl;
        std::cout << "  Hit rate: " << std::setprecision(4)
                  << static_cast<double>(hits) / iterations << " (expected 0.3333)" << std::endl;
        std::cout << std::endl;
    }

    // Sub-stream jumps
    {
        const u64 iterations = 100'000;
        Timer timer;

        for (u64 i = 0; i < iterations; ++i) {
            roller.jump();
        }

        double ms = timer.elapsed_ms();
        std::cout << "Stream Jumps:" << std::endl;
        std::cout << "  Iterations: " << iterations << std::endl;
        std::cout << "  Time: " << std::fixed << std::setprecision(0) << ms << " ms" << std::endl;
        std::cout << std::endl;
    }

    return 0;
}
