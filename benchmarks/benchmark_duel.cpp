#include "simulation/simulator.hpp"
#include "utils/timer.hpp"
#include <iostream>
#include <iomanip>

using namespace duel;

namespace {

// Variable-damage missiles and multi-shot cannons, hull 3
const CombatantSpec SHIP_A(6, 3, 2, 1, {2, 1}, {2, 1});
const CombatantSpec SHIP_B(4, 3, 1, 1, {2, 1, 1}, {1, 1});
constexpr f64 EXACT_P = 233948607.0 / 275365888.0;

void run(ExecutionMode mode, i64 trials) {
    SimulationConfig config;
    config.trials = trials;
    config.seed = 42;
    config.mode = mode;

    Simulator sim(config);
    Timer timer;
    DuelStatistics stats = sim.simulate(SHIP_A, SHIP_B);
    double sec = timer.elapsed_sec();

    std::cout << std::setw(10) << SimulationConfig::mode_name(mode) << ":  "
              << "P(A wins) ≈ " << std::fixed << std::setprecision(4) << 100.0 * stats.first_win_rate << "%"
              << "   (" << trials << " sims in " << std::setprecision(2) << sec << "s, "
              << std::setprecision(0) << trials / sec << " duels/sec)" << std::endl;
    std::cout << "            95% CI [" << std::setprecision(4) << 100.0 * stats.ci95_low << "%, "
              << 100.0 * stats.ci95_high << "%]  avg cannon rounds "
              << std::setprecision(3) << stats.avg_cannon_rounds << std::endl;
}

} // namespace

int main() {
    std::cout << "=== Duel Benchmarks ===" << std::endl;
    std::cout << "Exact P(A wins) = " << std::fixed << std::setprecision(4) << 100.0 * EXACT_P << "%" << std::endl;
    std::cout << std::endl;

    for (i64 trials : {i64(1'000'000), i64(10'000'000)}) {
        run(ExecutionMode::Sequential, trials);
        run(ExecutionMode::Parallel, trials);
        std::cout << std::endl;
    }

    return 0;
}
