#pragma once

#include "core/types.hpp"
#include "core/combatant.hpp"
#include "engine/dice.hpp"
#include "engine/duel.hpp"
#include "simulation/simulation_config.hpp"
#include "simulation/statistics.hpp"
#include <functional>
#include <optional>

namespace duel {

// ==============================================================================
// Progress Callback
// ==============================================================================

using ProgressCallback = std::function<void(u64 completed, u64 total, f64 rate)>;

// ==============================================================================
// Single-Worker Duel Simulator
// Owns one dice stream and the reusable per-trial combatant states
// ==============================================================================

class DuelSimulator {
public:
    DuelSimulator(const CombatantSpec& first, const CombatantSpec& second,
                  DiceRoller dice, InitiativeTieBreak tie_break)
        : dice_(dice), resolver_(dice_, tie_break),
          first_state_(&first), second_state_(&second) {}

    // Non-copyable: the resolver holds a reference to dice_
    DuelSimulator(const DuelSimulator&) = delete;
    DuelSimulator& operator=(const DuelSimulator&) = delete;

    DuelResult run_duel() {
        return resolver_.resolve(first_state_, second_state_);
    }

    void run_batch(u64 trials, LocalStats& stats) {
        for (u64 i = 0; i < trials; ++i) {
            stats.record(run_duel());
        }
    }

private:
    DiceRoller dice_;
    DuelResolver resolver_;
    CombatantState first_state_;
    CombatantState second_state_;
};

// ==============================================================================
// Monte Carlo Driver
// ==============================================================================

class Simulator {
public:
    explicit Simulator(const SimulationConfig& config = SimulationConfig())
        : config_(config) {}

    // Validates the config and both specs, then runs config.trials duels
    // with the configured strategy. Throws SpecError before any trial
    // runs if anything is invalid.
    DuelStatistics simulate(const CombatantSpec& first, const CombatantSpec& second,
                            ProgressCallback progress = nullptr) const;

    SimulationConfig& config() { return config_; }
    const SimulationConfig& config() const { return config_; }

private:
    SimulationConfig config_;

    LocalStats run_sequential(const CombatantSpec& first, const CombatantSpec& second,
                              const ProgressCallback& progress) const;

    LocalStats run_parallel(const CombatantSpec& first, const CombatantSpec& second,
                            const ProgressCallback& progress) const;
};

// ==============================================================================
// Convenience Entry Point
// ==============================================================================

// Estimated probability that `first` defeats `second`. With a seed the run
// is single-threaded and bit-reproducible; without one it runs in parallel
// from entropy-seeded streams.
f64 estimate_win_probability(const CombatantSpec& first, const CombatantSpec& second,
                             i64 trials = DEFAULT_TRIALS,
                             std::optional<u64> seed = std::nullopt);

} // namespace duel
