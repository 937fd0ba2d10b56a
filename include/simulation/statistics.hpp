#pragma once

#include "core/types.hpp"
#include "engine/duel.hpp"
#include <algorithm>
#include <cmath>

namespace duel {

// ==============================================================================
// Per-Worker Statistics (no atomics)
// Each worker fills its own copy; copies are summed once after all join
// ==============================================================================

struct LocalStats {
    u64 first_wins = 0;
    u64 second_wins = 0;
    u64 draws = 0;

    u64 total_cannon_rounds = 0;
    u64 missile_phase_decisions = 0;

    u64 trials() const { return first_wins + second_wins + draws; }

    void record(const DuelResult& result) {
        switch (result.outcome) {
            case TrialOutcome::FirstCombatantWins:  ++first_wins; break;
            case TrialOutcome::SecondCombatantWins: ++second_wins; break;
            case TrialOutcome::Draw:                ++draws; break;
        }
        total_cannon_rounds += result.cannon_rounds;
        if (result.decided_in == DuelPhase::MissilePhase) ++missile_phase_decisions;
    }

    LocalStats& operator+=(const LocalStats& other) {
        first_wins += other.first_wins;
        second_wins += other.second_wins;
        draws += other.draws;
        total_cannon_rounds += other.total_cannon_rounds;
        missile_phase_decisions += other.missile_phase_decisions;
        return *this;
    }
};

// ==============================================================================
// Final Statistics (computed from merged LocalStats)
// ==============================================================================

struct DuelStatistics {
    u64 trials = 0;
    u64 first_wins = 0;

    // Outcome rates (0.0 - 1.0)
    f64 first_win_rate = 0.0;
    f64 second_win_rate = 0.0;
    f64 draw_rate = 0.0;

    f64 avg_cannon_rounds = 0.0;
    f64 missile_phase_rate = 0.0;   // Fraction of duels over before any cannon fired

    // Sampling error of first_win_rate
    f64 std_error = 0.0;
    f64 ci95_low = 0.0;
    f64 ci95_high = 0.0;

    static DuelStatistics compute(const LocalStats& stats, u64 trials) {
        DuelStatistics result;
        result.trials = trials;
        result.first_wins = stats.first_wins;

        if (trials == 0) return result;

        f64 inv_trials = 1.0 / static_cast<f64>(trials);

        result.first_win_rate = stats.first_wins * inv_trials;
        result.second_win_rate = stats.second_wins * inv_trials;
        result.draw_rate = stats.draws * inv_trials;
        result.avg_cannon_rounds = stats.total_cannon_rounds * inv_trials;
        result.missile_phase_rate = stats.missile_phase_decisions * inv_trials;

        // Normal approximation to the binomial
        f64 p = result.first_win_rate;
        result.std_error = std::sqrt(p * (1.0 - p) * inv_trials);
        result.ci95_low = std::max(0.0, p - 1.96 * result.std_error);
        result.ci95_high = std::min(1.0, p + 1.96 * result.std_error);

        return result;
    }
};

} // namespace duel
