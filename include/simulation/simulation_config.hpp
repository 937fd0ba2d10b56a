#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace duel {

// ==============================================================================
// Simulation Configuration
// ==============================================================================

enum class ExecutionMode : u8 {
    Sequential = 0,   // One stream, bit-reproducible for a fixed seed
    Parallel   = 1    // Trial range split into batches across a thread pool
};

struct SimulationConfig {
    i64 trials = DEFAULT_TRIALS;          // 1 .. MAX_TRIALS
    std::optional<u64> seed;              // Unset: seed from system entropy
    ExecutionMode mode = ExecutionMode::Parallel;
    u32 worker_count = 0;                 // 0 = hardware concurrency
    u32 batch_size = DEFAULT_BATCH;       // Trials per parallel task
    InitiativeTieBreak tie_break = InitiativeTieBreak::SecondCombatant;

    // Problems with this configuration, empty when valid
    std::vector<std::string> validate() const {
        std::vector<std::string> problems;
        if (trials <= 0) {
            problems.push_back("trials must be positive, got " + std::to_string(trials));
        } else if (trials > MAX_TRIALS) {
            problems.push_back("trials must not exceed " + std::to_string(MAX_TRIALS) +
                               ", got " + std::to_string(trials));
        }
        if (mode == ExecutionMode::Parallel && batch_size == 0) {
            problems.push_back("batch_size must be positive");
        }
        return problems;
    }

    static const char* mode_name(ExecutionMode m) {
        switch (m) {
            case ExecutionMode::Sequential: return "sequential";
            case ExecutionMode::Parallel:   return "parallel";
        }
        return "unknown";
    }
};

} // namespace duel
