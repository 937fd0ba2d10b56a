#pragma once

#include <cstdint>
#include <cstddef>

namespace duel {

// ==============================================================================
// Fundamental Types
// ==============================================================================

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;

// Game constants
constexpr i32 HIT_THRESHOLD   = 6;       // roll + computer - shield must reach this
constexpr i64 DEFAULT_TRIALS  = 100000;
constexpr i64 MAX_TRIALS      = 1'000'000'000'000;
constexpr u32 DEFAULT_BATCH   = 10000;   // Trials per parallel task
constexpr size_t FACE_COUNT   = 6;

// ==============================================================================
// Enumerations
// ==============================================================================

// The six equiprobable faces of a hit roll
enum class RollFace : u8 {
    Miss    = 0,   // Never hits
    Two     = 1,
    Three   = 2,
    Four    = 3,
    Five    = 4,
    AutoHit = 5    // Always hits
};

// Numeric value of a face (only meaningful for Two..Five)
inline constexpr i32 face_value(RollFace face) {
    return static_cast<i32>(face) + 1;
}

enum class TrialOutcome : u8 {
    FirstCombatantWins  = 0,
    SecondCombatantWins = 1,
    Draw                = 2
};

enum class DuelPhase : u8 {
    Setup        = 0,
    MissilePhase = 1,
    CannonPhase  = 2
};

// Who fires first when both initiatives are equal
enum class InitiativeTieBreak : u8 {
    SecondCombatant = 0,   // Second-named combatant fires first
    FirstCombatant  = 1    // First-named combatant fires first
};

} // namespace duel
