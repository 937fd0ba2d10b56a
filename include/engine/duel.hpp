#pragma once

#include "core/types.hpp"
#include "core/combatant.hpp"
#include "engine/dice.hpp"
#include <vector>

namespace duel {

// ==============================================================================
// Duel Result
// ==============================================================================

struct DuelResult {
    TrialOutcome outcome;
    DuelPhase decided_in;     // MissilePhase or CannonPhase
    u32 cannon_rounds;        // Completed or interrupted cannon rounds
    i32 first_hull_left;
    i32 second_hull_left;

    DuelResult() : outcome(TrialOutcome::Draw), decided_in(DuelPhase::Setup),
                   cannon_rounds(0), first_hull_left(0), second_hull_left(0) {}
};

// ==============================================================================
// Single-Shot Resolution
// ==============================================================================

// Modifiers span the full i32 range, so the sum is taken in i64
inline bool shot_hits(RollFace face, i32 computer, i32 shield) {
    switch (face) {
        case RollFace::Miss:    return false;
        case RollFace::AutoHit: return true;
        default:
            return static_cast<i64>(face_value(face)) + computer - shield >= HIT_THRESHOLD;
    }
}

// Firing order is decided once per duel and holds for every exchange
inline bool first_fires_first(i32 first_initiative, i32 second_initiative,
                              InitiativeTieBreak tie_break) {
    if (first_initiative != second_initiative) {
        return first_initiative > second_initiative;
    }
    return tie_break == InitiativeTieBreak::FirstCombatant;
}

// ==============================================================================
// Duel Resolver
// Dice must provide `RollFace roll_face()`. Production code uses DiceRoller;
// tests plug in scripted rolls.
// ==============================================================================

template<typename Dice>
class BasicDuelResolver {
public:
    explicit BasicDuelResolver(Dice& dice,
                               InitiativeTieBreak tie_break = InitiativeTieBreak::SecondCombatant)
        : dice_(dice), tie_break_(tie_break) {}

    // Fire every weapon in order at the target, stopping the moment it is
    // destroyed. Returns true if the target was destroyed.
    bool fire_volley(const CombatantState& shooter, const std::vector<i32>& weapons,
                     CombatantState& target) {
        const i32 computer = shooter.computer();
        const i32 shield = target.shield();

        for (i32 dmg : weapons) {
            if (shot_hits(dice_.roll_face(), computer, shield)) {
                target.take_damage(dmg);
                if (target.is_destroyed()) return true;
            }
        }
        return false;
    }

    // Run one duel to completion. Both states are reset from their specs.
    DuelResult resolve(CombatantState& first, CombatantState& second) {
        // Setup
        first.reset();
        second.reset();

        const bool first_leads = first_fires_first(first.initiative(), second.initiative(), tie_break_);
        CombatantState& lead  = first_leads ? first : second;
        CombatantState& trail = first_leads ? second : first;

        DuelResult result;

        // Missile phase: each side fires its one-shot weapons once
        result.decided_in = DuelPhase::MissilePhase;
        if (exchange(lead, lead.missiles(), trail, trail.missiles())) {
            return finish(result, first, second);
        }

        // Cannon phase: repeat full volleys until one side is destroyed
        result.decided_in = DuelPhase::CannonPhase;
        for (;;) {
            ++result.cannon_rounds;
            if (exchange(lead, lead.cannons(), trail, trail.cannons())) break;
        }

        return finish(result, first, second);
    }

    DuelResult resolve(const CombatantSpec& first, const CombatantSpec& second) {
        CombatantState first_state(&first);
        CombatantState second_state(&second);
        return resolve(first_state, second_state);
    }

private:
    Dice& dice_;
    InitiativeTieBreak tie_break_;

    // Lead fires, then trail fires back only if it survived.
    // Returns true once either side is destroyed.
    bool exchange(CombatantState& lead, const std::vector<i32>& lead_weapons,
                  CombatantState& trail, const std::vector<i32>& trail_weapons) {
        if (fire_volley(lead, lead_weapons, trail)) return true;
        return fire_volley(trail, trail_weapons, lead);
    }

    static DuelResult& finish(DuelResult& result, const CombatantState& first,
                              const CombatantState& second) {
        result.first_hull_left = first.remaining_hull;
        result.second_hull_left = second.remaining_hull;

        const bool first_down = first.is_destroyed();
        const bool second_down = second.is_destroyed();

        if (first_down && second_down) {
            result.outcome = TrialOutcome::Draw;
        } else if (second_down) {
            result.outcome = TrialOutcome::FirstCombatantWins;
        } else {
            result.outcome = TrialOutcome::SecondCombatantWins;
        }
        return result;
    }
};

using DuelResolver = BasicDuelResolver<DiceRoller>;

} // namespace duel
