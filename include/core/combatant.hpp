#pragma once

#include "core/types.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace duel {

// ==============================================================================
// CombatantSpec - Immutable stat block supplied by the caller
// ==============================================================================

struct CombatantSpec {
    i32 initiative = 0;         // Higher fires first
    i32 hull       = 1;         // Starting health, must be > 0
    i32 computer   = 0;         // Added to every roll this combatant makes
    i32 shield     = 0;         // Subtracted from every roll against this combatant
    std::vector<i32> missiles;  // One-shot weapons, fired once in the missile phase
    std::vector<i32> cannons;   // Fired once per cannon round, every round

    CombatantSpec() = default;

    CombatantSpec(i32 init, i32 hull_points, i32 comp, i32 shld,
                  std::vector<i32> missile_damage, std::vector<i32> cannon_damage)
        : initiative(init), hull(hull_points), computer(comp), shield(shld),
          missiles(std::move(missile_damage)), cannons(std::move(cannon_damage)) {}

    // True if some cannon can ever reduce an enemy's hull
    bool has_damaging_cannon() const {
        for (i32 dmg : cannons) {
            if (dmg > 0) return true;
        }
        return false;
    }

    // Problems with this stat block, empty when valid
    std::vector<std::string> validate() const;
};

// ==============================================================================
// CombatantState - Trial-scoped mutable state over a read-only spec
// ==============================================================================

struct CombatantState {
    const CombatantSpec* spec;   // Read-only stats and weapon lists
    i32 remaining_hull;          // Only ever decreases during a trial

    CombatantState() : spec(nullptr), remaining_hull(0) {}
    explicit CombatantState(const CombatantSpec* s)
        : spec(s), remaining_hull(s->hull) {}

    void reset() { remaining_hull = spec->hull; }

    bool is_destroyed() const { return remaining_hull <= 0; }
    void take_damage(i32 dmg) { remaining_hull -= dmg; }

    i32 initiative() const { return spec->initiative; }
    i32 computer() const { return spec->computer; }
    i32 shield() const { return spec->shield; }
    const std::vector<i32>& missiles() const { return spec->missiles; }
    const std::vector<i32>& cannons() const { return spec->cannons; }
};

// ==============================================================================
// Validation
// ==============================================================================

// Raised for any caller contract violation, before a trial runs
class SpecError : public std::invalid_argument {
public:
    explicit SpecError(const std::string& what) : std::invalid_argument(what) {}

    SpecError(const std::string& context, const std::vector<std::string>& problems)
        : std::invalid_argument(join(context, problems)) {}

private:
    static std::string join(const std::string& context, const std::vector<std::string>& problems);
};

// Problems with a pair of specs, each prefixed "first:" or "second:",
// plus matchup-level problems such as a duel that could never end
std::vector<std::string> validate_matchup(const CombatantSpec& first, const CombatantSpec& second);

// Throws SpecError listing every problem found
void require_valid_matchup(const CombatantSpec& first, const CombatantSpec& second);

} // namespace duel
