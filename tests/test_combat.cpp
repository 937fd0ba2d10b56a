#include "engine/duel.hpp"
#include <iostream>
#include <cassert>
#include <climits>
#include <utility>
#include <vector>

using namespace duel;

// Replays a fixed list of faces in order
struct ScriptedDice {
    std::vector<RollFace> faces;
    size_t used = 0;

    explicit ScriptedDice(std::vector<RollFace> f) : faces(std::move(f)) {}

    RollFace roll_face() {
        assert(used < faces.size());
        return faces[used++];
    }
};

using ScriptedResolver = BasicDuelResolver<ScriptedDice>;

constexpr RollFace MISS = RollFace::Miss;
constexpr RollFace HIT  = RollFace::AutoHit;

void test_hit_threshold() {
    // v + C - S >= 6, inclusive
    assert(shot_hits(RollFace::Four, 2, 0));
    assert(!shot_hits(RollFace::Four, 1, 0));
    assert(shot_hits(RollFace::Five, 2, 1));
    assert(!shot_hits(RollFace::Five, 1, 1));
    assert(shot_hits(RollFace::Two, 4, 0));

    // Miss never hits, AutoHit always does
    assert(!shot_hits(RollFace::Miss, 100, 0));
    assert(shot_hits(RollFace::AutoHit, 0, 100));

    // Shield can push every numeric face out of reach
    for (RollFace f : {RollFace::Two, RollFace::Three, RollFace::Four, RollFace::Five}) {
        assert(!shot_hits(f, 0, 1));
    }
    std::cout << "[PASS] test_hit_threshold" << std::endl;
}

void test_extreme_modifiers() {
    // Sums past the i32 range still compare correctly
    assert(shot_hits(RollFace::Two, INT_MAX, 0));
    assert(shot_hits(RollFace::Two, INT_MAX, INT_MIN));
    assert(!shot_hits(RollFace::Five, 0, INT_MAX));
    assert(!shot_hits(RollFace::Five, INT_MIN, INT_MAX));
    assert(!shot_hits(RollFace::Five, INT_MIN, 0));
    assert(shot_hits(RollFace::Three, 0, INT_MIN));

    // Miss and AutoHit ignore the modifiers entirely
    assert(!shot_hits(RollFace::Miss, INT_MAX, INT_MIN));
    assert(shot_hits(RollFace::AutoHit, INT_MIN, INT_MAX));

    // A full-range computer lands every numeric face in a duel
    CombatantSpec ace(5, 1, INT_MAX, 0, {}, {INT_MAX});
    CombatantSpec wall(4, INT_MAX, 0, INT_MIN, {}, {1});

    ScriptedDice dice({RollFace::Two});
    ScriptedResolver resolver(dice);
    DuelResult r = resolver.resolve(ace, wall);
    assert(r.outcome == TrialOutcome::FirstCombatantWins);
    assert(r.second_hull_left == 0);
    assert(dice.used == 1);
    std::cout << "[PASS] test_extreme_modifiers" << std::endl;
}

void test_volley_stops_on_kill() {
    CombatantSpec shooter(5, 1, 0, 0, {}, {1, 1, 1, 1});
    CombatantSpec target(4, 2, 0, 0, {}, {1});

    ScriptedDice dice({HIT, HIT, HIT, HIT});
    ScriptedResolver resolver(dice);

    CombatantState s(&shooter);
    CombatantState t(&target);

    bool destroyed = resolver.fire_volley(s, shooter.cannons, t);
    assert(destroyed);
    assert(t.remaining_hull == 0);
    assert(dice.used == 2);   // Remaining shots never rolled
    std::cout << "[PASS] test_volley_stops_on_kill" << std::endl;
}

void test_damage_follows_weapon_order() {
    CombatantSpec shooter(5, 1, 0, 0, {}, {1, 3});
    CombatantSpec target(4, 5, 0, 0, {}, {1});

    ScriptedDice dice({MISS, HIT});
    ScriptedResolver resolver(dice);

    CombatantState s(&shooter);
    CombatantState t(&target);

    bool destroyed = resolver.fire_volley(s, shooter.cannons, t);
    assert(!destroyed);
    assert(t.remaining_hull == 2);   // Only the 3-damage cannon hit
    std::cout << "[PASS] test_damage_follows_weapon_order" << std::endl;
}

void test_missile_kill_ends_duel() {
    CombatantSpec first(5, 2, 0, 0, {3}, {1});
    CombatantSpec second(4, 2, 0, 0, {5}, {1});

    ScriptedDice dice({HIT});
    ScriptedResolver resolver(dice);

    DuelResult r = resolver.resolve(first, second);
    assert(r.outcome == TrialOutcome::FirstCombatantWins);
    assert(r.decided_in == DuelPhase::MissilePhase);
    assert(r.cannon_rounds == 0);
    assert(r.first_hull_left == 2);
    assert(dice.used == 1);   // Second combatant never fired its missile
    std::cout << "[PASS] test_missile_kill_ends_duel" << std::endl;
}

void test_second_missile_volley_can_win() {
    // Second has the higher initiative and leads
    CombatantSpec first(3, 1, 0, 0, {1}, {1});
    CombatantSpec second(6, 1, 0, 0, {1, 1}, {1});

    ScriptedDice dice({MISS, MISS, HIT});
    ScriptedResolver resolver(dice);

    DuelResult r = resolver.resolve(first, second);
    assert(r.outcome == TrialOutcome::FirstCombatantWins);
    assert(r.decided_in == DuelPhase::MissilePhase);
    assert(dice.used == 3);
    std::cout << "[PASS] test_second_missile_volley_can_win" << std::endl;
}

void test_full_sequence() {
    CombatantSpec first(5, 2, 0, 0, {1}, {1});
    CombatantSpec second(4, 2, 0, 0, {1}, {1});

    ScriptedDice dice({
        MISS, HIT,    // Missiles: first misses, second hits (first at 1)
        MISS, MISS,   // Round 1
        HIT, MISS,    // Round 2: second at 1
        HIT           // Round 3: second destroyed, never fires back
    });
    ScriptedResolver resolver(dice);

    DuelResult r = resolver.resolve(first, second);
    assert(r.outcome == TrialOutcome::FirstCombatantWins);
    assert(r.decided_in == DuelPhase::CannonPhase);
    assert(r.cannon_rounds == 3);
    assert(r.first_hull_left == 1);
    assert(r.second_hull_left == 0);
    assert(dice.used == 7);
    std::cout << "[PASS] test_full_sequence" << std::endl;
}

void test_empty_missile_lists() {
    CombatantSpec first(5, 1, 0, 0, {}, {1});
    CombatantSpec second(4, 1, 0, 0, {}, {1});

    ScriptedDice dice({HIT});
    ScriptedResolver resolver(dice);

    DuelResult r = resolver.resolve(first, second);
    assert(r.outcome == TrialOutcome::FirstCombatantWins);
    assert(r.decided_in == DuelPhase::CannonPhase);
    assert(r.cannon_rounds == 1);
    std::cout << "[PASS] test_empty_missile_lists" << std::endl;
}

void test_one_sided_cannons() {
    // Second has nothing to shoot with; first keeps firing until it hits
    CombatantSpec first(1, 1, 0, 0, {}, {1});
    CombatantSpec second(9, 1, 0, 0, {}, {});

    ScriptedDice dice({MISS, MISS, MISS, HIT});
    ScriptedResolver resolver(dice);

    DuelResult r = resolver.resolve(first, second);
    assert(r.outcome == TrialOutcome::FirstCombatantWins);
    assert(r.cannon_rounds == 4);
    std::cout << "[PASS] test_one_sided_cannons" << std::endl;
}

void test_initiative_tie_break() {
    CombatantSpec first(4, 1, 0, 0, {}, {1});
    CombatantSpec second(4, 1, 0, 0, {}, {1});

    {
        ScriptedDice dice({HIT});
        ScriptedResolver resolver(dice);   // Default: second fires first on ties
        DuelResult r = resolver.resolve(first, second);
        assert(r.outcome == TrialOutcome::SecondCombatantWins);
    }
    {
        ScriptedDice dice({HIT});
        ScriptedResolver resolver(dice, InitiativeTieBreak::FirstCombatant);
        DuelResult r = resolver.resolve(first, second);
        assert(r.outcome == TrialOutcome::FirstCombatantWins);
    }

    assert(first_fires_first(5, 4, InitiativeTieBreak::SecondCombatant));
    assert(!first_fires_first(4, 5, InitiativeTieBreak::FirstCombatant));
    std::cout << "[PASS] test_initiative_tie_break" << std::endl;
}

void test_no_return_fire_after_kill() {
    // Both volleys would be lethal; only the leader gets to fire
    CombatantSpec first(2, 1, 0, 0, {}, {5});
    CombatantSpec second(3, 1, 0, 0, {}, {5});

    ScriptedDice dice({HIT, HIT});
    ScriptedResolver resolver(dice);

    DuelResult r = resolver.resolve(first, second);
    assert(r.outcome == TrialOutcome::SecondCombatantWins);
    assert(r.outcome != TrialOutcome::Draw);
    assert(r.second_hull_left == 1);
    assert(dice.used == 1);
    std::cout << "[PASS] test_no_return_fire_after_kill" << std::endl;
}

void test_state_reset_between_duels() {
    CombatantSpec first(5, 3, 0, 0, {}, {3});
    CombatantSpec second(4, 3, 0, 0, {}, {3});

    ScriptedDice dice({HIT, HIT});
    ScriptedResolver resolver(dice);

    CombatantState a(&first);
    CombatantState b(&second);

    DuelResult r1 = resolver.resolve(a, b);
    assert(r1.outcome == TrialOutcome::FirstCombatantWins);
    assert(b.remaining_hull == 0);

    // Hull restored from the spec, weapons untouched
    DuelResult r2 = resolver.resolve(a, b);
    assert(r2.outcome == TrialOutcome::FirstCombatantWins);
    assert(r2.cannon_rounds == 1);
    assert(second.hull == 3);
    assert(second.cannons.size() == 1);
    std::cout << "[PASS] test_state_reset_between_duels" << std::endl;
}

int main() {
    std::cout << "=== Combat Tests ===" << std::endl;

    test_hit_threshold();
    test_extreme_modifiers();
    test_volley_stops_on_kill();
    test_damage_follows_weapon_order();
    test_missile_kill_ends_duel();
    test_second_missile_volley_can_win();
    test_full_sequence();
    test_empty_missile_lists();
    test_one_sided_cannons();
    test_initiative_tie_break();
    test_no_return_fire_after_kill();
    test_state_reset_between_duels();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
