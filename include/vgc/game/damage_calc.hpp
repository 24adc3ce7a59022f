#pragma once

#include "vgc/game/oracle.hpp"

namespace vgc {

/**
 * Level 50 damage formula with the modifiers that matter in doubles:
 * STAB (2.0 for matching Tera), type chart, spread reduction, weather,
 * burn, screens, critical hits, common damage items and 16 damage rolls.
 */
class StandardDamageCalc : public DamageOracle {
public:
    static constexpr float CRIT_CHANCE = 1.0f / 24.0f;
    static constexpr float CRIT_MULTIPLIER = 1.5f;
    static constexpr int NUM_ROLLS = 16;

    DamageResult damage_distribution(
        const PokemonState& attacker,
        const PokemonState& defender,
        const MoveData& move,
        const FieldState& field,
        const DamageModifiers& mods) const override;

    /**
     * Damage in HP points for one concrete roll.
     *
     * @param roll_percent Random factor in [85, 100]
     */
    int compute_damage(
        const PokemonState& attacker,
        const PokemonState& defender,
        const MoveData& move,
        const FieldState& field,
        const DamageModifiers& mods,
        int roll_percent,
        bool crit) const;

    static float stab_multiplier(const PokemonState& attacker, Type move_type);
};

}  // namespace vgc
