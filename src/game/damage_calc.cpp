#include "vgc/game/damage_calc.hpp"
#include <algorithm>
#include <cmath>

namespace vgc {

namespace {

// Type-resist berry held by the defender, Type::None if not a resist berry
Type resist_berry_type(const std::string& item) {
    if (item == "occaberry") return Type::Fire;
    if (item == "wacanberry") return Type::Electric;
    if (item == "rindoberry") return Type::Grass;
    if (item == "cobaberry") return Type::Flying;
    if (item == "yacheberry") return Type::Ice;
    if (item == "shucaberry") return Type::Ground;
    return Type::None;
}

constexpr float SCREEN_MULTIPLIER = 2732.0f / 4096.0f;

}  // namespace

float StandardDamageCalc::stab_multiplier(const PokemonState& attacker, Type move_type) {
    if (move_type == Type::None) return 1.0f;
    bool original = attacker.has_type(move_type);
    if (attacker.terastallized && attacker.tera_type == move_type) {
        return original ? 2.0f : 1.5f;
    }
    return original ? 1.5f : 1.0f;
}

int StandardDamageCalc::compute_damage(
    const PokemonState& attacker,
    const PokemonState& defender,
    const MoveData& move,
    const FieldState& field,
    const DamageModifiers& mods,
    int roll_percent,
    bool crit
) const {
    if (!move.is_damaging()) return 0;

    float effectiveness = type_effectiveness(move.type, defender.defensive_types());
    if (effectiveness == 0.0f) return 0;

    bool physical = move.category == MoveCategory::Physical;
    int atk_idx = stat_index(physical ? Stat::Atk : Stat::SpA);
    int def_idx = stat_index(physical ? Stat::Def : Stat::SpD);

    int atk_stage = attacker.boosts[atk_idx];
    int def_stage = defender.boosts[def_idx];
    if (crit) {
        // Crits ignore the attacker's drops and the defender's boosts
        atk_stage = std::max(atk_stage, 0);
        def_stage = std::min(def_stage, 0);
    }

    float atk = attacker.stats[atk_idx] * boost_multiplier(atk_stage);
    float def = defender.stats[def_idx] * boost_multiplier(def_stage);

    if (physical && attacker.item == "choiceband") atk *= 1.5f;
    if (!physical && attacker.item == "choicespecs") atk *= 1.5f;
    if (!physical && defender.item == "assaultvest") def *= 1.5f;
    if (def < 1.0f) def = 1.0f;

    float level_factor = std::floor(2.0f * LEVEL / 5.0f) + 2.0f;
    float damage = std::floor(std::floor(level_factor * move.power * atk / def) / 50.0f) + 2.0f;

    if (mods.spread) damage = std::floor(damage * 0.75f);

    if (field.weather == Weather::Sun) {
        if (move.type == Type::Fire) damage = std::floor(damage * 1.5f);
        if (move.type == Type::Water) damage = std::floor(damage * 0.5f);
    } else if (field.weather == Weather::Rain) {
        if (move.type == Type::Water) damage = std::floor(damage * 1.5f);
        if (move.type == Type::Fire) damage = std::floor(damage * 0.5f);
    }

    if (crit) damage = std::floor(damage * CRIT_MULTIPLIER);

    damage = std::floor(damage * roll_percent / 100.0f);
    damage = std::floor(damage * stab_multiplier(attacker, move.type));
    damage = std::floor(damage * effectiveness);

    if (physical && attacker.status == Status::Burn) damage = std::floor(damage * 0.5f);

    if (!crit) {
        if (physical && mods.reflect) damage = std::floor(damage * SCREEN_MULTIPLIER);
        if (!physical && mods.light_screen) damage = std::floor(damage * SCREEN_MULTIPLIER);
    }

    if (attacker.item == "lifeorb") damage = std::floor(damage * 1.3f);
    if (attacker.item == "expertbelt" && effectiveness > 1.0f) damage = std::floor(damage * 1.2f);

    if (effectiveness > 1.0f && resist_berry_type(defender.item) == move.type) {
        damage = std::floor(damage * 0.5f);
    }

    return std::max(1, static_cast<int>(damage));
}

DamageResult StandardDamageCalc::damage_distribution(
    const PokemonState& attacker,
    const PokemonState& defender,
    const MoveData& move,
    const FieldState& field,
    const DamageModifiers& mods
) const {
    DamageResult result;
    result.accuracy = move.accuracy <= 0 ? 1.0f : move.accuracy / 100.0f;
    result.crit_chance = mods.force_crit ? 1.0f : CRIT_CHANCE;

    if (!move.is_damaging()) {
        result.outcomes.emplace_back(0.0f, 1.0f);
        return result;
    }

    result.effectiveness = type_effectiveness(move.type, defender.defensive_types());
    if (result.immune()) {
        result.outcomes.emplace_back(0.0f, 1.0f);
        return result;
    }

    const float max_hp = static_cast<float>(std::max(1, defender.max_hp()));
    const int current_hp = defender.current_hp();
    const bool sash = defender.item == "focussash" && defender.hp_fraction >= 1.0f;

    result.min_percent = 1e9f;
    result.max_percent = 0.0f;

    for (int c = 0; c < 2; ++c) {
        bool crit = c == 1;
        float p_crit = crit ? result.crit_chance : 1.0f - result.crit_chance;
        if (p_crit <= 0.0f) continue;

        for (int i = 0; i < NUM_ROLLS; ++i) {
            int dmg = compute_damage(attacker, defender, move, field, mods, 85 + i, crit);
            float percent = 100.0f * dmg / max_hp;
            float prob = result.accuracy * p_crit / NUM_ROLLS;

            result.outcomes.emplace_back(percent, prob);
            result.expected_percent += prob * percent;
            if (dmg >= current_hp && !sash) {
                result.ko_chance += prob;
            }

            // Range over the typical (non-crit) hits, or crits if forced
            if (crit == mods.force_crit) {
                result.min_percent = std::min(result.min_percent, percent);
                result.max_percent = std::max(result.max_percent, percent);
            }
        }
    }

    if (result.accuracy < 1.0f) {
        result.outcomes.emplace_back(0.0f, 1.0f - result.accuracy);
    }
    if (result.min_percent > result.max_percent) {
        result.min_percent = result.max_percent;
    }
    return result;
}

}  // namespace vgc
