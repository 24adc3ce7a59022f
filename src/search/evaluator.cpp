#include "vgc/search/evaluator.hpp"
#include "vgc/game/battle_engine.hpp"
#include "vgc/neural/state_encoder.hpp"
#include <algorithm>
#include <cmath>

namespace vgc {

namespace {

// Mean effective speed of the side's active Pokemon, 0 if none
float mean_active_speed(const SideState& side) {
    float total = 0.0f;
    int count = 0;
    for (int slot = 0; slot < ACTIVE_SLOTS; ++slot) {
        const PokemonState* p = side.active_pokemon(slot);
        if (p == nullptr) continue;
        total += static_cast<float>(ReferenceBattleEngine::effective_speed(*p, side));
        count++;
    }
    return count > 0 ? total / count : 0.0f;
}

}  // namespace

// =============================================================================
// StaticEvaluator Implementation
// =============================================================================

StaticEvaluator::StaticEvaluator(const EvaluatorConfig& config, const ScoringRules& rules)
    : config_(config), rules_(rules)
{
}

float StaticEvaluator::to_win_probability(float utility) {
    float p = (utility + 1.0f) * 0.5f;
    return std::max(0.0f, std::min(1.0f, p));
}

float StaticEvaluator::terminal_value(const BattleState& state, Side side, int ply) const {
    auto winner = state.winner();
    if (!winner) return 0.0f;
    int discounted = std::min(std::max(ply, 0), config_.max_discounted_plies);
    float magnitude = 1.0f - config_.terminal_ply_discount * discounted;
    return *winner == side ? magnitude : -magnitude;
}

StaticEvaluator::SideFeatures StaticEvaluator::side_features(const BattleState& state, Side side) const {
    SideFeatures f;
    const SideState& s = state.side(side);
    float roster = static_cast<float>(std::max<size_t>(s.roster.size(), 1));

    f.hp = s.total_hp_fraction() / roster;
    f.remaining = s.remaining() / roster;

    int statused = 0;
    for (const auto& p : s.roster) {
        if (!p.fainted() && p.status != Status::None) statused++;
    }
    f.status = -statused / roster;

    float boosts = 0.0f;
    for (int slot = 0; slot < ACTIVE_SLOTS; ++slot) {
        const PokemonState* p = s.active_pokemon(slot);
        if (p == nullptr) continue;
        for (int st = stat_index(Stat::Atk); st <= stat_index(Stat::Spe); ++st) {
            boosts += p->boosts[st];
        }
    }
    f.boosts = std::max(-1.0f, std::min(1.0f, boosts / 12.0f));

    f.speed_control = s.tailwind_turns > 0 ? 1.0f : 0.0f;
    if (state.field.trick_room()) {
        float own = mean_active_speed(s);
        float foe = mean_active_speed(state.side(opposite(side)));
        if (own > 0.0f && foe > 0.0f && own < foe) f.speed_control += 1.0f;
    }

    f.screens = (s.reflect_turns > 0 ? 0.5f : 0.0f) + (s.light_screen_turns > 0 ? 0.5f : 0.0f);
    f.tera = s.tera_used ? 0.0f : 1.0f;
    return f;
}

float StaticEvaluator::heuristic(const BattleState& state, Side side) const {
    const StateWeights& w = rules_.state_weights();
    SideFeatures own = side_features(state, side);
    SideFeatures foe = side_features(state, opposite(side));

    return w.hp * (own.hp - foe.hp)
         + w.remaining * (own.remaining - foe.remaining)
         + w.status * (own.status - foe.status)
         + w.boosts * (own.boosts - foe.boosts)
         + w.speed_control * (own.speed_control - foe.speed_control)
         + w.screens * (own.screens - foe.screens)
         + w.tera * (own.tera - foe.tera);
}

float StaticEvaluator::evaluate(const BattleState& state, Side side, int ply) const {
    if (state.is_terminal()) {
        return terminal_value(state, side, ply);
    }

    const float bound = config_.non_terminal_bound;
    float value = bound * std::tanh(config_.heuristic_scale * heuristic(state, side));

    if (config_.leaf_value && config_.neural_weight > 0.0f) {
        float nn = config_.leaf_value(StateEncoder::encode(state, side));
        nn = std::max(-bound, std::min(bound, nn));
        float w = std::min(1.0f, config_.neural_weight);
        value = (1.0f - w) * value + w * nn;
    }
    return value;
}

}  // namespace vgc
