#include "vgc/search/scoring_rules.hpp"
#include <algorithm>
#include <cmath>

namespace vgc {

namespace {

bool is_damaging(const ActionContext& c) {
    return c.move != nullptr && c.move->is_damaging();
}

bool has_effect(const ActionContext& c, MoveEffect effect) {
    return c.move != nullptr && c.move->effect == effect;
}

float user_hp(const ActionContext& c) {
    return c.user ? c.user->hp_fraction : 0.0f;
}

// One slot satisfies a, the other b
bool pair_of(
    const JointContext& j,
    const std::function<bool(const ActionContext&)>& a,
    const std::function<bool(const ActionContext&)>& b
) {
    if (j.slots.size() < 2) return false;
    return (a(j.slots[0]) && b(j.slots[1])) || (a(j.slots[1]) && b(j.slots[0]));
}

}  // namespace

// =============================================================================
// Context construction
// =============================================================================

float ActionContext::foe_expected_percent() const {
    float total = 0.0f;
    for (const auto& t : targets) {
        if (!t.ally) total += t.expected_percent;
    }
    return total;
}

float ActionContext::max_ko_chance() const {
    float best = 0.0f;
    for (const auto& t : targets) {
        if (!t.ally) best = std::max(best, t.ko_chance);
    }
    return best;
}

ActionContext build_action_context(
    const BattleState& state,
    Side side,
    int slot,
    const CandidateAction& action,
    const DamageOracle& damage
) {
    ActionContext ctx;
    ctx.state = &state;
    ctx.side = side;
    ctx.slot = slot;
    ctx.action = action;

    const SideState& own = state.side(side);
    const SideState& foe = state.side(opposite(side));
    ctx.user = own.active_pokemon(slot);

    if (action.is_switch()) {
        int idx = action.switch_index();
        if (idx >= 0 && idx < static_cast<int>(own.roster.size())) {
            ctx.switch_in = &own.roster[idx];
        }
        return ctx;
    }
    if (action.is_pass() || ctx.user == nullptr) {
        return ctx;
    }

    ctx.move = lookup_move(action.move_id());
    if (ctx.move == nullptr) {
        return ctx;
    }
    const MoveData& move = *ctx.move;

    ctx.protect_success = 1.0f / std::pow(3.0f, static_cast<float>(ctx.user->protect_streak));
    ctx.tera_gain = action.is_tera() && move.is_damaging() && !ctx.user->terastallized &&
                    move.type == ctx.user->tera_type && !ctx.user->has_type(move.type);

    if (!move.is_damaging()) {
        return ctx;
    }

    // Same targeting as the engine, minus redirection
    std::vector<std::pair<Side, int>> hits;
    if (move.target == MoveTarget::Normal) {
        int8_t t = action.target();
        if (is_ally_target(t)) {
            int ally = target_slot(t);
            if (ally != slot && own.active_pokemon(ally) != nullptr) hits.emplace_back(side, ally);
        } else {
            int ts = is_foe_target(t) ? target_slot(t) : 0;
            if (foe.active_pokemon(ts) == nullptr) ts = 1 - ts;
            if (foe.active_pokemon(ts) != nullptr) hits.emplace_back(opposite(side), ts);
        }
    } else if (move.is_spread()) {
        for (int ts = 0; ts < ACTIVE_SLOTS; ++ts) {
            if (foe.active_pokemon(ts) != nullptr) hits.emplace_back(opposite(side), ts);
        }
        if (move.target == MoveTarget::AllAdjacent) {
            int ally = 1 - slot;
            if (own.active_pokemon(ally) != nullptr) hits.emplace_back(side, ally);
        }
    }

    PokemonState attacker = *ctx.user;
    if (action.is_tera()) attacker.terastallized = true;

    DamageModifiers mods;
    mods.spread = hits.size() > 1;
    for (const auto& hit : hits) {
        const SideState& target_side = state.side(hit.first);
        const PokemonState* target = target_side.active_pokemon(hit.second);
        mods.reflect = target_side.reflect_turns > 0;
        mods.light_screen = target_side.light_screen_turns > 0;

        DamageResult r = damage.damage_distribution(attacker, *target, move, state.field, mods);
        TargetFacts facts;
        facts.ally = hit.first == side;
        facts.expected_percent = r.expected_percent;
        facts.ko_chance = r.ko_chance;
        facts.effectiveness = r.effectiveness;
        facts.target_hp_percent = target->hp_fraction * 100.0f;
        facts.target = facts.ally ? ally_target(hit.second) : foe_target(hit.second);
        ctx.targets.push_back(facts);
    }
    return ctx;
}

JointContext build_joint_context(
    const BattleState& state,
    Side side,
    const JointAction& action,
    const std::vector<ActionContext>& slots
) {
    JointContext j;
    j.state = &state;
    j.side = side;
    j.action = action;
    j.slots = slots;

    if (slots.size() == 2 &&
        is_damaging(slots[0]) && is_damaging(slots[1]) &&
        !slots[0].move->is_spread() && !slots[1].move->is_spread() &&
        !slots[0].targets.empty() && !slots[1].targets.empty()) {
        const TargetFacts& a = slots[0].targets.front();
        const TargetFacts& b = slots[1].targets.front();
        if (!a.ally && !b.ally && a.target == b.target) {
            j.focus_percent = a.expected_percent + b.expected_percent;
            j.focus_target_hp_percent = a.target_hp_percent;
        }
    }
    return j;
}

float damage_tier_value(const TargetFacts& facts) {
    float value;
    if (facts.ko_chance >= 0.9f) {
        value = 2.0f + facts.ko_chance;
    } else if (facts.ko_chance >= 0.5f) {
        value = 1.5f + 0.5f * facts.ko_chance;
    } else {
        value = facts.expected_percent / 100.0f;
    }
    if (facts.effectiveness > 1.0f) value *= 1.2f;
    return value;
}

// =============================================================================
// ScoringRules Implementation
// =============================================================================

ScoringRules ScoringRules::standard() {
    ScoringRules rules;

    // ----- Damage -----
    rules.add_action_rule({"damage",
        [](const ActionContext& c) { return is_damaging(c) && c.foe_expected_percent() > 0.0f; },
        [](const ActionContext& c) {
            float total = 0.0f;
            for (const auto& t : c.targets) {
                if (!t.ally) total += damage_tier_value(t);
            }
            return total;
        }});
    rules.add_action_rule({"immune_target",
        [](const ActionContext& c) {
            if (!is_damaging(c) || c.targets.empty()) return false;
            for (const auto& t : c.targets) {
                if (!t.ally && t.effectiveness > 0.0f) return false;
            }
            return true;
        },
        [](const ActionContext&) { return -0.5f; }});
    rules.add_action_rule({"ally_attack",
        [](const ActionContext& c) { return is_damaging(c) && is_ally_target(c.action.target()); },
        [](const ActionContext&) { return -0.8f; }});
    rules.add_action_rule({"spread_ally_hit",
        [](const ActionContext& c) {
            if (!is_damaging(c) || !c.move->is_spread()) return false;
            for (const auto& t : c.targets) {
                if (t.ally && t.expected_percent > 0.0f) return true;
            }
            return false;
        },
        [](const ActionContext& c) {
            float penalty = 0.0f;
            for (const auto& t : c.targets) {
                if (t.ally) penalty += t.expected_percent / 100.0f + t.ko_chance;
            }
            return -penalty;
        }});

    // ----- Terastallization -----
    rules.add_action_rule({"tera_stab",
        [](const ActionContext& c) { return c.tera_gain; },
        [](const ActionContext&) { return 0.4f; }});
    rules.add_action_rule({"tera_wasted",
        [](const ActionContext& c) { return c.action.is_tera() && !c.tera_gain; },
        [](const ActionContext&) { return -0.1f; }});

    // ----- Move tags -----
    rules.add_action_rule({"protect",
        [](const ActionContext& c) { return c.action.has_tag(TAG_PROTECT); },
        [](const ActionContext& c) { return 0.6f * c.protect_success; }});
    rules.add_action_rule({"fake_out",
        [](const ActionContext& c) {
            return c.action.has_tag(TAG_FAKE_OUT) && c.user && c.user->turns_active == 0;
        },
        [](const ActionContext&) { return 0.9f; }});
    rules.add_action_rule({"fake_out_fails",
        [](const ActionContext& c) {
            return c.action.has_tag(TAG_FAKE_OUT) && c.user && c.user->turns_active > 0;
        },
        [](const ActionContext&) { return -1.0f; }});
    rules.add_action_rule({"tailwind",
        [](const ActionContext& c) {
            return has_effect(c, MoveEffect::Tailwind) && c.state->side(c.side).tailwind_turns == 0;
        },
        [](const ActionContext&) { return 1.0f; }});
    rules.add_action_rule({"trick_room",
        [](const ActionContext& c) {
            return has_effect(c, MoveEffect::TrickRoom) && !c.state->field.trick_room();
        },
        [](const ActionContext&) { return 1.0f; }});
    rules.add_action_rule({"redirection",
        [](const ActionContext& c) {
            return c.action.has_tag(TAG_REDIRECTION) &&
                   c.state->side(c.side).active_pokemon(1 - c.slot) != nullptr;
        },
        [](const ActionContext&) { return 0.8f; }});
    rules.add_action_rule({"speed_drop_spread",
        [](const ActionContext& c) {
            return has_effect(c, MoveEffect::SpeedDrop) && c.move->is_spread();
        },
        [](const ActionContext&) { return 0.7f; }});
    rules.add_action_rule({"setup",
        [](const ActionContext& c) { return c.action.has_tag(TAG_SETUP); },
        [](const ActionContext&) { return 0.5f; }});
    rules.add_action_rule({"healing",
        [](const ActionContext& c) { return c.action.has_tag(TAG_HEALING) && user_hp(c) < 0.5f; },
        [](const ActionContext&) { return 0.6f; }});
    rules.add_action_rule({"screen",
        [](const ActionContext& c) {
            const SideState& own = c.state->side(c.side);
            return (has_effect(c, MoveEffect::Reflect) && own.reflect_turns == 0) ||
                   (has_effect(c, MoveEffect::LightScreen) && own.light_screen_turns == 0);
        },
        [](const ActionContext&) { return 0.5f; }});

    // ----- Switching -----
    rules.add_action_rule({"switch",
        [](const ActionContext& c) { return c.action.is_switch(); },
        [](const ActionContext&) { return 0.3f; }});
    rules.add_action_rule({"switch_escape",
        [](const ActionContext& c) { return c.action.is_switch() && c.user && user_hp(c) < 0.3f; },
        [](const ActionContext&) { return 0.4f; }});
    rules.add_action_rule({"switch_unneeded",
        [](const ActionContext& c) { return c.action.is_switch() && c.user && user_hp(c) > 0.8f; },
        [](const ActionContext&) { return -0.3f; }});

    // ----- Joint synergies -----
    rules.add_joint_rule({"redirect_support",
        [](const JointContext& j) {
            return pair_of(j,
                [](const ActionContext& c) { return c.action.has_tag(TAG_REDIRECTION); },
                is_damaging);
        },
        [](const JointContext&) { return 0.4f; }});
    rules.add_joint_rule({"speed_control_support",
        [](const JointContext& j) {
            return pair_of(j,
                [](const ActionContext& c) { return c.action.has_tag(TAG_SPEED_CONTROL); },
                is_damaging);
        },
        [](const JointContext&) { return 0.3f; }});
    rules.add_joint_rule({"focus_fire",
        [](const JointContext& j) { return j.focus_percent > 0.0f; },
        [](const JointContext&) { return 0.5f; }});
    rules.add_joint_rule({"focus_fire_ko",
        [](const JointContext& j) {
            return j.focus_percent > 0.0f && j.focus_percent >= j.focus_target_hp_percent;
        },
        [](const JointContext&) { return 1.0f; }});
    rules.add_joint_rule({"double_protect",
        [](const JointContext& j) {
            return j.slots.size() == 2 &&
                   j.slots[0].action.has_tag(TAG_PROTECT) && j.slots[1].action.has_tag(TAG_PROTECT);
        },
        [](const JointContext&) { return -1.0f; }});
    return rules;
}

float ScoringRules::score_action(const ActionContext& ctx) const {
    float score = 0.0f;
    for (const auto& rule : action_rules_) {
        if (rule.applies(ctx)) score += rule.value(ctx);
    }
    return score;
}

float ScoringRules::score_joint(const JointContext& ctx) const {
    float score = 0.0f;
    for (const auto& rule : joint_rules_) {
        if (rule.applies(ctx)) score += rule.value(ctx);
    }
    return score;
}

std::vector<std::string> ScoringRules::matching_action_rules(const ActionContext& ctx) const {
    std::vector<std::string> names;
    for (const auto& rule : action_rules_) {
        if (rule.applies(ctx)) names.push_back(rule.name);
    }
    return names;
}

std::vector<std::string> ScoringRules::matching_joint_rules(const JointContext& ctx) const {
    std::vector<std::string> names;
    for (const auto& rule : joint_rules_) {
        if (rule.applies(ctx)) names.push_back(rule.name);
    }
    return names;
}

}  // namespace vgc
