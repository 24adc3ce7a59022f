/**
 * Reference doubles battle engine.
 *
 * Chance is injected through ChanceSource: apply() draws from a seeded
 * generator, enumerate_outcomes() replays every decision sequence
 * depth-first with a scripted source and merges identical results.
 */

#include "vgc/game/battle_engine.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <unordered_map>

namespace vgc {

namespace {

using ChanceSource = ReferenceBattleEngine::ChanceSource;

class SeededChance : public ChanceSource {
public:
    explicit SeededChance(uint64_t seed) : rng_(seed) {}

    bool chance(float probability) override {
        if (probability >= 1.0f) return true;
        if (probability <= 0.0f) return false;
        return uniform_(rng_) < probability;
    }

    int damage_roll() override {
        return 85 + static_cast<int>(rng_() % 16);
    }

private:
    std::mt19937_64 rng_;
    std::uniform_real_distribution<float> uniform_{0.0f, 1.0f};
};

class ScriptedChance : public ChanceSource {
public:
    explicit ScriptedChance(const std::vector<int>& script) : script_(script) {}

    bool chance(float probability) override {
        if (probability >= 1.0f) return true;
        if (probability <= 0.0f) return false;
        int c = next(2);
        probability_ *= (c == 0) ? probability : 1.0f - probability;
        return c == 0;
    }

    int damage_roll() override {
        int c = next(2);
        probability_ *= 0.5f;
        return ReferenceBattleEngine::ENUMERATED_ROLLS[c];
    }

    float probability() const { return probability_; }
    const std::vector<int>& choices() const { return choices_; }
    const std::vector<int>& options() const { return options_; }

private:
    int next(int num_options) {
        int c = pos_ < script_.size() ? script_[pos_] : 0;
        choices_.push_back(c);
        options_.push_back(num_options);
        ++pos_;
        return c;
    }

    const std::vector<int>& script_;
    size_t pos_ = 0;
    float probability_ = 1.0f;
    std::vector<int> choices_;
    std::vector<int> options_;
};

struct PendingMove {
    Side side;
    int slot;
    int roster_index;
    const CandidateAction* action;
    const MoveData* move;
    int priority;
    int speed;
};

// Per-turn volatile flags
struct TurnFlags {
    bool protected_slot[NUM_SIDES][ACTIVE_SLOTS] = {};
    bool flinched[NUM_SIDES][ACTIVE_SLOTS] = {};
    bool moved[NUM_SIDES][ACTIVE_SLOTS] = {};
    int redirect_slot[NUM_SIDES] = {-1, -1};
};

void reset_on_exit(PokemonState& p) {
    p.boosts.fill(0);
    p.locked_move.clear();
    p.protect_streak = 0;
    p.turns_active = 0;
}

void do_switch(SideState& side, int slot, int roster_index) {
    if (roster_index < 0 || roster_index >= static_cast<int>(side.roster.size())) {
        throw OracleError("Switch target out of range: " + std::to_string(roster_index));
    }
    if (side.roster[roster_index].fainted()) {
        throw OracleError("Cannot switch to fainted " + side.roster[roster_index].species);
    }
    if (side.is_active(roster_index)) {
        throw OracleError("Switch target already active: " + side.roster[roster_index].species);
    }
    int outgoing = side.active[slot];
    if (outgoing >= 0) {
        reset_on_exit(side.roster[outgoing]);
    }
    side.active[slot] = roster_index;
    reset_on_exit(side.roster[roster_index]);
}

void clamp_hp(PokemonState& p) {
    p.hp_fraction = std::max(0.0f, std::min(1.0f, p.hp_fraction));
}

void apply_damage(PokemonState& target, int damage) {
    int hp = target.current_hp();
    if (damage >= hp && target.item == "focussash" && target.hp_fraction >= 1.0f) {
        damage = hp - 1;
        target.item.clear();
        target.item_revealed = true;
    }
    int remaining = std::max(0, hp - damage);
    target.hp_fraction = static_cast<float>(remaining) / std::max(1, target.max_hp());

    if (!target.fainted() && target.hp_fraction <= 0.5f && target.item == "sitrusberry") {
        target.hp_fraction += 0.25f;
        target.item.clear();
        target.item_revealed = true;
        clamp_hp(target);
    }
}

void apply_status_effect(
    BattleState& state, const PendingMove& pm, PokemonState& user, TurnFlags& flags
) {
    SideState& side = state.side(pm.side);
    int s = side_index(pm.side);
    switch (pm.move->effect) {
        case MoveEffect::Tailwind:
            side.tailwind_turns = 4;
            break;
        case MoveEffect::TrickRoom:
            state.field.trick_room_turns = state.field.trick_room() ? 0 : 5;
            break;
        case MoveEffect::Reflect:
            side.reflect_turns = 5;
            break;
        case MoveEffect::LightScreen:
            side.light_screen_turns = 5;
            break;
        case MoveEffect::Redirect:
            flags.redirect_slot[s] = pm.slot;
            break;
        case MoveEffect::BoostAtk2: {
            int8_t& b = user.boosts[stat_index(Stat::Atk)];
            b = static_cast<int8_t>(std::min(6, b + 2));
            break;
        }
        case MoveEffect::BoostSpA2: {
            int8_t& b = user.boosts[stat_index(Stat::SpA)];
            b = static_cast<int8_t>(std::min(6, b + 2));
            break;
        }
        case MoveEffect::Heal50:
            user.hp_fraction += 0.5f;
            clamp_hp(user);
            break;
        case MoveEffect::None:
        case MoveEffect::Protect:
        case MoveEffect::FakeOut:
        case MoveEffect::SpeedDrop:
            break;
    }
}

void end_of_turn(BattleState& state) {
    for (auto& side : state.sides) {
        for (int slot = 0; slot < ACTIVE_SLOTS; ++slot) {
            PokemonState* p = side.active_pokemon(slot);
            if (p == nullptr) continue;

            if (p->item == "leftovers" && p->hp_fraction < 1.0f) {
                p->hp_fraction += 1.0f / 16.0f;
                p->item_revealed = true;
            }
            if (p->status == Status::Burn) {
                p->hp_fraction -= 1.0f / 16.0f;
            } else if (p->status == Status::Poison || p->status == Status::Toxic) {
                p->hp_fraction -= 1.0f / 8.0f;
            }
            clamp_hp(*p);
            p->turns_active++;
        }

        if (side.tailwind_turns > 0) side.tailwind_turns--;
        if (side.reflect_turns > 0) side.reflect_turns--;
        if (side.light_screen_turns > 0) side.light_screen_turns--;
    }

    FieldState& field = state.field;
    if (field.trick_room_turns > 0) field.trick_room_turns--;
    if (field.weather_turns > 0 && --field.weather_turns == 0) field.weather = Weather::None;
    if (field.terrain_turns > 0 && --field.terrain_turns == 0) field.terrain = Terrain::None;

    // Fainted actives are replaced by the first healthy reserve
    for (auto& side : state.sides) {
        for (int slot = 0; slot < ACTIVE_SLOTS; ++slot) {
            int idx = side.active[slot];
            if (idx < 0 || !side.roster[idx].fainted()) continue;
            std::vector<int> bench = side.bench();
            if (bench.empty()) {
                side.active[slot] = -1;
            } else {
                side.active[slot] = bench.front();
                reset_on_exit(side.roster[bench.front()]);
            }
        }
    }

    state.turn++;
}

}  // namespace

int ReferenceBattleEngine::effective_speed(const PokemonState& pokemon, const SideState& side) {
    float speed = static_cast<float>(pokemon.boosted_stat(Stat::Spe));
    if (pokemon.status == Status::Paralysis) speed *= 0.5f;
    if (pokemon.item == "choicescarf") speed *= 1.5f;
    if (side.tailwind_turns > 0) speed *= 2.0f;
    return static_cast<int>(speed);
}

std::vector<CandidateAction> ReferenceBattleEngine::legal_actions(
    const BattleState& state, Side side, int slot
) const {
    std::vector<CandidateAction> actions;
    const SideState& own = state.side(side);
    const SideState& foe = state.side(opposite(side));
    const PokemonState* user = own.active_pokemon(slot);

    if (user == nullptr) {
        actions.push_back(CandidateAction::pass());
        return actions;
    }

    std::vector<int8_t> foe_targets;
    for (int s = 0; s < ACTIVE_SLOTS; ++s) {
        if (foe.active_pokemon(s) != nullptr) foe_targets.push_back(foe_target(s));
    }
    int ally_slot = 1 - slot;
    bool ally_alive = own.active_pokemon(ally_slot) != nullptr;
    bool can_tera = !own.tera_used && !user->terastallized && user->tera_type != Type::None;

    for (const auto& ms : user->moves) {
        if (ms.pp <= 0 || ms.disabled) continue;
        if (!user->locked_move.empty() && ms.id != user->locked_move) continue;

        const MoveData& move = find_move(ms.id);
        std::vector<int8_t> targets;
        if (move.target == MoveTarget::Normal) {
            targets = foe_targets;
            if (move.is_damaging() && ally_alive) targets.push_back(ally_target(ally_slot));
            if (targets.empty()) targets.push_back(TARGET_NONE);
        } else {
            targets.push_back(TARGET_NONE);
        }

        for (int8_t t : targets) {
            actions.push_back(CandidateAction::use_move(move, t));
            if (can_tera) {
                actions.push_back(CandidateAction::terastallize(move, t));
            }
        }
    }

    if (actions.empty()) {
        // No usable move: Struggle
        int8_t t = foe_targets.empty() ? TARGET_NONE : foe_targets.front();
        actions.push_back(CandidateAction::use_move(struggle_move(), t));
    }

    for (int idx : own.bench()) {
        actions.push_back(CandidateAction::switch_to(idx));
    }
    return actions;
}

StepResult ReferenceBattleEngine::apply(
    const BattleState& state, const TurnActions& actions, uint64_t seed
) const {
    SeededChance chance(seed);
    return resolve(state, actions, chance);
}

bool ReferenceBattleEngine::enumerate_outcomes(
    const BattleState& state,
    const TurnActions& actions,
    size_t max_branches,
    std::vector<ChanceBranch>& out
) const {
    out.clear();
    std::unordered_map<uint64_t, size_t> index;
    std::vector<int> script;

    while (true) {
        ScriptedChance chance(script);
        StepResult result = resolve(state, actions, chance);

        uint64_t sig = result.next.signature();
        auto it = index.find(sig);
        if (it != index.end()) {
            out[it->second].probability += chance.probability();
        } else {
            index[sig] = out.size();
            out.push_back(ChanceBranch{std::move(result), chance.probability()});
            if (out.size() > max_branches) {
                return false;
            }
        }

        // Advance the decision sequence like an odometer, last decision first
        const std::vector<int>& choices = chance.choices();
        const std::vector<int>& options = chance.options();
        int i = static_cast<int>(choices.size()) - 1;
        while (i >= 0 && choices[i] + 1 >= options[i]) {
            --i;
        }
        if (i < 0) break;
        script.assign(choices.begin(), choices.begin() + i + 1);
        script[i]++;
    }
    return true;
}

StepResult ReferenceBattleEngine::resolve(
    const BattleState& state, const TurnActions& actions, ChanceSource& chance
) const {
    BattleState next = state;
    TurnFlags flags;

    // Switches, fastest first
    struct PendingSwitch { Side side; int slot; int roster_index; int speed; };
    std::vector<PendingSwitch> switches;
    for (int s = 0; s < NUM_SIDES; ++s) {
        Side side = static_cast<Side>(s);
        const JointAction& joint = actions[s];
        for (int slot = 0; slot < joint.size; ++slot) {
            if (!joint[slot].is_switch()) continue;
            const PokemonState* outgoing = next.side(side).active_pokemon(slot);
            int speed = outgoing ? effective_speed(*outgoing, next.side(side)) : 0;
            switches.push_back({side, slot, joint[slot].switch_index(), speed});
        }
        if (joint.size == ACTIVE_SLOTS && joint[0].is_switch() && joint[1].is_switch() &&
            joint[0].switch_index() == joint[1].switch_index()) {
            throw OracleError("Both slots switch to the same Pokemon");
        }
        if (joint.tera_count() > 1) {
            throw OracleError("Only one Pokemon may Terastallize per battle");
        }
    }
    std::stable_sort(switches.begin(), switches.end(),
        [](const PendingSwitch& a, const PendingSwitch& b) { return a.speed > b.speed; });
    for (const auto& sw : switches) {
        do_switch(next.side(sw.side), sw.slot, sw.roster_index);
    }

    // Terastallization, then move ordering
    std::vector<PendingMove> moves;
    for (int s = 0; s < NUM_SIDES; ++s) {
        Side side = static_cast<Side>(s);
        SideState& own = next.side(side);
        const JointAction& joint = actions[s];

        for (int slot = 0; slot < joint.size; ++slot) {
            const CandidateAction& action = joint[slot];
            if (action.is_switch() || action.is_pass()) continue;

            PokemonState* user = own.active_pokemon(slot);
            if (user == nullptr) {
                throw OracleError("Move chosen for empty slot " + std::to_string(slot));
            }

            if (action.is_tera()) {
                if (own.tera_used || user->terastallized) {
                    throw OracleError("Terastallization already used by " + side_to_string(side));
                }
                user->terastallized = true;
                own.tera_used = true;
            }

            const MoveData& move = find_move(action.move_id());
            if (move.id != "struggle") {
                const MoveSlot* ms = user->find_move_slot(move.id);
                if (ms == nullptr || ms->pp <= 0) {
                    throw OracleError(user->species + " cannot use " + move.id);
                }
            }
            moves.push_back({side, slot, own.active[slot], &action, &move,
                             move.priority, effective_speed(*user, own)});
        }
    }

    bool trick_room = next.field.trick_room();
    std::stable_sort(moves.begin(), moves.end(),
        [trick_room](const PendingMove& a, const PendingMove& b) {
            if (a.priority != b.priority) return a.priority > b.priority;
            return trick_room ? a.speed < b.speed : a.speed > b.speed;
        });
    for (size_t i = 0; i + 1 < moves.size(); ++i) {
        if (moves[i].priority == moves[i + 1].priority &&
            moves[i].speed == moves[i + 1].speed && chance.chance(0.5f)) {
            std::swap(moves[i], moves[i + 1]);
        }
    }

    for (const PendingMove& pm : moves) {
        int s = side_index(pm.side);
        SideState& own = next.side(pm.side);
        if (own.active[pm.slot] != pm.roster_index) continue;

        PokemonState* user = own.active_pokemon(pm.slot);
        if (user == nullptr) continue;
        flags.moved[s][pm.slot] = true;
        if (flags.flinched[s][pm.slot]) continue;

        const MoveData& move = *pm.move;
        if (move.id != "struggle") {
            user->find_move_slot(move.id)->pp--;
            if (user->holds_choice_item()) user->locked_move = move.id;
        }

        if (move.effect == MoveEffect::Protect) {
            float success = 1.0f / std::pow(3.0f, static_cast<float>(user->protect_streak));
            if (chance.chance(success)) {
                flags.protected_slot[s][pm.slot] = true;
                user->protect_streak++;
            } else {
                user->protect_streak = 0;
            }
            continue;
        }
        user->protect_streak = 0;

        if (!move.is_damaging()) {
            apply_status_effect(next, pm, *user, flags);
            continue;
        }
        if (move.effect == MoveEffect::FakeOut && user->turns_active > 0) {
            continue;
        }

        // Target resolution with redirection and retargeting
        Side foe_side = opposite(pm.side);
        SideState& foe = next.side(foe_side);
        std::vector<std::pair<Side, int>> targets;
        if (move.target == MoveTarget::Normal) {
            int8_t t = pm.action->target();
            if (is_ally_target(t)) {
                int ally = target_slot(t);
                if (ally != pm.slot && own.active_pokemon(ally) != nullptr) {
                    targets.emplace_back(pm.side, ally);
                }
            } else {
                int ts = is_foe_target(t) ? target_slot(t) : 0;
                int redirect = flags.redirect_slot[side_index(foe_side)];
                if (redirect >= 0 && foe.active_pokemon(redirect) != nullptr) ts = redirect;
                if (foe.active_pokemon(ts) == nullptr) ts = 1 - ts;
                if (foe.active_pokemon(ts) != nullptr) targets.emplace_back(foe_side, ts);
            }
        } else {
            for (int ts = 0; ts < ACTIVE_SLOTS; ++ts) {
                if (foe.active_pokemon(ts) != nullptr) targets.emplace_back(foe_side, ts);
            }
            if (move.target == MoveTarget::AllAdjacent) {
                int ally = 1 - pm.slot;
                if (own.active_pokemon(ally) != nullptr) targets.emplace_back(pm.side, ally);
            }
        }

        DamageModifiers mods;
        mods.spread = targets.size() > 1;
        bool dealt = false;
        for (const auto& target_ref : targets) {
            SideState& target_side = next.side(target_ref.first);
            PokemonState* target = target_side.active_pokemon(target_ref.second);
            if (target == nullptr) continue;
            if (flags.protected_slot[side_index(target_ref.first)][target_ref.second]) continue;
            if (move.accuracy > 0 && !chance.chance(move.accuracy / 100.0f)) continue;

            bool crit = chance.chance(StandardDamageCalc::CRIT_CHANCE);
            int roll = chance.damage_roll();
            mods.reflect = target_side.reflect_turns > 0;
            mods.light_screen = target_side.light_screen_turns > 0;

            int damage = calc_.compute_damage(*user, *target, move, next.field, mods, roll, crit);
            if (damage <= 0) continue;
            apply_damage(*target, damage);
            dealt = true;

            if (move.effect == MoveEffect::SpeedDrop && !target->fainted()) {
                int8_t& b = target->boosts[stat_index(Stat::Spe)];
                b = static_cast<int8_t>(std::max(-6, b - 1));
            }
            if (move.effect == MoveEffect::FakeOut &&
                !flags.moved[side_index(target_ref.first)][target_ref.second]) {
                flags.flinched[side_index(target_ref.first)][target_ref.second] = true;
            }
        }

        if (dealt && user->item == "lifeorb") {
            user->hp_fraction -= 0.1f;
            user->item_revealed = true;
            clamp_hp(*user);
        }
        if (move.id == "struggle") {
            user->hp_fraction -= 0.25f;
            clamp_hp(*user);
        }
    }

    end_of_turn(next);

    StepResult result;
    result.terminal = next.is_terminal();
    result.winner = next.winner();
    result.next = std::move(next);
    return result;
}

}  // namespace vgc
