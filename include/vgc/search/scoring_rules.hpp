#pragma once

/**
 * Declarative heuristic scoring.
 *
 * Every "if the action looks like X, add Y" heuristic lives here as a named
 * rule. CandidateActionGenerator ranks actions with the action and joint
 * rules; StaticEvaluator reads the state weights. Rules only see
 * precomputed facts, never the oracles, so each one can be tested alone.
 */

#include "vgc/game/action.hpp"
#include "vgc/game/battle_state.hpp"
#include "vgc/game/oracle.hpp"
#include <functional>
#include <string>
#include <vector>

namespace vgc {

// Damage facts for one target of one action
struct TargetFacts {
    bool ally = false;
    float expected_percent = 0.0f;
    float ko_chance = 0.0f;
    float effectiveness = 1.0f;
    float target_hp_percent = 100.0f;
    int8_t target = TARGET_NONE;
};

/**
 * Facts about one single-slot action in a given state.
 */
struct ActionContext {
    const BattleState* state = nullptr;
    Side side = Side::Self;
    int slot = 0;
    const PokemonState* user = nullptr;
    CandidateAction action;
    const MoveData* move = nullptr;        // nullptr for switches and passes
    std::vector<TargetFacts> targets;
    float protect_success = 1.0f;
    bool tera_gain = false;                // Tera adds STAB to the move
    const PokemonState* switch_in = nullptr;

    float foe_expected_percent() const;
    float max_ko_chance() const;
};

/**
 * Facts about a joint action (both slots).
 */
struct JointContext {
    const BattleState* state = nullptr;
    Side side = Side::Self;
    JointAction action;
    std::vector<ActionContext> slots;

    // Combined expected damage when both slots hit the same foe, else 0
    float focus_percent = 0.0f;
    float focus_target_hp_percent = 100.0f;
};

struct ActionRule {
    std::string name;
    std::function<bool(const ActionContext&)> applies;
    std::function<float(const ActionContext&)> value;
};

struct JointRule {
    std::string name;
    std::function<bool(const JointContext&)> applies;
    std::function<float(const JointContext&)> value;
};

/**
 * Weights of the static state value (self minus opponent features).
 */
struct StateWeights {
    float hp = 3.0f;
    float remaining = 2.0f;
    float status = 0.75f;
    float boosts = 0.25f;
    float speed_control = 0.4f;
    float screens = 0.3f;
    float tera = 0.2f;
};

/**
 * Compute the facts for one action by querying the damage oracle
 * against every Pokemon the action would hit.
 */
ActionContext build_action_context(
    const BattleState& state,
    Side side,
    int slot,
    const CandidateAction& action,
    const DamageOracle& damage
);

JointContext build_joint_context(
    const BattleState& state,
    Side side,
    const JointAction& action,
    const std::vector<ActionContext>& slots
);

// Damage tier value of one target hit
float damage_tier_value(const TargetFacts& facts);

class ScoringRules {
public:
    ScoringRules() = default;

    // The default rule table
    static ScoringRules standard();

    float score_action(const ActionContext& ctx) const;

    // Joint rules only; slot scores are added by the caller
    float score_joint(const JointContext& ctx) const;

    std::vector<std::string> matching_action_rules(const ActionContext& ctx) const;
    std::vector<std::string> matching_joint_rules(const JointContext& ctx) const;

    void add_action_rule(ActionRule rule) { action_rules_.push_back(std::move(rule)); }
    void add_joint_rule(JointRule rule) { joint_rules_.push_back(std::move(rule)); }

    const StateWeights& state_weights() const { return weights_; }
    void set_state_weights(const StateWeights& w) { weights_ = w; }

    size_t num_action_rules() const { return action_rules_.size(); }
    size_t num_joint_rules() const { return joint_rules_.size(); }

private:
    std::vector<ActionRule> action_rules_;
    std::vector<JointRule> joint_rules_;
    StateWeights weights_;
};

}  // namespace vgc
