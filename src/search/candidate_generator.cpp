#include "vgc/search/candidate_generator.hpp"
#include <algorithm>

namespace vgc {

// =============================================================================
// CandidateActionGenerator Implementation
// =============================================================================

CandidateActionGenerator::CandidateActionGenerator(
    const CandidateConfig& config,
    const BattleOracle& oracle,
    const DamageOracle& damage,
    const ScoringRules& rules
) : config_(config), oracle_(oracle), damage_(damage), rules_(rules)
{
    config_.base_k = std::max(1, config_.base_k);
    config_.max_k = std::max(config_.base_k, config_.max_k);
    config_.widen_interval = std::max(1, config_.widen_interval);
    config_.widen_step = std::max(0, config_.widen_step);
    config_.advisory_expansion = std::max(1, config_.advisory_expansion);
}

int CandidateActionGenerator::top_k_for_call(long long call) const {
    if (!config_.progressive_widening || call <= 0) {
        return config_.base_k;
    }
    long long steps = call / config_.widen_interval;
    long long k = config_.base_k + steps * static_cast<long long>(config_.widen_step);
    return static_cast<int>(std::min<long long>(k, config_.max_k));
}

std::vector<std::vector<CandidateAction>> CandidateActionGenerator::slot_actions(
    Side side, const BattleState& state
) const {
    std::vector<std::vector<CandidateAction>> per_slot(ACTIVE_SLOTS);
    const SideState& foe = state.side(opposite(side));

    for (int slot = 0; slot < ACTIVE_SLOTS; ++slot) {
        per_slot[slot] = oracle_.legal_actions(state, side, slot);
        if (!per_slot[slot].empty()) continue;

        // Nothing legal: forced pass for an empty slot, Struggle otherwise
        if (state.side(side).active_pokemon(slot) == nullptr) {
            per_slot[slot].push_back(CandidateAction::pass());
        } else {
            int8_t target = TARGET_NONE;
            for (int s = 0; s < ACTIVE_SLOTS; ++s) {
                if (foe.active_pokemon(s) != nullptr) {
                    target = foe_target(s);
                    break;
                }
            }
            per_slot[slot].push_back(CandidateAction::use_move(struggle_move(), target));
        }
    }
    return per_slot;
}

bool CandidateActionGenerator::legal_combination(const CandidateAction& a, const CandidateAction& b) {
    if (a.is_switch() && b.is_switch() && a.switch_index() == b.switch_index()) {
        return false;
    }
    if (a.is_tera() && b.is_tera()) {
        return false;
    }
    return true;
}

std::vector<JointAction> CandidateActionGenerator::enumerate(
    Side side, const BattleState& state
) const {
    auto per_slot = slot_actions(side, state);
    std::vector<JointAction> joints;
    joints.reserve(per_slot[0].size() * per_slot[1].size());
    for (const auto& a : per_slot[0]) {
        for (const auto& b : per_slot[1]) {
            if (legal_combination(a, b)) {
                joints.emplace_back(a, b);
            }
        }
    }
    if (joints.empty()) {
        joints.emplace_back(per_slot[0].front(), CandidateAction::pass());
    }
    return joints;
}

float CandidateActionGenerator::advisory_match(
    const JointAction& action,
    const std::vector<AdvisorySuggestion>& suggestions
) const {
    int matched = 0;
    float alignment = 0.0f;
    for (int slot = 0; slot < action.size; ++slot) {
        const CandidateAction& a = action[slot];
        for (const auto& s : suggestions) {
            if (s.slot != slot) continue;
            bool hit = s.move_id == "switch" ? a.is_switch() : (!a.is_switch() && a.move_id() == s.move_id);
            if (hit) {
                matched++;
                alignment += std::max(0.0f, std::min(1.0f, s.plan_alignment));
                break;
            }
        }
    }
    if (matched == 0) return 0.0f;
    float fraction = static_cast<float>(matched) / static_cast<float>(action.size);
    return fraction * (alignment / matched);
}

std::vector<ScoredJointAction> CandidateActionGenerator::generate_scored(
    Side side,
    const BattleState& state,
    int top_k,
    const std::vector<AdvisorySuggestion>* suggestions
) const {
    top_k = std::max(1, top_k);
    auto per_slot = slot_actions(side, state);

    // Single-slot facts and scores, computed once per slot
    std::vector<std::vector<ActionContext>> contexts(ACTIVE_SLOTS);
    std::vector<std::vector<float>> scores(ACTIVE_SLOTS);
    for (int slot = 0; slot < ACTIVE_SLOTS; ++slot) {
        for (const auto& a : per_slot[slot]) {
            contexts[slot].push_back(build_action_context(state, side, slot, a, damage_));
            scores[slot].push_back(rules_.score_action(contexts[slot].back()));
        }
    }

    std::vector<ScoredJointAction> scored;
    scored.reserve(per_slot[0].size() * per_slot[1].size());
    for (size_t i = 0; i < per_slot[0].size(); ++i) {
        for (size_t j = 0; j < per_slot[1].size(); ++j) {
            if (!legal_combination(per_slot[0][i], per_slot[1][j])) continue;

            ScoredJointAction sj;
            sj.action = JointAction(per_slot[0][i], per_slot[1][j]);
            JointContext jc = build_joint_context(
                state, side, sj.action, {contexts[0][i], contexts[1][j]});
            sj.score = scores[0][i] + scores[1][j] + rules_.score_joint(jc);
            scored.push_back(std::move(sj));
        }
    }

    if (scored.empty()) {
        ScoredJointAction forced;
        forced.action = JointAction(per_slot[0].front(), CandidateAction::pass());
        scored.push_back(forced);
        return scored;
    }

    auto by_score = [](const ScoredJointAction& a, const ScoredJointAction& b) {
        return a.score > b.score;
    };
    std::stable_sort(scored.begin(), scored.end(), by_score);

    bool advised = suggestions != nullptr && !suggestions->empty();
    size_t pool = static_cast<size_t>(top_k) * (advised ? config_.advisory_expansion : 1);
    if (scored.size() > pool) scored.resize(pool);

    if (advised) {
        for (auto& sj : scored) {
            sj.advisory_bonus = config_.advisory_bonus * advisory_match(sj.action, *suggestions);
            sj.score += sj.advisory_bonus;
        }
        std::stable_sort(scored.begin(), scored.end(), by_score);
    }

    if (scored.size() > static_cast<size_t>(top_k)) scored.resize(top_k);
    return scored;
}

std::vector<JointAction> CandidateActionGenerator::generate(
    Side side,
    const BattleState& state,
    const std::vector<AdvisorySuggestion>* suggestions
) {
    long long call = calls_.fetch_add(1);
    int top_k = top_k_for_call(call);

    std::vector<JointAction> actions;
    for (auto& sj : generate_scored(side, state, top_k, suggestions)) {
        actions.push_back(std::move(sj.action));
    }
    return actions;
}

}  // namespace vgc
