#pragma once

/**
 * Candidate joint-action generation with progressive widening.
 *
 * Enumerates every legal single-slot action through the battle oracle,
 * scores each with the rule table, forms the cross-product over both
 * active slots, drops illegal combinations and returns the best top_k.
 * The cap grows with the number of generate() calls.
 */

#include "vgc/game/oracle.hpp"
#include "vgc/search/scoring_rules.hpp"
#include <atomic>
#include <vector>

namespace vgc {

struct CandidateConfig {
    int base_k = 15;
    int max_k = 100;
    int widen_step = 5;
    int widen_interval = 5;          // Calls between widening steps
    bool progressive_widening = true;

    float advisory_bonus = 2.0f;
    int advisory_expansion = 2;      // Pool multiplier before advisory re-ranking
};

struct ScoredJointAction {
    JointAction action;
    float score = 0.0f;
    float advisory_bonus = 0.0f;
};

class CandidateActionGenerator {
public:
    CandidateActionGenerator(
        const CandidateConfig& config,
        const BattleOracle& oracle,
        const DamageOracle& damage,
        const ScoringRules& rules
    );

    /**
     * Score-ordered shortlist, capped at the current widened top_k.
     * Counts as one call for widening. Never empty.
     *
     * @param suggestions Optional advisory shortlist used as a ranking bias
     */
    std::vector<JointAction> generate(
        Side side,
        const BattleState& state,
        const std::vector<AdvisorySuggestion>* suggestions = nullptr
    );

    /**
     * Shortlist with scores at an explicit cap. Does not advance widening.
     */
    std::vector<ScoredJointAction> generate_scored(
        Side side,
        const BattleState& state,
        int top_k,
        const std::vector<AdvisorySuggestion>* suggestions = nullptr
    ) const;

    /**
     * Every legal joint action, unscored. Same-target double switches
     * and double Terastallization are removed.
     */
    std::vector<JointAction> enumerate(Side side, const BattleState& state) const;

    // Widened cap for the n-th call (0-based)
    int top_k_for_call(long long call) const;

    int current_top_k() const { return top_k_for_call(calls_.load()); }
    long long call_count() const { return calls_.load(); }
    void reset_widening() { calls_ = 0; }

    const CandidateConfig& config() const { return config_; }

private:
    // Legal actions per active slot; forced pass for empty slots
    std::vector<std::vector<CandidateAction>> slot_actions(Side side, const BattleState& state) const;

    static bool legal_combination(const CandidateAction& a, const CandidateAction& b);

    float advisory_match(
        const JointAction& action,
        const std::vector<AdvisorySuggestion>& suggestions) const;

    CandidateConfig config_;
    const BattleOracle& oracle_;
    const DamageOracle& damage_;
    const ScoringRules& rules_;
    std::atomic<long long> calls_{0};
};

}  // namespace vgc
