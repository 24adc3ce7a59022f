#pragma once

/**
 * Reference doubles battle engine.
 *
 * A compact rules implementation of the BattleOracle interface, used by
 * the self-play evaluator, the Python bindings and the tests. Production
 * deployments plug a full simulator adapter in behind the same interface.
 */

#include "vgc/game/damage_calc.hpp"
#include "vgc/game/oracle.hpp"

namespace vgc {

class ReferenceBattleEngine : public BattleOracle {
public:
    // Damage roll buckets used when enumerating chance branches
    static constexpr int ENUMERATED_ROLLS[2] = {89, 96};

    /**
     * Source of every random decision taken while resolving a turn.
     */
    class ChanceSource {
    public:
        virtual ~ChanceSource() = default;

        // True with the given probability; p >= 1 and p <= 0 never branch
        virtual bool chance(float probability) = 0;

        // Random damage factor in [85, 100]
        virtual int damage_roll() = 0;
    };

    std::vector<CandidateAction> legal_actions(
        const BattleState& state, Side side, int slot) const override;

    StepResult apply(
        const BattleState& state, const TurnActions& actions, uint64_t seed) const override;

    bool enumerate_outcomes(
        const BattleState& state,
        const TurnActions& actions,
        size_t max_branches,
        std::vector<ChanceBranch>& out) const override;

    /**
     * Resolve one turn on a copy of the state.
     *
     * Order: switches (fastest first), Terastallization, then moves by
     * priority and speed (reversed under Trick Room), then end-of-turn
     * residuals and replacement of fainted actives.
     *
     * @throws OracleError on illegal actions
     */
    StepResult resolve(
        const BattleState& state, const TurnActions& actions, ChanceSource& chance) const;

    /**
     * Speed used for turn order: boosts, paralysis, Choice Scarf, Tailwind.
     */
    static int effective_speed(const PokemonState& pokemon, const SideState& side);

    const StandardDamageCalc& damage_calc() const { return calc_; }

private:
    StandardDamageCalc calc_;
};

}  // namespace vgc
