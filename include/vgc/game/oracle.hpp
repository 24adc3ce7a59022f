#pragma once

/**
 * Collaborator interfaces consumed by the search core.
 *
 * The core never computes game rules or damage itself: it asks a
 * BattleOracle to enumerate and apply actions and a DamageOracle for
 * damage distributions. Failures inside either are raised as OracleError
 * and fail the turn decision.
 */

#include "vgc/game/action.hpp"
#include "vgc/game/battle_state.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vgc {

class OracleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct StepResult {
    BattleState next;
    bool terminal = false;
    std::optional<Side> winner;
};

struct ChanceBranch {
    StepResult result;
    float probability = 0.0f;
};

/**
 * Battle engine: legal actions and turn resolution.
 */
class BattleOracle {
public:
    virtual ~BattleOracle() = default;

    /**
     * Legal atomic actions for one active slot.
     * Empty or fainted slots yield a single pass.
     */
    virtual std::vector<CandidateAction> legal_actions(
        const BattleState& state, Side side, int slot) const = 0;

    /**
     * Resolve one turn. All randomness comes from the seed.
     *
     * @throws OracleError if the actions are illegal for the state
     */
    virtual StepResult apply(
        const BattleState& state, const TurnActions& actions, uint64_t seed) const = 0;

    /**
     * Enumerate every chance branch of one turn with its probability.
     *
     * @param max_branches Stop and return false once more branches exist
     * @return false if the branch count exceeds max_branches
     */
    virtual bool enumerate_outcomes(
        const BattleState& state,
        const TurnActions& actions,
        size_t max_branches,
        std::vector<ChanceBranch>& out) const = 0;
};

struct DamageModifiers {
    bool spread = false;         // Hits more than one target
    bool reflect = false;
    bool light_screen = false;
    bool force_crit = false;     // Observed critical hit
};

struct DamageResult {
    float min_percent = 0.0f;    // Non-crit range, percent of defender max HP
    float max_percent = 0.0f;
    float expected_percent = 0.0f;   // Including crits and misses
    float ko_chance = 0.0f;          // Against current HP
    float crit_chance = 0.0f;
    float accuracy = 1.0f;
    float effectiveness = 1.0f;
    std::vector<std::pair<float, float>> outcomes;   // (percent, probability)

    bool immune() const { return effectiveness == 0.0f; }
};

/**
 * Damage calculation black box.
 */
class DamageOracle {
public:
    virtual ~DamageOracle() = default;

    virtual DamageResult damage_distribution(
        const PokemonState& attacker,
        const PokemonState& defender,
        const MoveData& move,
        const FieldState& field,
        const DamageModifiers& mods) const = 0;
};

struct AdvisorySuggestion {
    int slot = 0;
    std::string move_id;            // Move id, or "switch" for any switch
    float plan_alignment = 1.0f;    // In [0, 1]
};

/**
 * Optional text advisory. Its output only biases candidate ranking.
 */
class Advisor {
public:
    virtual ~Advisor() = default;

    virtual std::vector<AdvisorySuggestion> propose(const BattleState& state, Side side) = 0;
};

}  // namespace vgc
