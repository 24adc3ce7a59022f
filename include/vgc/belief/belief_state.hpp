#pragma once

/**
 * Belief over hidden opponent attributes.
 *
 * One entry per opponent Pokemon, created at first sighting:
 * - three categorical distributions (held item, spread class, Tera type),
 *   each normalized independently
 * - a StatParticleFilter over the actual stats
 *
 * Observations multiply every hypothesis by a likelihood (near 1 when
 * consistent, near 0 but never 0 when contradictory) and renormalize.
 * Collapsed distributions fall back to uniform.
 */

#include "vgc/belief/stat_particle_filter.hpp"
#include "vgc/game/battle_state.hpp"
#include "vgc/game/oracle.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace vgc {

// =============================================================================
// Observations
// =============================================================================

struct SpeedOrderObservation {
    std::string species;
    bool went_first = false;        // Opponent moved before our Pokemon
    int reference_speed = 0;        // Our Pokemon's effective speed
    bool trick_room = false;
    float speed_modifier = 1.0f;    // Known multipliers on the opponent (boosts, Tailwind)
};

/**
 * Damage exchanged between a known Pokemon of ours and the opponent.
 * Percent is relative to the defender's max HP.
 */
struct DamageObservation {
    std::string species;
    std::string move_id;
    float percent = 0.0f;
    bool opponent_attacking = false;   // false: we hit the opponent
    bool knocked_out = false;          // Damage was capped by remaining HP
    PokemonState counterpart;          // Our Pokemon
    FieldState field;
    DamageModifiers mods;
    std::optional<Type> opponent_tera; // Set if the opponent was Terastallized
};

struct HealObservation {
    std::string species;
    float percent_healed = 0.0f;
};

struct ItemRevealedObservation {
    std::string species;
    std::string item;
};

struct TeraRevealedObservation {
    std::string species;
    Type tera_type = Type::None;
};

struct MoveRevealedObservation {
    std::string species;
    std::string move_id;
};

using Observation = std::variant<
    SpeedOrderObservation,
    DamageObservation,
    HealObservation,
    ItemRevealedObservation,
    TeraRevealedObservation,
    MoveRevealedObservation
>;

const std::string& observation_species(const Observation& obs);

// =============================================================================
// Categorical belief
// =============================================================================

/**
 * Normalized distribution over a fixed label set.
 */
class CategoricalBelief {
public:
    CategoricalBelief() = default;
    CategoricalBelief(std::vector<std::string> labels, std::vector<float> weights);

    void set_uniform();

    /**
     * Bayesian update: weight *= likelihood(label), then normalize.
     * Confirmed distributions ignore further evidence.
     *
     * @return false if the update collapsed every weight (uniform fallback applied)
     */
    bool update(const std::function<float(const std::string&)>& likelihood);

    // Collapse to a point mass, adding the label if unknown
    void confirm(const std::string& label);

    float probability(const std::string& label) const;
    const std::string& most_likely() const;
    const std::string& sample(std::mt19937& rng) const;

    float entropy() const;
    int support_size() const;
    float total() const;
    bool confirmed() const { return confirmed_; }
    bool empty() const { return labels_.empty(); }

    const std::vector<std::string>& labels() const { return labels_; }
    const std::vector<float>& weights() const { return weights_; }

private:
    bool normalize();

    std::vector<std::string> labels_;
    std::vector<float> weights_;
    bool confirmed_ = false;
};

// =============================================================================
// Per-Pokemon belief
// =============================================================================

struct HiddenAttributeBelief {
    std::string species;
    std::array<Type, 2> types{{Type::Normal, Type::None}};
    StatBlock base_stats{};
    CategoricalBelief item;
    CategoricalBelief spread;
    CategoricalBelief tera;          // Labels are type names
    std::vector<std::string> seen_moves;
};

// One concrete resolution of the hidden attributes
struct PokemonHypothesis {
    std::string item;
    std::string spread;
    Type tera_type = Type::None;
    StatBlock stats{};
};

struct BeliefConfig {
    bool use_usage_priors = true;        // false: uniform priors
    float consistent_likelihood = 1.0f;
    float inconsistent_likelihood = 0.05f;
    float tie_likelihood = 0.5f;
    float damage_tolerance = 1.0f;       // Percent points around the predicted range
    float damage_falloff = 6.0f;         // Percent scale of the decay outside it
    float min_likelihood = 0.02f;
    float heal_tolerance = 1.5f;
    ParticleFilterConfig particles;
};

// Usage-statistics priors (item, spread class and Tera type tables)
const std::vector<std::pair<std::string, float>>& item_usage_prior();
const std::vector<std::pair<std::string, float>>& spread_usage_prior();
const std::vector<std::pair<std::string, float>>& tera_usage_prior();

class BeliefState {
public:
    explicit BeliefState(
        std::shared_ptr<const DamageOracle> damage,
        const BeliefConfig& config = BeliefConfig{},
        unsigned int seed = 42
    );

    /**
     * Create the entry for an opponent Pokemon if it is new.
     * Already revealed items and Tera types are confirmed immediately.
     */
    void register_pokemon(const PokemonState& pokemon);

    // Register every Pokemon in the side's roster
    void register_opponents(const BattleState& state, Side opponent = Side::Opponent);

    bool knows(const std::string& species) const;

    /**
     * Apply one observation.
     * @throws std::invalid_argument if the species was never registered
     */
    void update(const Observation& observation);

    PokemonHypothesis sample(const std::string& species, std::mt19937& rng) const;
    std::vector<PokemonHypothesis> sample(const std::string& species, int k, std::mt19937& rng) const;

    // Most likely item / spread / Tera with the particle mean stats
    PokemonHypothesis point_estimate(const std::string& species) const;

    const HiddenAttributeBelief& attributes(const std::string& species) const;
    const StatParticleFilter& stat_particles(const std::string& species) const;

    std::vector<std::string> species() const;

    // Number of updates that collapsed and fell back to uniform
    int degenerate_recoveries() const { return degenerate_recoveries_; }
    int observations_applied() const { return observations_applied_; }

    const BeliefConfig& config() const { return config_; }

private:
    struct Entry {
        HiddenAttributeBelief attributes;
        StatParticleFilter particles;
    };

    Entry& entry(const std::string& species);
    const Entry& entry(const std::string& species) const;

    void apply(const SpeedOrderObservation& obs);
    void apply(const DamageObservation& obs);
    void apply(const HealObservation& obs);
    void apply(const ItemRevealedObservation& obs);
    void apply(const TeraRevealedObservation& obs);
    void apply(const MoveRevealedObservation& obs);

    float speed_likelihood(const SpeedOrderObservation& obs, float speed) const;

    float damage_likelihood(
        const DamageObservation& obs,
        const HiddenAttributeBelief& attrs,
        const StatBlock& stats,
        const std::string& item) const;

    StatBlock rounded_mean(const Entry& e) const;

    void record(bool ok) {
        if (!ok) degenerate_recoveries_++;
    }

    std::shared_ptr<const DamageOracle> damage_;
    BeliefConfig config_;
    std::mt19937 rng_;
    std::map<std::string, Entry> entries_;
    int degenerate_recoveries_ = 0;
    int observations_applied_ = 0;
};

}  // namespace vgc
