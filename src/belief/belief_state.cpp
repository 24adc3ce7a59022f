#include "vgc/belief/belief_state.hpp"
#include "vgc/core/dex.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace vgc {

namespace {

constexpr float DEGENERATE_TOTAL = 1e-12f;
constexpr float PRIOR_FLOOR = 0.01f;

bool is_choice_item(const std::string& item) {
    return item == "choiceband" || item == "choicespecs" || item == "choicescarf";
}

bool is_special_spread(const std::string& spread) {
    return spread.find('C') != std::string::npos;
}

bool is_physical_spread(const std::string& spread) {
    return spread.find('A') != std::string::npos;
}

// Seen-move hints on the held item
float item_hint(const std::string& move_id, const std::string& item) {
    const MoveData* move = lookup_move(move_id);
    if (move_id == "protect" || move_id == "detect") {
        if (is_choice_item(item)) return 0.1f;
    }
    if (move_id == "trick") {
        if (item == "choicescarf" || item == "choicespecs") return 2.0f;
    }
    if (move_id == "uturn" || move_id == "voltswitch") {
        if (item == "choicescarf") return 1.5f;
        if (item == "choicespecs") return 0.8f;
    }
    if (move != nullptr && (move->tags & TAG_SETUP) != 0) {
        if (is_choice_item(item)) return 0.1f;
    }
    if (move != nullptr && move->category == MoveCategory::Status && item == "assaultvest") {
        return 0.05f;
    }
    return 1.0f;
}

// Seen-move hints on the spread class
float spread_hint(const std::string& move_id, const StatSpread& spread) {
    if (move_id == "trickroom") {
        if (spread.speed_invested()) return 0.5f;
        if (spread.bulk_invested()) return 1.5f;
    }
    if (move_id == "tailwind") {
        if (spread.name == "HS252") return 1.3f;
        if (spread.name == "CS252" || spread.name == "AS252") return 0.8f;
    }
    return 1.0f;
}

}  // namespace

const std::string& observation_species(const Observation& obs) {
    return std::visit([](const auto& o) -> const std::string& { return o.species; }, obs);
}

// =============================================================================
// Usage priors
// =============================================================================

const std::vector<std::pair<std::string, float>>& item_usage_prior() {
    static const std::vector<std::pair<std::string, float>> prior = {
        {"lifeorb", 0.15f}, {"choicespecs", 0.10f}, {"choiceband", 0.08f},
        {"choicescarf", 0.12f}, {"expertbelt", 0.05f}, {"assaultvest", 0.10f},
        {"leftovers", 0.05f}, {"sitrusberry", 0.05f}, {"occaberry", 0.05f},
        {"wacanberry", 0.05f}, {"rindoberry", 0.04f}, {"cobaberry", 0.04f},
        {"focussash", 0.08f}, {"safetygoggles", 0.04f}, {"clearamulet", 0.03f},
    };
    return prior;
}

const std::vector<std::pair<std::string, float>>& spread_usage_prior() {
    static const std::vector<std::pair<std::string, float>> prior = {
        {"CS252", 0.35f}, {"AS252", 0.25f}, {"HS252", 0.20f}, {"HB252", 0.20f},
        {"HD252", 0.05f}, {"HC252", 0.05f}, {"HA252", 0.05f},
        {"CS252_timid", 0.05f}, {"AS252_jolly", 0.05f},
    };
    return prior;
}

const std::vector<std::pair<std::string, float>>& tera_usage_prior() {
    static const std::vector<std::pair<std::string, float>> prior = {
        {"fairy", 0.20f}, {"steel", 0.15f}, {"water", 0.15f}, {"grass", 0.15f},
        {"ground", 0.10f}, {"fire", 0.10f}, {"flying", 0.05f}, {"ghost", 0.05f},
        {"electric", 0.05f},
    };
    return prior;
}

// =============================================================================
// CategoricalBelief Implementation
// =============================================================================

CategoricalBelief::CategoricalBelief(std::vector<std::string> labels, std::vector<float> weights)
    : labels_(std::move(labels)), weights_(std::move(weights))
{
    if (weights_.size() != labels_.size()) {
        throw std::invalid_argument("CategoricalBelief: labels and weights differ in size");
    }
    normalize();
}

void CategoricalBelief::set_uniform() {
    if (labels_.empty()) return;
    weights_.assign(labels_.size(), 1.0f / labels_.size());
}

bool CategoricalBelief::normalize() {
    float sum = total();
    if (!(sum > DEGENERATE_TOTAL) || !std::isfinite(sum)) {
        set_uniform();
        return false;
    }
    for (auto& w : weights_) {
        w /= sum;
    }
    return true;
}

bool CategoricalBelief::update(const std::function<float(const std::string&)>& likelihood) {
    if (confirmed_ || labels_.empty()) return true;
    for (size_t i = 0; i < labels_.size(); ++i) {
        float l = likelihood(labels_[i]);
        if (!(l >= 0.0f) || !std::isfinite(l)) l = 0.0f;
        weights_[i] *= l;
    }
    return normalize();
}

void CategoricalBelief::confirm(const std::string& label) {
    auto it = std::find(labels_.begin(), labels_.end(), label);
    if (it == labels_.end()) {
        labels_.push_back(label);
        weights_.push_back(0.0f);
        it = labels_.end() - 1;
    }
    size_t idx = static_cast<size_t>(it - labels_.begin());
    std::fill(weights_.begin(), weights_.end(), 0.0f);
    weights_[idx] = 1.0f;
    confirmed_ = true;
}

float CategoricalBelief::probability(const std::string& label) const {
    for (size_t i = 0; i < labels_.size(); ++i) {
        if (labels_[i] == label) return weights_[i];
    }
    return 0.0f;
}

const std::string& CategoricalBelief::most_likely() const {
    static const std::string none;
    if (labels_.empty()) return none;
    auto it = std::max_element(weights_.begin(), weights_.end());
    return labels_[static_cast<size_t>(it - weights_.begin())];
}

const std::string& CategoricalBelief::sample(std::mt19937& rng) const {
    static const std::string none;
    if (labels_.empty()) return none;
    std::discrete_distribution<size_t> dist(weights_.begin(), weights_.end());
    return labels_[dist(rng)];
}

float CategoricalBelief::entropy() const {
    float h = 0.0f;
    for (float p : weights_) {
        if (p > 1e-10f) {
            h -= p * std::log2(p);
        }
    }
    return h;
}

int CategoricalBelief::support_size() const {
    int count = 0;
    for (float p : weights_) {
        if (p > 1e-10f) count++;
    }
    return count;
}

float CategoricalBelief::total() const {
    return std::accumulate(weights_.begin(), weights_.end(), 0.0f);
}

// =============================================================================
// BeliefState Implementation
// =============================================================================

BeliefState::BeliefState(
    std::shared_ptr<const DamageOracle> damage,
    const BeliefConfig& config,
    unsigned int seed
) : damage_(std::move(damage)), config_(config), rng_(seed)
{
    if (!damage_) {
        throw std::invalid_argument("BeliefState requires a damage oracle");
    }
}

void BeliefState::register_pokemon(const PokemonState& pokemon) {
    if (knows(pokemon.species)) return;

    Entry e;
    HiddenAttributeBelief& attrs = e.attributes;
    attrs.species = pokemon.species;
    attrs.types = pokemon.types;
    attrs.base_stats = pokemon.base_stats;

    const bool usage = config_.use_usage_priors;
    std::vector<std::string> labels;
    std::vector<float> weights;

    for (const auto& entry : item_usage_prior()) {
        labels.push_back(entry.first);
        weights.push_back(usage ? entry.second : 1.0f);
    }
    attrs.item = CategoricalBelief(labels, weights);

    // Spread prior, shaded by which attacking stat the species favors
    labels.clear();
    weights.clear();
    int atk = pokemon.base_stats[stat_index(Stat::Atk)];
    int spa = pokemon.base_stats[stat_index(Stat::SpA)];
    for (const auto& entry : spread_usage_prior()) {
        float w = usage ? entry.second : 1.0f;
        if (usage && atk > spa + 20 && is_special_spread(entry.first)) w *= 0.3f;
        if (usage && spa > atk + 20 && is_physical_spread(entry.first)) w *= 0.3f;
        labels.push_back(entry.first);
        weights.push_back(w);
    }
    attrs.spread = CategoricalBelief(labels, weights);

    labels.clear();
    weights.clear();
    for (int t = 0; t < NUM_TYPES; ++t) {
        std::string name = type_to_string(static_cast<Type>(t));
        float w = PRIOR_FLOOR;
        for (const auto& entry : tera_usage_prior()) {
            if (entry.first == name) w = entry.second;
        }
        labels.push_back(name);
        weights.push_back(usage ? w : 1.0f);
    }
    attrs.tera = CategoricalBelief(labels, weights);

    if (pokemon.item_revealed) {
        attrs.item.confirm(pokemon.item.empty() ? "none" : pokemon.item);
    }
    if (pokemon.terastallized) {
        attrs.tera.confirm(type_to_string(pokemon.tera_type));
    }

    std::vector<std::pair<std::string, float>> spread_prior;
    for (size_t i = 0; i < attrs.spread.labels().size(); ++i) {
        spread_prior.emplace_back(attrs.spread.labels()[i], attrs.spread.weights()[i]);
    }
    e.particles = StatParticleFilter(pokemon.base_stats, spread_prior, config_.particles, rng_);

    entries_.emplace(pokemon.species, std::move(e));
}

void BeliefState::register_opponents(const BattleState& state, Side opponent) {
    for (const auto& p : state.side(opponent).roster) {
        register_pokemon(p);
    }
}

bool BeliefState::knows(const std::string& species) const {
    return entries_.count(species) > 0;
}

BeliefState::Entry& BeliefState::entry(const std::string& species) {
    auto it = entries_.find(species);
    if (it == entries_.end()) {
        throw std::invalid_argument("No belief registered for " + species);
    }
    return it->second;
}

const BeliefState::Entry& BeliefState::entry(const std::string& species) const {
    auto it = entries_.find(species);
    if (it == entries_.end()) {
        throw std::invalid_argument("No belief registered for " + species);
    }
    return it->second;
}

void BeliefState::update(const Observation& observation) {
    std::visit([this](const auto& obs) { apply(obs); }, observation);
    observations_applied_++;
}

float BeliefState::speed_likelihood(const SpeedOrderObservation& obs, float speed) const {
    float ref = static_cast<float>(obs.reference_speed);
    if (std::fabs(speed - ref) < 0.5f) {
        return config_.tie_likelihood;
    }
    bool faster = speed > ref;
    bool expected_first = obs.trick_room ? !faster : faster;
    return expected_first == obs.went_first
        ? config_.consistent_likelihood
        : config_.inconsistent_likelihood;
}

void BeliefState::apply(const SpeedOrderObservation& obs) {
    Entry& e = entry(obs.species);
    HiddenAttributeBelief& attrs = e.attributes;
    const std::string map_item = attrs.item.most_likely();
    const float item_mult = map_item == "choicescarf" ? 1.5f : 1.0f;

    // Item: marginalize over the spread distribution
    record(attrs.item.update([&](const std::string& item) {
        float mult = item == "choicescarf" ? 1.5f : 1.0f;
        float l = 0.0f;
        for (size_t i = 0; i < attrs.spread.labels().size(); ++i) {
            StatBlock stats = compute_stats(attrs.base_stats, find_spread(attrs.spread.labels()[i]));
            float speed = stats[stat_index(Stat::Spe)] * obs.speed_modifier * mult;
            l += attrs.spread.weights()[i] * speed_likelihood(obs, speed);
        }
        return l;
    }));

    record(attrs.spread.update([&](const std::string& label) {
        StatBlock stats = compute_stats(attrs.base_stats, find_spread(label));
        float speed = stats[stat_index(Stat::Spe)] * obs.speed_modifier * item_mult;
        return speed_likelihood(obs, speed);
    }));

    record(e.particles.update([&](const StatParticle& p) {
        float speed = p.stats[stat_index(Stat::Spe)] * obs.speed_modifier * item_mult;
        return speed_likelihood(obs, speed);
    }, rng_));
}

float BeliefState::damage_likelihood(
    const DamageObservation& obs,
    const HiddenAttributeBelief& attrs,
    const StatBlock& stats,
    const std::string& item
) const {
    const MoveData* move = lookup_move(obs.move_id);
    if (move == nullptr || !move->is_damaging()) {
        return config_.consistent_likelihood;
    }

    PokemonState opponent;
    opponent.species = attrs.species;
    opponent.types = attrs.types;
    opponent.base_stats = attrs.base_stats;
    opponent.stats = stats;
    opponent.item = item;
    if (obs.opponent_tera) {
        opponent.terastallized = true;
        opponent.tera_type = *obs.opponent_tera;
    }

    DamageResult r = obs.opponent_attacking
        ? damage_->damage_distribution(opponent, obs.counterpart, *move, obs.field, obs.mods)
        : damage_->damage_distribution(obs.counterpart, opponent, *move, obs.field, obs.mods);

    float lo = r.min_percent - config_.damage_tolerance;
    float hi = r.max_percent + config_.damage_tolerance;
    float distance = 0.0f;
    if (obs.knocked_out) {
        // Observed percent is only a lower bound on the damage
        if (hi < obs.percent) distance = obs.percent - hi;
    } else if (obs.percent < lo) {
        distance = lo - obs.percent;
    } else if (obs.percent > hi) {
        distance = obs.percent - hi;
    }

    if (distance <= 0.0f) return config_.consistent_likelihood;
    float l = config_.consistent_likelihood * std::exp(-distance / config_.damage_falloff);
    return std::max(config_.min_likelihood, l);
}

StatBlock BeliefState::rounded_mean(const Entry& e) const {
    std::array<float, NUM_STATS> mean = e.particles.mean_estimate();
    StatBlock stats{};
    for (int s = 0; s < NUM_STATS; ++s) {
        stats[s] = static_cast<int>(std::lround(mean[s]));
    }
    return stats;
}

void BeliefState::apply(const DamageObservation& obs) {
    Entry& e = entry(obs.species);
    HiddenAttributeBelief& attrs = e.attributes;
    const std::string map_item = attrs.item.most_likely();
    const StatBlock mean_stats = rounded_mean(e);

    record(attrs.item.update([&](const std::string& item) {
        return damage_likelihood(obs, attrs, mean_stats, item);
    }));

    record(attrs.spread.update([&](const std::string& label) {
        StatBlock stats = compute_stats(attrs.base_stats, find_spread(label));
        return damage_likelihood(obs, attrs, stats, map_item);
    }));

    record(e.particles.update([&](const StatParticle& p) {
        return damage_likelihood(obs, attrs, p.stats, map_item);
    }, rng_));
}

void BeliefState::apply(const HealObservation& obs) {
    Entry& e = entry(obs.species);
    HiddenAttributeBelief& attrs = e.attributes;
    const float tol = config_.heal_tolerance;
    const float consistent = config_.consistent_likelihood;
    const float inconsistent = config_.inconsistent_likelihood;

    bool leftovers_like = std::fabs(obs.percent_healed - 6.25f) <= tol;
    bool sitrus_like = std::fabs(obs.percent_healed - 25.0f) <= tol;

    if (sitrus_like) {
        // Strong evidence only; other heal sources keep a small weight
        record(attrs.item.update([&](const std::string& item) {
            return item == "sitrusberry" ? consistent : std::max(config_.min_likelihood, inconsistent);
        }));
        return;
    }
    if (!leftovers_like) return;

    record(attrs.item.update([&](const std::string& item) {
        // Other heal sources exist (Grassy Terrain), so not near zero
        return item == "leftovers" ? consistent : std::max(inconsistent, 0.3f);
    }));

    // Leftovers restores floor(maxHP / 16) points
    record(e.particles.update([&](const StatParticle& p) {
        int hp = std::max(1, p.stats[stat_index(Stat::HP)]);
        float predicted = 100.0f * (hp / 16) / hp;
        float distance = std::fabs(predicted - obs.percent_healed);
        if (distance <= 0.5f) return consistent;
        return std::max(config_.min_likelihood, consistent * std::exp(-distance));
    }, rng_));
}

void BeliefState::apply(const ItemRevealedObservation& obs) {
    entry(obs.species).attributes.item.confirm(obs.item);
}

void BeliefState::apply(const TeraRevealedObservation& obs) {
    entry(obs.species).attributes.tera.confirm(type_to_string(obs.tera_type));
}

void BeliefState::apply(const MoveRevealedObservation& obs) {
    HiddenAttributeBelief& attrs = entry(obs.species).attributes;
    if (std::find(attrs.seen_moves.begin(), attrs.seen_moves.end(), obs.move_id)
            != attrs.seen_moves.end()) {
        return;
    }
    attrs.seen_moves.push_back(obs.move_id);

    record(attrs.item.update([&](const std::string& item) {
        return item_hint(obs.move_id, item);
    }));
    record(attrs.spread.update([&](const std::string& label) {
        return spread_hint(obs.move_id, find_spread(label));
    }));
}

PokemonHypothesis BeliefState::sample(const std::string& species, std::mt19937& rng) const {
    const Entry& e = entry(species);
    PokemonHypothesis h;
    // Dimensions are sampled independently
    h.item = e.attributes.item.sample(rng);
    h.spread = e.attributes.spread.sample(rng);
    h.tera_type = type_from_string(e.attributes.tera.sample(rng));
    h.stats = e.particles.sample(rng);
    return h;
}

std::vector<PokemonHypothesis> BeliefState::sample(
    const std::string& species, int k, std::mt19937& rng
) const {
    std::vector<PokemonHypothesis> result;
    for (int i = 0; i < k; ++i) {
        result.push_back(sample(species, rng));
    }
    return result;
}

PokemonHypothesis BeliefState::point_estimate(const std::string& species) const {
    const Entry& e = entry(species);
    PokemonHypothesis h;
    h.item = e.attributes.item.most_likely();
    h.spread = e.attributes.spread.most_likely();
    h.tera_type = type_from_string(e.attributes.tera.most_likely());
    h.stats = rounded_mean(e);
    return h;
}

const HiddenAttributeBelief& BeliefState::attributes(const std::string& species) const {
    return entry(species).attributes;
}

const StatParticleFilter& BeliefState::stat_particles(const std::string& species) const {
    return entry(species).particles;
}

std::vector<std::string> BeliefState::species() const {
    std::vector<std::string> names;
    for (const auto& kv : entries_) {
        names.push_back(kv.first);
    }
    return names;
}

}  // namespace vgc
