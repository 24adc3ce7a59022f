#pragma once

/**
 * Particle belief over one opponent Pokemon's six actual stats.
 *
 * Particles start from the spread-class prior with EV and nature jitter
 * and are reweighted by speed-order and damage observations. Weights
 * always sum to 1; a low effective sample size triggers systematic
 * resampling.
 */

#include "vgc/core/stats.hpp"
#include <array>
#include <functional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace vgc {

struct StatParticle {
    StatBlock stats{};
    float weight = 0.0f;
    std::string spread;     // Spread class the particle was drawn from
};

struct ParticleFilterConfig {
    int num_particles = 30;
    float resample_threshold = 0.5f;     // Resample when ESS < threshold * n
    float ev_jitter_probability = 0.6f;
    float neutral_nature_probability = 0.2f;
};

class StatParticleFilter {
public:
    using Likelihood = std::function<float(const StatParticle&)>;

    StatParticleFilter() = default;

    /**
     * Draw the initial particle set.
     *
     * @param base_stats Species base stats
     * @param spread_prior (spread class, weight) pairs; weights need not be normalized
     */
    StatParticleFilter(
        const StatBlock& base_stats,
        const std::vector<std::pair<std::string, float>>& spread_prior,
        const ParticleFilterConfig& config,
        std::mt19937& rng
    );

    /**
     * Multiply every weight by its likelihood, renormalize, and resample
     * if the set has degenerated.
     *
     * @return false if all weights collapsed and the set fell back to uniform
     */
    bool update(const Likelihood& likelihood, std::mt19937& rng);

    // Inverse of the sum of squared normalized weights
    float effective_sample_size() const;

    // Systematic resampling; weights reset to uniform
    void resample(std::mt19937& rng);

    StatBlock sample(std::mt19937& rng) const;
    std::vector<StatBlock> sample(int k, std::mt19937& rng) const;

    // Weighted average per stat
    std::array<float, NUM_STATS> mean_estimate() const;

    // Weighted quantile per stat, q in [0, 1]
    StatBlock quantile_estimate(float q) const;

    /**
     * Conservative point estimate: offensive stats (Atk, SpA, Spe) at the
     * upper quantile q, defensive stats (HP, Def, SpD) at 1 - q.
     */
    StatBlock pessimistic_stats(float q = 0.9f) const;

    const std::vector<StatParticle>& particles() const { return particles_; }
    int size() const { return static_cast<int>(particles_.size()); }
    float total_weight() const;
    int resample_count() const { return resample_count_; }
    bool empty() const { return particles_.empty(); }

private:
    // Returns false if the total weight was degenerate
    bool normalize();

    std::array<int, NUM_STATS> jitter_evs(std::array<int, NUM_STATS> evs, std::mt19937& rng) const;

    ParticleFilterConfig config_;
    StatBlock base_stats_{};
    std::vector<StatParticle> particles_;
    int resample_count_ = 0;
};

}  // namespace vgc
