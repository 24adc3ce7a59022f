#include "vgc/belief/stat_particle_filter.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace vgc {

namespace {

constexpr float DEGENERATE_TOTAL = 1e-12f;

}  // namespace

StatParticleFilter::StatParticleFilter(
    const StatBlock& base_stats,
    const std::vector<std::pair<std::string, float>>& spread_prior,
    const ParticleFilterConfig& config,
    std::mt19937& rng
) : config_(config), base_stats_(base_stats)
{
    std::vector<float> weights;
    for (const auto& entry : spread_prior) {
        weights.push_back(std::max(entry.second, 0.0f));
    }
    if (weights.empty() ||
        std::accumulate(weights.begin(), weights.end(), 0.0f) <= 0.0f) {
        weights.assign(std::max<size_t>(spread_prior.size(), 1), 1.0f);
    }
    std::discrete_distribution<int> pick_spread(weights.begin(), weights.end());
    std::uniform_real_distribution<float> uniform(0.0f, 1.0f);

    int n = std::max(1, config_.num_particles);
    particles_.reserve(n);
    float w = 1.0f / n;

    for (int i = 0; i < n; ++i) {
        const StatSpread& spread = spread_prior.empty()
            ? spread_catalog().front()
            : find_spread(spread_prior[pick_spread(rng)].first);

        std::array<int, NUM_STATS> evs = spread.evs;
        if (uniform(rng) < config_.ev_jitter_probability) {
            evs = jitter_evs(evs, rng);
        }
        NatureMods nature = spread.nature;
        if (uniform(rng) < config_.neutral_nature_probability) {
            nature = neutral_nature();
        }

        StatParticle p;
        p.stats = compute_stats(base_stats_, evs, nature);
        p.weight = w;
        p.spread = spread.name;
        particles_.push_back(std::move(p));
    }
}

std::array<int, NUM_STATS> StatParticleFilter::jitter_evs(
    std::array<int, NUM_STATS> evs, std::mt19937& rng
) const {
    // Move a chunk of EVs from one invested stat to one with room left
    std::uniform_int_distribution<int> pick_stat(0, NUM_STATS - 1);
    int from = pick_stat(rng);
    int to = pick_stat(rng);
    if (from == to || evs[from] == 0 || evs[to] >= MAX_EV_PER_STAT) {
        return evs;
    }
    int room = MAX_EV_PER_STAT - evs[to];
    int max_chunk = std::min(evs[from], room) / 4;
    if (max_chunk <= 0) return evs;

    std::uniform_int_distribution<int> pick_chunk(1, max_chunk);
    int chunk = pick_chunk(rng) * 4;
    evs[from] -= chunk;
    evs[to] += chunk;
    return evs;
}

bool StatParticleFilter::normalize() {
    float total = total_weight();
    if (!(total > DEGENERATE_TOTAL) || !std::isfinite(total)) {
        // Degenerate evidence: fall back to uniform instead of dividing by ~0
        float w = particles_.empty() ? 0.0f : 1.0f / particles_.size();
        for (auto& p : particles_) p.weight = w;
        return false;
    }
    for (auto& p : particles_) {
        p.weight /= total;
    }
    return true;
}

bool StatParticleFilter::update(const Likelihood& likelihood, std::mt19937& rng) {
    if (particles_.empty()) return true;

    for (auto& p : particles_) {
        float l = likelihood(p);
        if (!(l >= 0.0f) || !std::isfinite(l)) l = 0.0f;
        p.weight *= l;
    }
    bool ok = normalize();

    if (effective_sample_size() < config_.resample_threshold * particles_.size()) {
        resample(rng);
    }
    return ok;
}

float StatParticleFilter::total_weight() const {
    float total = 0.0f;
    for (const auto& p : particles_) total += p.weight;
    return total;
}

float StatParticleFilter::effective_sample_size() const {
    float sum_sq = 0.0f;
    for (const auto& p : particles_) sum_sq += p.weight * p.weight;
    return sum_sq > 0.0f ? 1.0f / sum_sq : 0.0f;
}

void StatParticleFilter::resample(std::mt19937& rng) {
    const int n = size();
    if (n == 0) return;

    std::uniform_real_distribution<float> uniform(0.0f, 1.0f / n);
    float u = uniform(rng);
    float cumulative = particles_[0].weight;
    int i = 0;

    std::vector<StatParticle> next;
    next.reserve(n);
    for (int j = 0; j < n; ++j) {
        float target = u + static_cast<float>(j) / n;
        while (target > cumulative && i < n - 1) {
            ++i;
            cumulative += particles_[i].weight;
        }
        StatParticle p = particles_[i];
        p.weight = 1.0f / n;
        next.push_back(std::move(p));
    }
    particles_ = std::move(next);
    resample_count_++;
}

StatBlock StatParticleFilter::sample(std::mt19937& rng) const {
    if (particles_.empty()) return base_stats_;
    std::uniform_real_distribution<float> uniform(0.0f, 1.0f);
    float r = uniform(rng);
    float cumulative = 0.0f;
    for (const auto& p : particles_) {
        cumulative += p.weight;
        if (r <= cumulative) return p.stats;
    }
    return particles_.back().stats;
}

std::vector<StatBlock> StatParticleFilter::sample(int k, std::mt19937& rng) const {
    std::vector<StatBlock> result;
    result.reserve(std::max(k, 0));
    for (int i = 0; i < k; ++i) {
        result.push_back(sample(rng));
    }
    return result;
}

std::array<float, NUM_STATS> StatParticleFilter::mean_estimate() const {
    std::array<float, NUM_STATS> mean{};
    for (const auto& p : particles_) {
        for (int s = 0; s < NUM_STATS; ++s) {
            mean[s] += p.weight * p.stats[s];
        }
    }
    return mean;
}

StatBlock StatParticleFilter::quantile_estimate(float q) const {
    StatBlock result = base_stats_;
    if (particles_.empty()) return result;
    q = std::max(0.0f, std::min(1.0f, q));

    std::vector<std::pair<int, float>> values(particles_.size());
    for (int s = 0; s < NUM_STATS; ++s) {
        for (size_t i = 0; i < particles_.size(); ++i) {
            values[i] = {particles_[i].stats[s], particles_[i].weight};
        }
        std::sort(values.begin(), values.end());

        float cumulative = 0.0f;
        result[s] = values.back().first;
        for (const auto& v : values) {
            cumulative += v.second;
            if (cumulative >= q) {
                result[s] = v.first;
                break;
            }
        }
    }
    return result;
}

StatBlock StatParticleFilter::pessimistic_stats(float q) const {
    StatBlock high = quantile_estimate(q);
    StatBlock low = quantile_estimate(1.0f - q);
    StatBlock result = low;
    result[stat_index(Stat::Atk)] = high[stat_index(Stat::Atk)];
    result[stat_index(Stat::SpA)] = high[stat_index(Stat::SpA)];
    result[stat_index(Stat::Spe)] = high[stat_index(Stat::Spe)];
    return result;
}

}  // namespace vgc
