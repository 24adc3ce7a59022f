#include "vgc/strategy/risk_aware_solver.hpp"
#include <stdexcept>

namespace vgc {

std::string posture_to_string(RiskPosture posture) {
    switch (posture) {
        case RiskPosture::Secure: return "secure";
        case RiskPosture::Neutral: return "neutral";
        case RiskPosture::Gamble: return "gamble";
    }
    return "neutral";
}

RiskAwareSolver::RiskAwareSolver(const RiskConfig& config)
    : config_(config)
{
    if (config_.gamble_threshold > config_.secure_threshold) {
        throw std::invalid_argument("RiskConfig: gamble threshold above secure threshold");
    }
}

RiskPosture RiskAwareSolver::posture(float win_probability) const {
    if (win_probability >= config_.secure_threshold) return RiskPosture::Secure;
    if (win_probability <= config_.gamble_threshold) return RiskPosture::Gamble;
    return RiskPosture::Neutral;
}

float RiskAwareSolver::score(const ActionValueEstimate& e, RiskPosture posture) const {
    switch (posture) {
        case RiskPosture::Secure:
            // Lower-confidence-bound style: variance and downside both cost
            return e.expected
                 - config_.variance_penalty * e.variance
                 - config_.downside_penalty * (e.expected - e.min_value);
        case RiskPosture::Gamble:
            return e.expected + config_.upside_bonus * (e.max_value - e.expected);
        case RiskPosture::Neutral:
            break;
    }
    return e.expected;
}

RiskSelection RiskAwareSolver::select(
    const std::vector<ActionValueEstimate>& estimates,
    float win_probability
) const {
    if (estimates.empty()) {
        throw std::invalid_argument("RiskAwareSolver::select: no action estimates");
    }

    RiskSelection selection;
    selection.posture = posture(win_probability);
    selection.scores.reserve(estimates.size());
    for (const auto& e : estimates) {
        selection.scores.push_back(score(e, selection.posture));
    }

    // Guaranteed wins dominate every posture criterion
    int best_sure = -1;
    for (size_t i = 0; i < estimates.size(); ++i) {
        if (estimates[i].min_value < config_.guaranteed_win) continue;
        if (best_sure < 0 || estimates[i].expected > estimates[best_sure].expected) {
            best_sure = static_cast<int>(i);
        }
    }
    if (best_sure >= 0) {
        selection.index = best_sure;
        selection.terminal_override = true;
        return selection;
    }

    int best = 0;
    for (size_t i = 1; i < selection.scores.size(); ++i) {
        if (selection.scores[i] > selection.scores[best]) {
            best = static_cast<int>(i);
        }
    }
    selection.index = best;
    return selection;
}

}  // namespace vgc
