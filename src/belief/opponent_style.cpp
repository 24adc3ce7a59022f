#include "vgc/belief/opponent_style.hpp"
#include <algorithm>

namespace vgc {

namespace {

bool is_attack(const CandidateAction& a) {
    if (!a.is_move() && !a.is_tera()) return false;
    const MoveData* move = lookup_move(a.move_id());
    return move != nullptr && move->is_damaging();
}

// Both opponent slots attack the same single target
bool focuses_fire(const JointAction& action) {
    if (action.size < 2) return false;
    const CandidateAction& a = action[0];
    const CandidateAction& b = action[1];
    if (!is_attack(a) || !is_attack(b)) return false;
    return is_foe_target(a.target()) && a.target() == b.target();
}

float ratio(const BetaRate& rate) {
    return rate.prior_mean > 0.0f ? rate.mean() / rate.prior_mean : 1.0f;
}

}  // namespace

OpponentStyleModel::OpponentStyleModel(const StyleConfig& config)
    : config_(config)
{
    reset();
}

void OpponentStyleModel::reset() {
    protect_ = config_.protect;
    switching_ = config_.switching;
    aggression_ = config_.aggression;
    focus_fire_ = config_.focus_fire;
    setup_ = config_.setup;
    samples_ = 0;
}

void OpponentStyleModel::observe(const JointAction& action) {
    bool any_attack = false;
    for (int i = 0; i < action.size; ++i) {
        any_attack = any_attack || is_attack(action[i]);
    }

    protect_.observe(action.has_tag(TAG_PROTECT));
    switching_.observe(action.has_tag(TAG_SWITCH));
    aggression_.observe(any_attack);
    focus_fire_.observe(focuses_fire(action));
    setup_.observe(action.has_tag(TAG_SETUP));
    samples_++;
}

OpponentStyleProfile OpponentStyleModel::profile() const {
    OpponentStyleProfile p;
    p.protect_rate = protect_.mean();
    p.switch_rate = switching_.mean();
    p.aggression_rate = aggression_.mean();
    p.focus_fire_rate = focus_fire_.mean();
    p.setup_rate = setup_.mean();
    p.samples = samples_;
    return p;
}

float OpponentStyleModel::action_bias(const JointAction& action) const {
    if (samples_ == 0) return 1.0f;

    float bias = 1.0f;
    if (action.has_tag(TAG_PROTECT)) bias *= ratio(protect_);
    if (action.has_tag(TAG_SWITCH)) bias *= ratio(switching_);
    if (action.has_tag(TAG_SETUP)) bias *= ratio(setup_);

    bool any_attack = false;
    for (int i = 0; i < action.size; ++i) {
        any_attack = any_attack || is_attack(action[i]);
    }
    if (any_attack) bias *= ratio(aggression_);
    if (focuses_fire(action)) bias *= ratio(focus_fire_);

    return std::max(config_.min_bias, std::min(config_.max_bias, bias));
}

}  // namespace vgc
