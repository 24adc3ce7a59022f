#include "vgc/search/turn_orchestrator.hpp"
#include "vgc/strategy/quantal_response.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <thread>

namespace vgc {

namespace {

template <class T>
const T& require(const std::shared_ptr<const T>& ptr, const char* what) {
    if (!ptr) {
        throw std::invalid_argument(std::string("TurnDecisionOrchestrator requires a ") + what);
    }
    return *ptr;
}

std::vector<JointAction> strip_scores(std::vector<ScoredJointAction> scored) {
    std::vector<JointAction> actions;
    actions.reserve(scored.size());
    for (auto& sj : scored) {
        actions.push_back(std::move(sj.action));
    }
    return actions;
}

std::vector<AlternativeAction> rank_alternatives(
    const std::vector<ActionValueEstimate>& stats,
    const RiskSelection& selection,
    const std::vector<float>& policy,
    int limit
) {
    std::vector<size_t> order(stats.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return selection.scores[a] > selection.scores[b];
    });
    // Selected action always first
    auto chosen = std::find(order.begin(), order.end(), static_cast<size_t>(selection.index));
    std::rotate(order.begin(), chosen, chosen + 1);

    std::vector<AlternativeAction> alternatives;
    for (size_t n = 0; n < order.size() && static_cast<int>(n) < limit; ++n) {
        size_t i = order[n];
        AlternativeAction alt;
        alt.action = stats[i].action;
        alt.score = selection.scores[i];
        alt.expected = stats[i].expected;
        alt.probability = i < policy.size() ? policy[i] : 0.0f;
        alternatives.push_back(std::move(alt));
    }
    return alternatives;
}

}  // namespace

std::string phase_to_string(DecisionPhase phase) {
    switch (phase) {
        case DecisionPhase::AwaitingTurn: return "awaiting_turn";
        case DecisionPhase::BeliefUpdate: return "belief_update";
        case DecisionPhase::PostureDecision: return "posture_decision";
        case DecisionPhase::Search: return "search";
        case DecisionPhase::Aggregate: return "aggregate";
        case DecisionPhase::Selected: return "selected";
    }
    return "unknown";
}

// =============================================================================
// TurnDecisionOrchestrator Implementation
// =============================================================================

TurnDecisionOrchestrator::TurnDecisionOrchestrator(
    const OrchestratorConfig& config,
    std::shared_ptr<const BattleOracle> oracle,
    std::shared_ptr<const DamageOracle> damage,
    std::shared_ptr<Advisor> advisor
) : config_(config),
    oracle_(std::move(oracle)),
    damage_(std::move(damage)),
    advisor_(std::move(advisor)),
    rules_(ScoringRules::standard()),
    evaluator_(config.evaluator, rules_),
    generator_(config.candidates, require(oracle_, "battle oracle"),
               require(damage_, "damage oracle"), rules_),
    table_(),
    style_(config.style),
    belief_(damage_, config.belief, config.seed),
    determinizer_(config.seed + 1),
    risk_(config.risk),
    refiner_(config.fictitious_play)
{
    if (config_.determinizations < 1) {
        throw std::invalid_argument("determinizations must be at least 1");
    }
    config_.num_threads = std::max(1, config_.num_threads);
}

void TurnDecisionOrchestrator::enter(DecisionPhase phase, DecisionTrace& trace) {
    phase_ = phase;
    trace.phases.push_back(phase);
}

void TurnDecisionOrchestrator::observe(const TurnObservations& observations) {
    if (observations.turn < last_observed_turn_) {
        throw std::logic_error(
            "Observations for turn " + std::to_string(observations.turn) +
            " arrived after turn " + std::to_string(last_observed_turn_));
    }
    phase_ = DecisionPhase::BeliefUpdate;

    try {
        for (const auto& event : observations.events) {
            belief_.update(event);
        }
    } catch (...) {
        phase_ = DecisionPhase::AwaitingTurn;
        throw;
    }
    if (observations.opponent_action) {
        style_.observe(*observations.opponent_action);
    }
    last_observed_turn_ = observations.turn;
    phase_ = DecisionPhase::AwaitingTurn;

    if (config_.verbose) {
        std::cout << "Turn " << observations.turn << ": applied "
                  << observations.events.size() << " observations, "
                  << belief_.degenerate_recoveries() << " degenerate recoveries so far" << std::endl;
    }
}

TurnDecision TurnDecisionOrchestrator::decide_turn(
    const BattleState& state, Side side, const TurnObservations& observations
) {
    belief_.register_opponents(state, opposite(side));
    observe(observations);
    return decide(state, side, belief_);
}

std::vector<AdvisorySuggestion> TurnDecisionOrchestrator::query_advisor(
    const BattleState& state, Side side, bool& available
) {
    available = false;
    if (!advisor_) return {};

    // The worker owns copies of everything it touches; a late answer is dropped
    auto promise = std::make_shared<std::promise<std::vector<AdvisorySuggestion>>>();
    std::future<std::vector<AdvisorySuggestion>> future = promise->get_future();
    std::shared_ptr<Advisor> advisor = advisor_;
    std::thread([promise, advisor, state, side]() {
        try {
            promise->set_value(advisor->propose(state, side));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    auto timeout = std::chrono::duration<float>(std::max(0.0f, config_.advisory_timeout));
    if (future.wait_for(timeout) != std::future_status::ready) {
        if (config_.verbose) {
            std::cerr << "Advisory timed out, ranking without it" << std::endl;
        }
        return {};
    }

    try {
        std::vector<AdvisorySuggestion> suggestions = future.get();
        available = !suggestions.empty();
        return suggestions;
    } catch (const std::exception& e) {
        if (config_.verbose) {
            std::cerr << "Advisory failed: " << e.what() << std::endl;
        }
        return {};
    }
}

float TurnDecisionOrchestrator::posture_probability(const BattleState& state, Side side) const {
    if (win_probability_hint_) return *win_probability_hint_;
    if (last_win_probability_) return *last_win_probability_;
    return StaticEvaluator::to_win_probability(evaluator_.evaluate(state, side, 0));
}

std::vector<TurnDecisionOrchestrator::WorkerResult> TurnDecisionOrchestrator::run_determinizations(
    const std::vector<Determinization>& worlds,
    Side side,
    const std::vector<JointAction>& self_candidates,
    const std::vector<JointAction>& opp_candidates,
    const Deadline& deadline
) {
    std::vector<WorkerResult> results(worlds.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};

    const int num_workers = std::max(1, std::min(config_.num_threads, static_cast<int>(worlds.size())));
    std::vector<std::exception_ptr> errors(num_workers);

    auto worker = [&](int w) {
        try {
            GameSolver solver(config_.solver, *oracle_, generator_, evaluator_, table_, &style_);
            while (!failed.load()) {
                size_t i = next.fetch_add(1);
                if (i >= worlds.size()) break;
                // The first determinization always runs so a decision exists
                if (i > 0 && deadline.expired()) break;

                results[i].result = solver.solve(worlds[i].state, side, worlds[i].signature,
                                                 self_candidates, opp_candidates, deadline);
                results[i].done = true;
            }
        } catch (...) {
            errors[w] = std::current_exception();
            failed = true;
        }
    };

    if (num_workers == 1) {
        worker(0);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(num_workers);
        for (int w = 0; w < num_workers; ++w) {
            threads.emplace_back(worker, w);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    for (const auto& error : errors) {
        if (error) std::rethrow_exception(error);
    }
    return results;
}

TurnDecision TurnDecisionOrchestrator::select_from_endgame(
    const EndgameResult& endgame, DecisionTrace trace, float posture_p
) {
    enter(DecisionPhase::Aggregate, trace);
    std::vector<ActionValueEstimate> stats = endgame.action_stats();
    RiskSelection selection = risk_.select(stats, posture_p);

    TurnDecision decision;
    decision.action = stats[selection.index].action;
    decision.win_probability = StaticEvaluator::to_win_probability(endgame.self_values[selection.index]);
    trace.terminal_override = selection.terminal_override;
    trace.alternatives = rank_alternatives(
        stats, selection, quantal_response(endgame.self_values, config_.solver.tau_self),
        config_.trace_alternatives);
    decision.trace = std::move(trace);
    return decision;
}

TurnDecision TurnDecisionOrchestrator::search_turn(
    const BattleState& state, Side side, BeliefState& belief,
    const Deadline& deadline, DecisionTrace trace
) {
    const Side opp = opposite(side);
    TurnDecision decision;

    enter(DecisionPhase::BeliefUpdate, trace);
    belief.register_opponents(state, opp);

    enter(DecisionPhase::PostureDecision, trace);
    const float posture_p = posture_probability(state, side);
    trace.posture_win_probability = posture_p;
    trace.posture = risk_.posture(posture_p);

    enter(DecisionPhase::Search, trace);
    table_.clear();

    bool decided = false;
    if (config_.use_endgame) {
        EndgameSolver endgame(config_.endgame, *oracle_, generator_, evaluator_);
        if (endgame.should_trigger(state)) {
            Determinization world = determinizer_.point_estimate(belief, state, opp);
            EndgameResult result = endgame.solve(world.state, side, deadline);
            trace.nodes += result.nodes;
            trace.endgame_remaining_score = result.remaining_score;
            trace.endgame_hp_score = result.hp_score;
            if (result.solved) {
                trace.used_endgame = true;
                trace.determinizations_completed = 1;
                decision = select_from_endgame(result, std::move(trace), posture_p);
                decided = true;
            } else {
                trace.endgame_fallback = true;
            }
        }
    }

    if (!decided) {
        bool advisory = false;
        std::vector<AdvisorySuggestion> suggestions = query_advisor(state, side, advisory);
        trace.advisory_used = advisory;

        // Root candidates come from the most likely world and are shared by every determinization
        Determinization root = determinizer_.point_estimate(belief, state, opp);
        std::vector<JointAction> self_candidates =
            generator_.generate(side, root.state, advisory ? &suggestions : nullptr);
        std::vector<JointAction> opp_candidates = strip_scores(
            generator_.generate_scored(opp, root.state, config_.solver.top_k_opp));

        std::vector<Determinization> worlds =
            determinizer_.sample(belief, state, config_.determinizations, opp);
        std::vector<WorkerResult> results =
            run_determinizations(worlds, side, self_candidates, opp_candidates, deadline);

        enter(DecisionPhase::Aggregate, trace);
        const size_t rows = self_candidates.size();
        const size_t cols = opp_candidates.size();

        SolveResult agg;
        agg.self_actions = self_candidates;
        agg.opp_actions = opp_candidates;
        agg.utility.assign(rows, std::vector<float>(cols, 0.0f));
        agg.pair_variance.assign(rows, std::vector<float>(cols, 0.0f));
        agg.pair_min.assign(rows, std::vector<float>(cols, 0.0f));
        agg.pair_max.assign(rows, std::vector<float>(cols, 0.0f));

        int completed = 0;
        bool complete = true;
        for (const auto& r : results) {
            if (!r.done) continue;
            const SolveResult& s = r.result;
            // A world that ended at the root has no matrix to contribute
            if (s.utility.size() != rows || (rows > 0 && s.utility[0].size() != cols)) continue;
            for (size_t i = 0; i < rows; ++i) {
                for (size_t j = 0; j < cols; ++j) {
                    agg.utility[i][j] += s.utility[i][j];
                    agg.pair_variance[i][j] += s.pair_variance[i][j];
                    agg.pair_min[i][j] = completed == 0 ? s.pair_min[i][j]
                                                        : std::min(agg.pair_min[i][j], s.pair_min[i][j]);
                    agg.pair_max[i][j] = completed == 0 ? s.pair_max[i][j]
                                                        : std::max(agg.pair_max[i][j], s.pair_max[i][j]);
                }
            }
            complete = complete && s.complete;
            trace.nodes += s.nodes;
            completed++;
        }
        const float divisor = static_cast<float>(std::max(1, completed));
        for (size_t i = 0; i < rows; ++i) {
            for (size_t j = 0; j < cols; ++j) {
                agg.utility[i][j] /= divisor;
                agg.pair_variance[i][j] /= divisor;
            }
        }
        trace.determinizations_completed = completed;
        trace.timed_out = !complete || completed < config_.determinizations;

        GameSolver policy_model(config_.solver, *oracle_, generator_, evaluator_, table_, &style_);
        agg.opp_policy = policy_model.opponent_policy(agg.utility, opp_candidates, opp);
        agg.self_values = std::vector<float>(rows, 0.0f);
        for (size_t i = 0; i < rows; ++i) {
            for (size_t j = 0; j < cols; ++j) agg.self_values[i] += agg.opp_policy[j] * agg.utility[i][j];
        }
        agg.self_policy = quantal_response(agg.self_values, config_.solver.tau_self);

        if (config_.use_fictitious_play && rows > 1 && cols > 1) {
            FictitiousPlayResult fp = refiner_.refine(agg.utility, &agg.opp_policy);
            const float w = config_.fictitious_play.blend_weight;
            agg.opp_policy = FictitiousPlayRefiner::blend_with_quantal(fp.opp_policy, agg.opp_policy, w);
            for (size_t i = 0; i < rows; ++i) {
                agg.self_values[i] = 0.0f;
                for (size_t j = 0; j < cols; ++j) agg.self_values[i] += agg.opp_policy[j] * agg.utility[i][j];
            }
            agg.self_policy = FictitiousPlayRefiner::blend_with_quantal(
                fp.self_policy, quantal_response(agg.self_values, config_.solver.tau_self), w);
            trace.fictitious_play_policy = agg.self_policy;
            trace.nash_gap = fp.nash_gap;
        }

        std::vector<ActionValueEstimate> stats = agg.action_stats();
        RiskSelection selection = risk_.select(stats, posture_p);

        decision.action = stats[selection.index].action;
        decision.win_probability = StaticEvaluator::to_win_probability(agg.self_values[selection.index]);
        trace.terminal_override = selection.terminal_override;
        trace.alternatives = rank_alternatives(stats, selection, agg.self_policy,
                                               config_.trace_alternatives);
        decision.trace = std::move(trace);
    }
    return decision;
}

TurnDecision TurnDecisionOrchestrator::decide(const BattleState& state, Side side, BeliefState& belief) {
    auto start = std::chrono::high_resolution_clock::now();
    const Deadline deadline = Deadline::after(config_.time_budget);

    DecisionTrace trace;
    trace.determinizations_requested = config_.determinizations;
    TurnDecision decision;

    try {
        enter(DecisionPhase::AwaitingTurn, trace);

        if (state.is_terminal()) {
            // Game over: both slots pass
            decision.action = JointAction(CandidateAction::pass(), CandidateAction::pass());
            decision.win_probability = StaticEvaluator::to_win_probability(evaluator_.evaluate(state, side, 0));
            decision.trace = std::move(trace);
        } else {
            decision = search_turn(state, side, belief, deadline, std::move(trace));
        }
    } catch (...) {
        phase_ = DecisionPhase::AwaitingTurn;
        win_probability_hint_.reset();
        throw;
    }

    DecisionTrace& out = decision.trace;
    enter(DecisionPhase::Selected, out);
    out.tt_hits = table_.hits();
    out.tt_misses = table_.misses();
    out.elapsed_seconds = std::chrono::duration<float>(
        std::chrono::high_resolution_clock::now() - start).count();

    last_win_probability_ = decision.win_probability;
    win_probability_hint_.reset();

    if (config_.verbose) {
        std::cout << "Turn " << state.turn << " [" << posture_to_string(out.posture) << " @ "
                  << out.posture_win_probability << "] "
                  << decision.action.to_string()
                  << " win=" << decision.win_probability
                  << " worlds=" << out.determinizations_completed << "/" << out.determinizations_requested
                  << " tt=" << out.tt_hits << "/" << (out.tt_hits + out.tt_misses)
                  << (out.used_endgame ? " endgame" : "")
                  << (out.endgame_fallback ? " endgame-fallback" : "")
                  << (out.timed_out ? " timed-out" : "")
                  << " " << out.elapsed_seconds << "s" << std::endl;
    }

    phase_ = DecisionPhase::AwaitingTurn;
    return decision;
}

}  // namespace vgc
