/**
 * VGC Orchestrator Evaluator
 *
 * Self-play of the turn orchestrator against baseline opponents on the
 * reference battle engine.
 *
 * Usage:
 *   ./vgc_eval --matches 20 --opponent greedy --determinizations 10 --time-limit 2
 */

#include "vgc/game/battle_engine.hpp"
#include "vgc/search/turn_orchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>

using namespace vgc;

// Opponent types
enum class OpponentType {
    Random,      // Uniform over legal joint actions
    Greedy       // Best joint action by the heuristic rule table
};

namespace {

const std::vector<std::string> SELF_TEAM = {"incineroar", "rillaboom", "fluttermane", "urshifu"};
const std::vector<std::string> OPPONENT_TEAM = {"amoonguss", "chienpao", "tornadus", "landorus"};

SideState make_side(const std::vector<std::string>& team) {
    SideState side;
    for (const auto& species : team) {
        side.roster.push_back(create_pokemon(species));
    }
    side.active = {{0, 1}};
    return side;
}

BattleState initial_state() {
    BattleState state;
    state.side(Side::Self) = make_side(SELF_TEAM);
    state.side(Side::Opponent) = make_side(OPPONENT_TEAM);
    return state;
}

// Item and Tera reveals visible in the transition
std::vector<Observation> reveals(const BattleState& before, const BattleState& after) {
    std::vector<Observation> events;
    const auto& old_roster = before.side(Side::Opponent).roster;
    const auto& new_roster = after.side(Side::Opponent).roster;
    for (size_t i = 0; i < new_roster.size() && i < old_roster.size(); ++i) {
        const PokemonState& p = new_roster[i];
        if (p.item_revealed && !old_roster[i].item_revealed) {
            events.push_back(ItemRevealedObservation{p.species, p.item.empty() ? "none" : p.item});
        }
        if (p.terastallized && !old_roster[i].terastallized) {
            events.push_back(TeraRevealedObservation{p.species, p.tera_type});
        }
    }
    return events;
}

}  // namespace

class MatchEvaluator {
public:
    MatchEvaluator(const OrchestratorConfig& config, unsigned int seed)
        : config_(config),
          engine_(std::make_shared<ReferenceBattleEngine>()),
          damage_(engine_, &engine_->damage_calc()),
          rules_(ScoringRules::standard()),
          baseline_(CandidateConfig{}, *engine_, *damage_, rules_),
          rng_(seed) {}

    struct EvalResults {
        int matches_played = 0;
        int agent_wins = 0;
        int opponent_wins = 0;
        int draws = 0;
        int decisions = 0;
        int endgame_decisions = 0;
        int timeouts = 0;
        uint64_t tt_hits = 0;
        uint64_t tt_misses = 0;
        double decision_seconds = 0.0;
        double elapsed_seconds = 0.0;
    };

    EvalResults evaluate(OpponentType opponent_type, int num_matches) {
        EvalResults results;
        auto start = std::chrono::high_resolution_clock::now();

        for (int match = 0; match < num_matches; ++match) {
            std::optional<Side> winner = play_match(opponent_type, match, results);
            if (!winner) results.draws++;
            else if (*winner == Side::Self) results.agent_wins++;
            else results.opponent_wins++;
            results.matches_played++;

            std::cout << "  Match " << (match + 1) << "/" << num_matches << ": "
                      << (!winner ? "draw" : (*winner == Side::Self ? "win" : "loss")) << "\n";
        }

        auto elapsed = std::chrono::high_resolution_clock::now() - start;
        results.elapsed_seconds = std::chrono::duration<double>(elapsed).count();
        return results;
    }

private:
    static constexpr int MAX_TURNS = 60;

    std::optional<Side> play_match(OpponentType opponent_type, int match, EvalResults& results) {
        OrchestratorConfig cfg = config_;
        cfg.seed = config_.seed + static_cast<unsigned int>(match);
        TurnDecisionOrchestrator agent(cfg, engine_, damage_);

        BattleState state = initial_state();
        TurnObservations last;
        last.turn = 0;

        while (!state.is_terminal() && state.turn <= MAX_TURNS) {
            TurnDecision decision = agent.decide_turn(state, Side::Self, last);
            results.decisions++;
            results.decision_seconds += decision.trace.elapsed_seconds;
            results.tt_hits += decision.trace.tt_hits;
            results.tt_misses += decision.trace.tt_misses;
            if (decision.trace.used_endgame) results.endgame_decisions++;
            if (decision.trace.timed_out) results.timeouts++;

            TurnActions actions;
            actions[side_index(Side::Self)] = decision.action;
            actions[side_index(Side::Opponent)] = choose_opponent_action(state, opponent_type);

            StepResult step = engine_->apply(state, actions, rng_());

            last = TurnObservations{};
            last.turn = state.turn;
            last.events = reveals(state, step.next);
            last.opponent_action = actions[side_index(Side::Opponent)];
            state = std::move(step.next);
        }
        return state.winner();
    }

    JointAction choose_opponent_action(const BattleState& state, OpponentType type) {
        if (type == OpponentType::Greedy) {
            return baseline_.generate_scored(Side::Opponent, state, 1).front().action;
        }
        std::vector<JointAction> actions = baseline_.enumerate(Side::Opponent, state);
        std::uniform_int_distribution<size_t> dist(0, actions.size() - 1);
        return actions[dist(rng_)];
    }

    OrchestratorConfig config_;
    std::shared_ptr<ReferenceBattleEngine> engine_;
    std::shared_ptr<const DamageOracle> damage_;
    ScoringRules rules_;
    CandidateActionGenerator baseline_;
    std::mt19937 rng_;
};

void print_usage(const char* program) {
    std::cout << "VGC Orchestrator Evaluator\n\n"
              << "Usage: " << program << " [options]\n\n"
              << "Options:\n"
              << "  --matches N            Number of matches to play (default: 10)\n"
              << "  --opponent TYPE        Opponent type: random, greedy (default: greedy)\n"
              << "  --determinizations K   Hypotheses per decision (default: 10)\n"
              << "  --depth D              Search depth in turns (default: 2)\n"
              << "  --time-limit S         Seconds per decision (default: 3)\n"
              << "  --threads T            Worker threads (default: 4)\n"
              << "  --seed N               Random seed (default: 42)\n"
              << "  --verbose              Per-turn decision log\n"
              << "  --help                 Show this help\n";
}

int main(int argc, char* argv[]) {
    // Default configuration
    OrchestratorConfig config;
    OpponentType opponent_type = OpponentType::Greedy;
    int num_matches = 10;
    unsigned int seed = 42;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--matches" && i + 1 < argc) {
            num_matches = std::atoi(argv[++i]);
        } else if (arg == "--opponent" && i + 1 < argc) {
            std::string opp = argv[++i];
            if (opp == "random") opponent_type = OpponentType::Random;
            else if (opp == "greedy") opponent_type = OpponentType::Greedy;
            else {
                std::cerr << "Unknown opponent type: " << opp << "\n";
                return 1;
            }
        } else if (arg == "--determinizations" && i + 1 < argc) {
            config.determinizations = std::atoi(argv[++i]);
        } else if (arg == "--depth" && i + 1 < argc) {
            config.solver.depth = std::atoi(argv[++i]);
        } else if (arg == "--time-limit" && i + 1 < argc) {
            config.time_budget = static_cast<float>(std::atof(argv[++i]));
        } else if (arg == "--threads" && i + 1 < argc) {
            config.num_threads = std::atoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::atoi(argv[++i]));
        } else if (arg == "--verbose") {
            config.verbose = true;
            config.endgame.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    config.seed = seed;
    config.solver.seed = seed;

    std::cout << "Configuration:\n"
              << "  Opponent:         " << (opponent_type == OpponentType::Random ? "Random" : "Greedy") << "\n"
              << "  Matches:          " << num_matches << "\n"
              << "  Determinizations: " << config.determinizations << "\n"
              << "  Depth:            " << config.solver.depth << "\n"
              << "  Time limit:       " << config.time_budget << "s\n"
              << "  Threads:          " << config.num_threads << "\n"
              << "  Seed:             " << seed << "\n\n";

    try {
        MatchEvaluator eval(config, seed);

        std::cout << "Starting evaluation...\n\n";
        auto results = eval.evaluate(opponent_type, num_matches);

        const double played = std::max(1, results.matches_played);
        const double decisions = std::max(1, results.decisions);
        const uint64_t lookups = results.tt_hits + results.tt_misses;

        std::cout << std::fixed << std::setprecision(2);
        std::cout << "\nResults:\n"
                  << "  Matches played:  " << results.matches_played << "\n"
                  << "  Agent wins:      " << results.agent_wins << " (" << (100.0 * results.agent_wins / played) << "%)\n"
                  << "  Opponent wins:   " << results.opponent_wins << " (" << (100.0 * results.opponent_wins / played) << "%)\n"
                  << "  Draws:           " << results.draws << "\n\n"
                  << "Search:\n"
                  << "  Decisions:       " << results.decisions << "\n"
                  << "  Avg decision:    " << (results.decision_seconds / decisions) << "s\n"
                  << "  Endgame solves:  " << results.endgame_decisions << "\n"
                  << "  Timed out:       " << results.timeouts << "\n"
                  << "  TT hit rate:     " << (lookups > 0 ? 100.0 * results.tt_hits / lookups : 0.0) << "% of "
                  << lookups << " lookups\n"
                  << "  Total time:      " << results.elapsed_seconds << "s\n\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
