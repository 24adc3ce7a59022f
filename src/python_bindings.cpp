/**
 * Python bindings for the VGC search-and-belief engine
 *
 * Uses pybind11 to expose battle-state construction, the reference
 * engine, observations and the turn orchestrator. The orchestrator
 * (beliefs, style model, transposition table) lives entirely in C++;
 * Python only feeds states and observations and reads decisions.
 *
 * Build:
 *   cmake -S . -B build -DVGC_BUILD_PYTHON=ON && cmake --build build --target vgc_solver
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "vgc/game/battle_engine.hpp"
#include "vgc/search/turn_orchestrator.hpp"

#ifdef VGC_USE_LIBTORCH
#include "vgc/neural/neural_evaluator.hpp"
#endif

#include <memory>
#include <optional>

namespace py = pybind11;
using namespace vgc;

/**
 * Wrapper class for Python - one orchestrator per match.
 */
class PyOrchestrator {
public:
    PyOrchestrator(
        int determinizations,
        float time_budget,
        int threads,
        int depth,
        int samples,
        float tau_opp,
        float tau_self,
        bool fictitious_play,
        bool verbose,
        unsigned int seed
    ) : engine_(std::make_shared<ReferenceBattleEngine>()) {
        config_.determinizations = determinizations;
        config_.time_budget = time_budget;
        config_.num_threads = threads;
        config_.solver.depth = depth;
        config_.solver.n_samples = samples;
        config_.solver.tau_opp = tau_opp;
        config_.solver.tau_self = tau_self;
        config_.use_fictitious_play = fictitious_play;
        config_.verbose = verbose;
        config_.seed = seed;
        config_.solver.seed = seed;
        rebuild();
    }

#ifdef VGC_USE_LIBTORCH
    /**
     * Load a TorchScript value network for leaf evaluation.
     * Resets the match state, so call it before the first turn.
     */
    void load_neural_model(const std::string& model_path, float weight) {
        auto net = std::make_shared<NeuralEvaluator>(model_path);
        config_.evaluator.leaf_value = NeuralEvaluator::callback(net);
        config_.evaluator.neural_weight = weight;
        rebuild();
    }
#endif

    void register_opponents(const BattleState& state, Side side) {
        orchestrator_->belief().register_opponents(state, opposite(side));
    }

    void observe(int turn, const std::vector<Observation>& events,
                 const std::optional<JointAction>& opponent_action) {
        TurnObservations obs;
        obs.turn = turn;
        obs.events = events;
        obs.opponent_action = opponent_action;
        orchestrator_->observe(obs);
    }

    /**
     * Decide one turn.
     *
     * Returns:
     *     dict with action, win_probability, posture and alternatives
     */
    py::dict decide(const BattleState& state, Side side, std::optional<float> win_probability_hint) {
        if (win_probability_hint) {
            orchestrator_->set_win_probability_hint(*win_probability_hint);
        }

        TurnDecision d;
        {
            py::gil_scoped_release release;
            d = orchestrator_->decide(state, side, orchestrator_->belief());
        }

        py::list alternatives;
        for (const auto& alt : d.trace.alternatives) {
            py::dict a;
            a["action"] = alt.action.to_string();
            a["score"] = alt.score;
            a["expected"] = alt.expected;
            a["probability"] = alt.probability;
            alternatives.append(a);
        }

        py::dict result;
        result["action"] = d.action.to_string();
        result["joint_action"] = d.action;
        result["win_probability"] = d.win_probability;
        result["posture"] = posture_to_string(d.trace.posture);
        result["alternatives"] = alternatives;
        result["determinizations"] = d.trace.determinizations_completed;
        result["used_endgame"] = d.trace.used_endgame;
        result["timed_out"] = d.trace.timed_out;
        result["tt_hits"] = d.trace.tt_hits;
        result["tt_misses"] = d.trace.tt_misses;
        result["nodes"] = d.trace.nodes;
        result["elapsed"] = d.trace.elapsed_seconds;
        return result;
    }

    py::dict style_profile() const {
        OpponentStyleProfile p = orchestrator_->style().profile();
        py::dict result;
        result["protect_rate"] = p.protect_rate;
        result["switch_rate"] = p.switch_rate;
        result["aggression_rate"] = p.aggression_rate;
        result["focus_fire_rate"] = p.focus_fire_rate;
        result["setup_rate"] = p.setup_rate;
        result["samples"] = p.samples;
        return result;
    }

    py::dict belief(const std::string& species) const {
        PokemonHypothesis h = orchestrator_->belief().point_estimate(species);
        py::dict result;
        result["item"] = h.item;
        result["spread"] = h.spread;
        result["tera_type"] = type_to_string(h.tera_type);
        result["stats"] = h.stats;
        return result;
    }

    std::vector<JointAction> candidates(const BattleState& state, Side side, int top_k) const {
        std::vector<JointAction> actions;
        for (auto& sj : orchestrator_->generator().generate_scored(side, state, top_k)) {
            actions.push_back(std::move(sj.action));
        }
        return actions;
    }

    py::tuple step(const BattleState& state, const JointAction& self_action,
                   const JointAction& opp_action, uint64_t seed) const {
        TurnActions actions;
        actions[side_index(Side::Self)] = self_action;
        actions[side_index(Side::Opponent)] = opp_action;
        StepResult r = engine_->apply(state, actions, seed);
        return py::make_tuple(r.next, r.terminal, r.winner);
    }

private:
    void rebuild() {
        auto damage = std::shared_ptr<const DamageOracle>(engine_, &engine_->damage_calc());
        orchestrator_ = std::make_unique<TurnDecisionOrchestrator>(config_, engine_, damage);
    }

    OrchestratorConfig config_;
    std::shared_ptr<ReferenceBattleEngine> engine_;
    std::unique_ptr<TurnDecisionOrchestrator> orchestrator_;
};


PYBIND11_MODULE(vgc_solver, m) {
    m.doc() = "VGC doubles search-and-belief engine";

    py::register_exception<OracleError>(m, "OracleError", PyExc_RuntimeError);

    py::enum_<Side>(m, "Side")
        .value("Self", Side::Self)
        .value("Opponent", Side::Opponent);

    py::enum_<Weather>(m, "Weather")
        .value("None_", Weather::None)
        .value("Sun", Weather::Sun)
        .value("Rain", Weather::Rain)
        .value("Sand", Weather::Sand)
        .value("Snow", Weather::Snow);

    py::enum_<Terrain>(m, "Terrain")
        .value("None_", Terrain::None)
        .value("Electric", Terrain::Electric)
        .value("Grassy", Terrain::Grassy)
        .value("Psychic", Terrain::Psychic)
        .value("Misty", Terrain::Misty);


    py::class_<PokemonState>(m, "Pokemon")
        .def_readwrite("species", &PokemonState::species)
        .def_readwrite("hp_fraction", &PokemonState::hp_fraction)
        .def_readwrite("item", &PokemonState::item)
        .def_readwrite("item_revealed", &PokemonState::item_revealed)
        .def_readwrite("terastallized", &PokemonState::terastallized)
        .def_readwrite("turns_active", &PokemonState::turns_active)
        .def_readwrite("stats", &PokemonState::stats)
        .def_property("tera_type",
            [](const PokemonState& p) { return type_to_string(p.tera_type); },
            [](PokemonState& p, const std::string& t) { p.tera_type = type_from_string(t); })
        .def_property_readonly("moves", [](const PokemonState& p) {
            std::vector<std::string> ids;
            for (const auto& slot : p.moves) ids.push_back(slot.id);
            return ids;
        })
        .def("fainted", &PokemonState::fainted);

    m.def("create_pokemon", &create_pokemon,
          py::arg("species"),
          py::arg("spread") = "",
          py::arg("moves") = std::vector<std::string>{},
          py::arg("item") = "",
          "Build a level 50 Pokemon from the dex");

    py::class_<SideState>(m, "SideState")
        .def(py::init<>())
        .def("add_pokemon", [](SideState& s, const PokemonState& p) {
            s.roster.push_back(p);
            return static_cast<int>(s.roster.size()) - 1;
        }, py::arg("pokemon"))
        .def("pokemon", [](SideState& s, int i) -> PokemonState& {
            if (i < 0 || i >= static_cast<int>(s.roster.size())) throw py::index_error();
            return s.roster[i];
        }, py::arg("index"), py::return_value_policy::reference_internal)
        .def("set_active", [](SideState& s, int slot, int roster_index) {
            if (slot < 0 || slot >= ACTIVE_SLOTS) throw py::index_error();
            s.active[slot] = roster_index;
        }, py::arg("slot"), py::arg("roster_index"))
        .def_readwrite("tera_used", &SideState::tera_used)
        .def_readwrite("tailwind_turns", &SideState::tailwind_turns)
        .def_readwrite("reflect_turns", &SideState::reflect_turns)
        .def_readwrite("light_screen_turns", &SideState::light_screen_turns)
        .def("remaining", &SideState::remaining);

    py::class_<FieldState>(m, "FieldState")
        .def(py::init<>())
        .def_readwrite("weather", &FieldState::weather)
        .def_readwrite("terrain", &FieldState::terrain)
        .def_readwrite("trick_room_turns", &FieldState::trick_room_turns);

    py::class_<BattleState>(m, "BattleState")
        .def(py::init<>())
        .def_readwrite("turn", &BattleState::turn)
        .def_readwrite("field", &BattleState::field)
        .def("side", [](BattleState& b, Side s) -> SideState& { return b.side(s); },
             py::arg("side"), py::return_value_policy::reference_internal)
        .def("is_terminal", &BattleState::is_terminal)
        .def("winner", &BattleState::winner)
        .def("__repr__", &BattleState::to_string);

    py::class_<JointAction>(m, "JointAction")
        .def("to_string", &JointAction::to_string)
        .def("__repr__", &JointAction::to_string)
        .def("__eq__", [](const JointAction& a, const JointAction& b) { return a == b; });

    py::class_<SpeedOrderObservation>(m, "SpeedOrderObservation")
        .def(py::init<>())
        .def_readwrite("species", &SpeedOrderObservation::species)
        .def_readwrite("went_first", &SpeedOrderObservation::went_first)
        .def_readwrite("reference_speed", &SpeedOrderObservation::reference_speed)
        .def_readwrite("trick_room", &SpeedOrderObservation::trick_room)
        .def_readwrite("speed_modifier", &SpeedOrderObservation::speed_modifier);

    py::class_<DamageObservation>(m, "DamageObservation")
        .def(py::init<>())
        .def_readwrite("species", &DamageObservation::species)
        .def_readwrite("move_id", &DamageObservation::move_id)
        .def_readwrite("percent", &DamageObservation::percent)
        .def_readwrite("opponent_attacking", &DamageObservation::opponent_attacking)
        .def_readwrite("knocked_out", &DamageObservation::knocked_out)
        .def_readwrite("counterpart", &DamageObservation::counterpart)
        .def_readwrite("field", &DamageObservation::field);

    py::class_<HealObservation>(m, "HealObservation")
        .def(py::init<>())
        .def_readwrite("species", &HealObservation::species)
        .def_readwrite("percent_healed", &HealObservation::percent_healed);

    py::class_<ItemRevealedObservation>(m, "ItemRevealedObservation")
        .def(py::init<>())
        .def_readwrite("species", &ItemRevealedObservation::species)
        .def_readwrite("item", &ItemRevealedObservation::item);

    py::class_<TeraRevealedObservation>(m, "TeraRevealedObservation")
        .def(py::init<>())
        .def_readwrite("species", &TeraRevealedObservation::species)
        .def_property("tera_type",
            [](const TeraRevealedObservation& o) { return type_to_string(o.tera_type); },
            [](TeraRevealedObservation& o, const std::string& t) { o.tera_type = type_from_string(t); });

    py::class_<MoveRevealedObservation>(m, "MoveRevealedObservation")
        .def(py::init<>())
        .def_readwrite("species", &MoveRevealedObservation::species)
        .def_readwrite("move_id", &MoveRevealedObservation::move_id);

    py::class_<PyOrchestrator>(m, "Orchestrator")
        .def(py::init<int, float, int, int, int, float, float, bool, bool, unsigned int>(),
             py::arg("determinizations") = 10,
             py::arg("time_budget") = 3.0f,
             py::arg("threads") = 4,
             py::arg("depth") = 2,
             py::arg("samples") = 2,
             py::arg("tau_opp") = 0.25f,
             py::arg("tau_self") = 0.30f,
             py::arg("fictitious_play") = false,
             py::arg("verbose") = false,
             py::arg("seed") = 42)
        .def("register_opponents", &PyOrchestrator::register_opponents,
             py::arg("state"), py::arg("side") = Side::Self,
             "Create beliefs for every Pokemon on the other side")
        .def("observe", &PyOrchestrator::observe,
             py::arg("turn"),
             py::arg("events"),
             py::arg("opponent_action") = std::nullopt,
             "Apply one turn of observations")
        .def("decide", &PyOrchestrator::decide,
             py::arg("state"),
             py::arg("side") = Side::Self,
             py::arg("win_probability_hint") = std::nullopt,
             "Choose a joint action for the turn")
        .def("candidates", &PyOrchestrator::candidates,
             py::arg("state"), py::arg("side"), py::arg("top_k") = 15,
             "Score-ordered candidate joint actions")
        .def("step", &PyOrchestrator::step,
             py::arg("state"), py::arg("self_action"), py::arg("opp_action"), py::arg("seed") = 0,
             "Resolve one turn on the reference engine")
        .def("style_profile", &PyOrchestrator::style_profile)
        .def("belief", &PyOrchestrator::belief, py::arg("species"))
#ifdef VGC_USE_LIBTORCH
        .def("load_neural_model", &PyOrchestrator::load_neural_model,
             py::arg("model_path"), py::arg("weight") = 0.5f,
             "Load a TorchScript value network for leaf evaluation")
#endif
        ;
}
