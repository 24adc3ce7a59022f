#pragma once

/**
 * Doubles battle snapshot.
 *
 * Immutable per turn: the engine builds a new state from the prior one,
 * the applied actions and the resolved random outcomes. Search code only
 * ever works on copies.
 */

#include "vgc/core/stats.hpp"
#include "vgc/core/types.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace vgc {

struct MoveSlot {
    std::string id;
    int pp = 0;
    bool disabled = false;
};

struct PokemonState {
    std::string species;
    std::array<Type, 2> types{{Type::Normal, Type::None}};
    StatBlock base_stats{};
    StatBlock stats{};                  // Actual stats (a hypothesis for hidden opponents)
    float hp_fraction = 1.0f;           // In [0, 1], 0 = fainted
    Status status = Status::None;
    std::array<int8_t, NUM_STATS> boosts{};   // HP entry unused
    std::vector<MoveSlot> moves;
    std::string item;
    bool item_revealed = false;
    Type tera_type = Type::None;
    bool terastallized = false;
    std::string locked_move;            // Choice lock
    int protect_streak = 0;
    int turns_active = 0;

    bool fainted() const { return hp_fraction <= 0.0f; }

    int max_hp() const { return stats[stat_index(Stat::HP)]; }

    int current_hp() const;

    // Tera replaces the defensive typing
    std::array<Type, 2> defensive_types() const;

    bool has_type(Type t) const { return types[0] == t || types[1] == t; }

    // Stat after boosts, without items or field effects
    int boosted_stat(Stat s) const;

    bool knows_move(const std::string& id) const;

    const MoveSlot* find_move_slot(const std::string& id) const;
    MoveSlot* find_move_slot(const std::string& id);

    bool holds_choice_item() const;
};

struct SideState {
    std::vector<PokemonState> roster;
    std::array<int, ACTIVE_SLOTS> active{{-1, -1}};   // Roster indices, -1 = empty
    bool tera_used = false;
    int tailwind_turns = 0;
    int reflect_turns = 0;
    int light_screen_turns = 0;

    // nullptr if the slot is empty or its Pokemon has fainted
    const PokemonState* active_pokemon(int slot) const;
    PokemonState* active_pokemon(int slot);

    bool is_active(int roster_index) const;

    int remaining() const;
    int active_count() const;

    float total_hp_fraction() const;

    // Non-fainted roster members not currently on the field
    std::vector<int> bench() const;
};

struct FieldState {
    Weather weather = Weather::None;
    int weather_turns = 0;
    Terrain terrain = Terrain::None;
    int terrain_turns = 0;
    int trick_room_turns = 0;

    bool trick_room() const { return trick_room_turns > 0; }
};

struct BattleState {
    int turn = 1;
    std::array<SideState, NUM_SIDES> sides;
    FieldState field;

    SideState& side(Side s) { return sides[side_index(s)]; }
    const SideState& side(Side s) const { return sides[side_index(s)]; }

    bool is_terminal() const;

    // Winning side at a terminal state; nullopt for draws and ongoing battles
    std::optional<Side> winner() const;

    int total_remaining() const;

    /**
     * Hash of everything that affects future play.
     * @param include_turn false merges positions reached on different turns
     */
    uint64_t signature(bool include_turn = true) const;

    std::string to_string() const;
};

/**
 * Build a Pokemon from the dex at level 50.
 *
 * @param species Dex species name
 * @param spread Spread class name from spread_catalog(); empty = species default
 * @param moves Moveset; empty = species default
 * @param item Held item; empty = species default
 * @throws std::invalid_argument for unknown species, spreads or moves
 */
PokemonState create_pokemon(
    const std::string& species,
    const std::string& spread = "",
    const std::vector<std::string>& moves = {},
    const std::string& item = ""
);

}  // namespace vgc
