#include "vgc/game/battle_state.hpp"
#include "vgc/core/dex.hpp"
#include "vgc/core/hash.hpp"
#include <cmath>
#include <sstream>

namespace vgc {

// =============================================================================
// PokemonState Implementation
// =============================================================================

int PokemonState::current_hp() const {
    if (hp_fraction <= 0.0f) return 0;
    int hp = static_cast<int>(std::lround(hp_fraction * max_hp()));
    return hp < 1 ? 1 : hp;
}

std::array<Type, 2> PokemonState::defensive_types() const {
    if (terastallized && tera_type != Type::None) {
        return {{tera_type, Type::None}};
    }
    return types;
}

int PokemonState::boosted_stat(Stat s) const {
    int i = stat_index(s);
    if (s == Stat::HP) return stats[i];
    return static_cast<int>(stats[i] * boost_multiplier(boosts[i]));
}

bool PokemonState::knows_move(const std::string& id) const {
    return find_move_slot(id) != nullptr;
}

const MoveSlot* PokemonState::find_move_slot(const std::string& id) const {
    for (const auto& slot : moves) {
        if (slot.id == id) return &slot;
    }
    return nullptr;
}

MoveSlot* PokemonState::find_move_slot(const std::string& id) {
    for (auto& slot : moves) {
        if (slot.id == id) return &slot;
    }
    return nullptr;
}

bool PokemonState::holds_choice_item() const {
    return item == "choiceband" || item == "choicespecs" || item == "choicescarf";
}

// =============================================================================
// SideState Implementation
// =============================================================================

const PokemonState* SideState::active_pokemon(int slot) const {
    int idx = active[slot];
    if (idx < 0 || idx >= static_cast<int>(roster.size())) return nullptr;
    if (roster[idx].fainted()) return nullptr;
    return &roster[idx];
}

PokemonState* SideState::active_pokemon(int slot) {
    int idx = active[slot];
    if (idx < 0 || idx >= static_cast<int>(roster.size())) return nullptr;
    if (roster[idx].fainted()) return nullptr;
    return &roster[idx];
}

bool SideState::is_active(int roster_index) const {
    for (int slot = 0; slot < ACTIVE_SLOTS; ++slot) {
        if (active[slot] == roster_index) return true;
    }
    return false;
}

int SideState::remaining() const {
    int n = 0;
    for (const auto& p : roster) {
        if (!p.fainted()) ++n;
    }
    return n;
}

int SideState::active_count() const {
    int n = 0;
    for (int slot = 0; slot < ACTIVE_SLOTS; ++slot) {
        if (active_pokemon(slot) != nullptr) ++n;
    }
    return n;
}

float SideState::total_hp_fraction() const {
    float total = 0.0f;
    for (const auto& p : roster) {
        total += p.hp_fraction;
    }
    return total;
}

std::vector<int> SideState::bench() const {
    std::vector<int> result;
    for (int i = 0; i < static_cast<int>(roster.size()); ++i) {
        if (!roster[i].fainted() && !is_active(i)) {
            result.push_back(i);
        }
    }
    return result;
}

// =============================================================================
// BattleState Implementation
// =============================================================================

bool BattleState::is_terminal() const {
    return sides[0].remaining() == 0 || sides[1].remaining() == 0;
}

std::optional<Side> BattleState::winner() const {
    bool self_alive = sides[0].remaining() > 0;
    bool opp_alive = sides[1].remaining() > 0;
    if (self_alive && !opp_alive) return Side::Self;
    if (opp_alive && !self_alive) return Side::Opponent;
    return std::nullopt;
}

int BattleState::total_remaining() const {
    return sides[0].remaining() + sides[1].remaining();
}

uint64_t BattleState::signature(bool include_turn) const {
    uint64_t h = include_turn ? mix64(static_cast<uint64_t>(turn) + 1) : 0x51ed27ULL;

    for (const auto& side : sides) {
        h = hash_combine(h, static_cast<uint64_t>(side.active[0] + 1));
        h = hash_combine(h, static_cast<uint64_t>(side.active[1] + 1));
        h = hash_combine(h, side.tera_used ? 1 : 0);
        h = hash_combine(h, static_cast<uint64_t>(side.tailwind_turns));
        h = hash_combine(h, static_cast<uint64_t>(side.reflect_turns * 8 + side.light_screen_turns));

        for (const auto& p : side.roster) {
            h = hash_combine(h, hash_string(p.species));
            // HP to 1/1000 resolution keeps distinct damage rolls apart
            h = hash_combine(h, static_cast<uint64_t>(std::lround(p.hp_fraction * 1000.0f)));
            h = hash_combine(h, static_cast<uint64_t>(p.status));
            for (int i = 1; i < NUM_STATS; ++i) {
                h = hash_combine(h, static_cast<uint64_t>(p.boosts[i] + 8));
                h = hash_combine(h, static_cast<uint64_t>(p.stats[i]));
            }
            h = hash_combine(h, hash_string(p.item));
            h = hash_combine(h, static_cast<uint64_t>(p.tera_type));
            h = hash_combine(h, p.terastallized ? 1 : 0);
            h = hash_combine(h, hash_string(p.locked_move));
            h = hash_combine(h, static_cast<uint64_t>(p.protect_streak));
            h = hash_combine(h, p.turns_active > 0 ? 1 : 0);
        }
    }

    h = hash_combine(h, static_cast<uint64_t>(field.weather));
    h = hash_combine(h, static_cast<uint64_t>(field.weather_turns));
    h = hash_combine(h, static_cast<uint64_t>(field.terrain));
    h = hash_combine(h, static_cast<uint64_t>(field.trick_room_turns));
    return h;
}

std::string BattleState::to_string() const {
    std::ostringstream ss;
    ss << "Turn " << turn;
    if (field.trick_room()) ss << " [trick room]";
    for (int s = 0; s < NUM_SIDES; ++s) {
        const SideState& side = sides[s];
        ss << "\n  " << side_to_string(static_cast<Side>(s)) << ":";
        for (int i = 0; i < static_cast<int>(side.roster.size()); ++i) {
            const PokemonState& p = side.roster[i];
            ss << " " << (side.is_active(i) ? "*" : "") << p.species
               << "(" << static_cast<int>(std::lround(p.hp_fraction * 100)) << "%)";
        }
        if (side.tailwind_turns > 0) ss << " [tailwind]";
    }
    return ss.str();
}

PokemonState create_pokemon(
    const std::string& species,
    const std::string& spread,
    const std::vector<std::string>& moves,
    const std::string& item
) {
    const SpeciesData& data = find_species(species);
    const StatSpread& stat_spread = find_spread(spread.empty() ? data.default_spread : spread);

    PokemonState p;
    p.species = data.name;
    p.types = data.types;
    p.base_stats = data.base_stats;
    p.stats = compute_stats(data.base_stats, stat_spread);
    p.item = item.empty() ? data.default_item : item;
    p.tera_type = data.default_tera;

    const std::vector<std::string>& move_ids = moves.empty() ? data.moves : moves;
    for (const auto& id : move_ids) {
        const MoveData& move = find_move(id);
        p.moves.push_back(MoveSlot{move.id, move.pp, false});
    }
    return p;
}

}  // namespace vgc
