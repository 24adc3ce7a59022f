/**
 * Built-in move and species tables.
 *
 * Covers the common doubles staples the reference engine and the
 * tests need; anything else is the damage calculator's data problem.
 */

#include "vgc/core/dex.hpp"
#include <stdexcept>
#include <unordered_map>

namespace vgc {

namespace {

constexpr MoveCategory PHYS = MoveCategory::Physical;
constexpr MoveCategory SPEC = MoveCategory::Special;
constexpr MoveCategory STAT = MoveCategory::Status;

constexpr MoveTarget ONE = MoveTarget::Normal;
constexpr MoveTarget FOES = MoveTarget::AllAdjacentFoes;
constexpr MoveTarget ADJ = MoveTarget::AllAdjacent;
constexpr MoveTarget SELF = MoveTarget::Self;
constexpr MoveTarget ALLIES = MoveTarget::AllySide;
constexpr MoveTarget FIELD = MoveTarget::Field;

using E = MoveEffect;

const std::vector<MoveData>& move_table() {
    static const std::vector<MoveData> table = {
        // id              type            cat   pow  acc prio target effect          tags                                  pp
        {"protect",        Type::Normal,   STAT,   0,   0,  4, SELF,  E::Protect,     TAG_PROTECT,                          10},
        {"detect",         Type::Fighting, STAT,   0,   0,  4, SELF,  E::Protect,     TAG_PROTECT,                           5},
        {"fakeout",        Type::Normal,   PHYS,  40, 100,  3, ONE,   E::FakeOut,     TAG_FAKE_OUT | TAG_PRIORITY,          10},
        {"tailwind",       Type::Flying,   STAT,   0,   0,  0, ALLIES, E::Tailwind,   TAG_SPEED_CONTROL,                    15},
        {"trickroom",      Type::Psychic,  STAT,   0,   0, -7, FIELD, E::TrickRoom,   TAG_SPEED_CONTROL,                     5},
        {"icywind",        Type::Ice,      SPEC,  55,  95,  0, FOES,  E::SpeedDrop,   TAG_SPEED_CONTROL | TAG_SPREAD,       15},
        {"electroweb",     Type::Electric, SPEC,  55,  95,  0, FOES,  E::SpeedDrop,   TAG_SPEED_CONTROL | TAG_SPREAD,       15},
        {"followme",       Type::Normal,   STAT,   0,   0,  2, SELF,  E::Redirect,    TAG_REDIRECTION,                      20},
        {"ragepowder",     Type::Bug,      STAT,   0,   0,  2, SELF,  E::Redirect,    TAG_REDIRECTION,                      20},
        {"reflect",        Type::Psychic,  STAT,   0,   0,  0, ALLIES, E::Reflect,    TAG_SCREEN,                           20},
        {"lightscreen",    Type::Psychic,  STAT,   0,   0,  0, ALLIES, E::LightScreen, TAG_SCREEN,                          30},
        {"swordsdance",    Type::Normal,   STAT,   0,   0,  0, SELF,  E::BoostAtk2,   TAG_SETUP,                            20},
        {"nastyplot",      Type::Dark,     STAT,   0,   0,  0, SELF,  E::BoostSpA2,   TAG_SETUP,                            20},
        {"recover",        Type::Normal,   STAT,   0,   0,  0, SELF,  E::Heal50,      TAG_HEALING,                           5},
        {"trick",          Type::Psychic,  STAT,   0, 100,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"uturn",          Type::Bug,      PHYS,  70, 100,  0, ONE,   E::None,        TAG_PIVOT,                            20},
        {"voltswitch",     Type::Electric, SPEC,  70, 100,  0, ONE,   E::None,        TAG_PIVOT,                            20},
        {"earthquake",     Type::Ground,   PHYS, 100, 100,  0, ADJ,   E::None,        TAG_SPREAD,                           10},
        {"rockslide",      Type::Rock,     PHYS,  75,  90,  0, FOES,  E::None,        TAG_SPREAD,                           10},
        {"heatwave",       Type::Fire,     SPEC,  95,  90,  0, FOES,  E::None,        TAG_SPREAD,                           10},
        {"dazzlinggleam",  Type::Fairy,    SPEC,  80, 100,  0, FOES,  E::None,        TAG_SPREAD,                           10},
        {"hypervoice",     Type::Normal,   SPEC,  90, 100,  0, FOES,  E::None,        TAG_SPREAD,                           10},
        {"muddywater",     Type::Water,    SPEC,  90,  85,  0, FOES,  E::None,        TAG_SPREAD,                           10},
        {"flamethrower",   Type::Fire,     SPEC,  90, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"fireblast",      Type::Fire,     SPEC, 110,  85,  0, ONE,   E::None,        TAG_NONE,                              5},
        {"thunderbolt",    Type::Electric, SPEC,  90, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"hydropump",      Type::Water,    SPEC, 110,  80,  0, ONE,   E::None,        TAG_NONE,                              5},
        {"scald",          Type::Water,    SPEC,  80, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"energyball",     Type::Grass,    SPEC,  90, 100,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"icebeam",        Type::Ice,      SPEC,  90, 100,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"psychic",        Type::Psychic,  SPEC,  90, 100,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"shadowball",     Type::Ghost,    SPEC,  80, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"darkpulse",      Type::Dark,     SPEC,  80, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"dragonpulse",    Type::Dragon,   SPEC,  85, 100,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"dracometeor",    Type::Dragon,   SPEC, 130,  90,  0, ONE,   E::None,        TAG_NONE,                              5},
        {"moonblast",      Type::Fairy,    SPEC,  95, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"flashcannon",    Type::Steel,    SPEC,  80, 100,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"makeitrain",     Type::Steel,    SPEC, 120, 100,  0, FOES,  E::None,        TAG_SPREAD,                            5},
        {"sludgebomb",     Type::Poison,   SPEC,  90, 100,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"airslash",       Type::Flying,   SPEC,  75,  95,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"aurasphere",     Type::Fighting, SPEC,  80,   0,  0, ONE,   E::None,        TAG_NONE,                             20},
        {"earthpower",     Type::Ground,   SPEC,  90, 100,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"closecombat",    Type::Fighting, PHYS, 120, 100,  0, ONE,   E::None,        TAG_NONE,                              5},
        {"flareblitz",     Type::Fire,     PHYS, 120, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"waterfall",      Type::Water,    PHYS,  80, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"surgingstrikes", Type::Water,    PHYS,  75, 100,  0, ONE,   E::None,        TAG_NONE,                              5},
        {"woodhammer",     Type::Grass,    PHYS, 120, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"iciclecrash",    Type::Ice,      PHYS,  85,  90,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"knockoff",       Type::Dark,     PHYS,  65, 100,  0, ONE,   E::None,        TAG_NONE,                             20},
        {"dragonclaw",     Type::Dragon,   PHYS,  80, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"ironhead",       Type::Steel,    PHYS,  80, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"playrough",      Type::Fairy,    PHYS,  90,  90,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"poisonjab",      Type::Poison,   PHYS,  80, 100,  0, ONE,   E::None,        TAG_NONE,                             20},
        {"highhorsepower", Type::Ground,   PHYS,  95,  95,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"stompingtantrum", Type::Ground,  PHYS,  75, 100,  0, ONE,   E::None,        TAG_NONE,                             10},
        {"bravebird",      Type::Flying,   PHYS, 120, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"stoneedge",      Type::Rock,     PHYS, 100,  80,  0, ONE,   E::None,        TAG_NONE,                              5},
        {"wildcharge",     Type::Electric, PHYS,  90, 100,  0, ONE,   E::None,        TAG_NONE,                             15},
        {"extremespeed",   Type::Normal,   PHYS,  80, 100,  2, ONE,   E::None,        TAG_PRIORITY,                          5},
        {"suckerpunch",    Type::Dark,     PHYS,  70, 100,  1, ONE,   E::None,        TAG_PRIORITY,                          5},
        {"iceshard",       Type::Ice,      PHYS,  40, 100,  1, ONE,   E::None,        TAG_PRIORITY,                         30},
        {"aquajet",        Type::Water,    PHYS,  40, 100,  1, ONE,   E::None,        TAG_PRIORITY,                         20},
        {"bulletpunch",    Type::Steel,    PHYS,  40, 100,  1, ONE,   E::None,        TAG_PRIORITY,                         30},
        {"shadowsneak",    Type::Ghost,    PHYS,  40, 100,  1, ONE,   E::None,        TAG_PRIORITY,                         30},
        {"tackle",         Type::Normal,   PHYS,  40, 100,  0, ONE,   E::None,        TAG_NONE,                             35},
    };
    return table;
}

const std::unordered_map<std::string, const MoveData*>& move_index() {
    static const std::unordered_map<std::string, const MoveData*> index = [] {
        std::unordered_map<std::string, const MoveData*> m;
        for (const auto& move : move_table()) {
            m[move.id] = &move;
        }
        return m;
    }();
    return index;
}

const std::vector<SpeciesData>& species_table() {
    static const std::vector<SpeciesData> table = {
        // name             types                              HP  Atk  Def  SpA  SpD  Spe
        {"incineroar",   {{Type::Fire, Type::Dark}},        {{ 95, 115,  90,  80,  90,  60}},
            {"fakeout", "flareblitz", "knockoff", "uturn"}, "HB252", "sitrusberry", Type::Ghost},
        {"rillaboom",    {{Type::Grass, Type::None}},       {{100, 125,  90,  60,  70,  85}},
            {"fakeout", "woodhammer", "highhorsepower", "uturn"}, "AS252", "assaultvest", Type::Fire},
        {"amoonguss",    {{Type::Grass, Type::Poison}},     {{114,  85,  70,  85,  80,  30}},
            {"ragepowder", "sludgebomb", "energyball", "protect"}, "HB252", "rockyhelmet", Type::Water},
        {"urshifu",      {{Type::Fighting, Type::Water}},   {{100, 130, 100,  63,  60,  97}},
            {"surgingstrikes", "closecombat", "aquajet", "protect"}, "AS252", "choicescarf", Type::Water},
        {"fluttermane",  {{Type::Ghost, Type::Fairy}},      {{ 55,  55,  55, 135, 135, 135}},
            {"moonblast", "shadowball", "dazzlinggleam", "protect"}, "CS252_timid", "choicespecs", Type::Fairy},
        {"tornadus",     {{Type::Flying, Type::None}},      {{ 79, 115,  70, 125,  80, 111}},
            {"tailwind", "airslash", "darkpulse", "protect"}, "CS252_timid", "focussash", Type::Ghost},
        {"landorus",     {{Type::Ground, Type::Flying}},    {{ 89, 145,  90, 105,  80,  91}},
            {"stompingtantrum", "rockslide", "uturn", "protect"}, "AS252", "choicescarf", Type::Steel},
        {"ironhands",    {{Type::Fighting, Type::Electric}}, {{154, 140, 108,  50,  68,  50}},
            {"fakeout", "closecombat", "wildcharge", "protect"}, "HA252", "assaultvest", Type::Grass},
        {"chienpao",     {{Type::Dark, Type::Ice}},         {{ 80, 120,  80,  90,  65, 135}},
            {"iciclecrash", "suckerpunch", "iceshard", "protect"}, "AS252_jolly", "focussash", Type::Ghost},
        {"gholdengo",    {{Type::Steel, Type::Ghost}},      {{ 87,  60,  95, 133,  91,  84}},
            {"makeitrain", "shadowball", "nastyplot", "protect"}, "CS252", "choicespecs", Type::Steel},
        {"indeedee",     {{Type::Psychic, Type::Normal}},   {{ 70,  55,  65,  95, 105,  85}},
            {"followme", "psychic", "trickroom", "protect"}, "HB252", "psychicseed", Type::Fairy},
        {"dragonite",    {{Type::Dragon, Type::Flying}},    {{ 91, 134,  95, 100, 100,  80}},
            {"extremespeed", "dragonclaw", "stompingtantrum", "protect"}, "AS252", "choiceband", Type::Normal},
        {"garchomp",     {{Type::Dragon, Type::Ground}},    {{108, 130,  95,  80,  85, 102}},
            {"earthquake", "dragonclaw", "rockslide", "protect"}, "AS252_jolly", "lifeorb", Type::Steel},
        {"raichu",       {{Type::Electric, Type::None}},    {{ 60,  90,  55,  90,  80, 110}},
            {"thunderbolt", "fakeout", "electroweb", "protect"}, "CS252_timid", "focussash", Type::Electric},
        {"gyarados",     {{Type::Water, Type::Flying}},     {{ 95, 125,  79,  60, 100,  81}},
            {"waterfall", "tackle", "icywind", "protect"}, "HB252", "sitrusberry", Type::Ground},
        {"gastrodon",    {{Type::Water, Type::Ground}},     {{111,  83,  68,  92,  82,  39}},
            {"earthpower", "scald", "icebeam", "recover"}, "HD252", "leftovers", Type::Fire},
    };
    return table;
}

}  // namespace

const MoveData* lookup_move(const std::string& id) {
    const auto& index = move_index();
    auto it = index.find(id);
    if (it == index.end()) {
        if (id == "struggle") return &struggle_move();
        return nullptr;
    }
    return it->second;
}

const MoveData& find_move(const std::string& id) {
    const MoveData* move = lookup_move(id);
    if (move == nullptr) {
        throw std::invalid_argument("Unknown move: " + id);
    }
    return *move;
}

const MoveData& struggle_move() {
    static const MoveData struggle = {
        "struggle", Type::None, PHYS, 50, 0, 0, ONE, E::None, TAG_NONE, 1
    };
    return struggle;
}

const SpeciesData& find_species(const std::string& name) {
    for (const auto& species : species_table()) {
        if (species.name == name) {
            return species;
        }
    }
    throw std::invalid_argument("Unknown species: " + name);
}

std::vector<std::string> species_names() {
    std::vector<std::string> names;
    for (const auto& species : species_table()) {
        names.push_back(species.name);
    }
    return names;
}

}  // namespace vgc
