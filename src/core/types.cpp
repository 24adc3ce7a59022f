/**
 * Type chart and enum names.
 */

#include "vgc/core/types.hpp"
#include <initializer_list>
#include <stdexcept>

namespace vgc {

namespace {

const char* const TYPE_NAMES[NUM_TYPES] = {
    "normal", "fire", "water", "electric", "grass", "ice",
    "fighting", "poison", "ground", "flying", "psychic", "bug",
    "rock", "ghost", "dragon", "dark", "steel", "fairy"
};

using T = Type;

struct TypeChart {
    float table[NUM_TYPES][NUM_TYPES];

    TypeChart() {
        for (int a = 0; a < NUM_TYPES; ++a) {
            for (int d = 0; d < NUM_TYPES; ++d) {
                table[a][d] = 1.0f;
            }
        }

        row(T::Normal,   {},                                            {T::Rock, T::Steel},                         {T::Ghost});
        row(T::Fire,     {T::Grass, T::Ice, T::Bug, T::Steel},          {T::Fire, T::Water, T::Rock, T::Dragon},      {});
        row(T::Water,    {T::Fire, T::Ground, T::Rock},                 {T::Water, T::Grass, T::Dragon},              {});
        row(T::Electric, {T::Water, T::Flying},                         {T::Electric, T::Grass, T::Dragon},           {T::Ground});
        row(T::Grass,    {T::Water, T::Ground, T::Rock},
            {T::Fire, T::Grass, T::Poison, T::Flying, T::Bug, T::Dragon, T::Steel}, {});
        row(T::Ice,      {T::Grass, T::Ground, T::Flying, T::Dragon},   {T::Fire, T::Water, T::Ice, T::Steel},        {});
        row(T::Fighting, {T::Normal, T::Ice, T::Rock, T::Dark, T::Steel},
            {T::Poison, T::Flying, T::Psychic, T::Bug, T::Fairy},      {T::Ghost});
        row(T::Poison,   {T::Grass, T::Fairy},                          {T::Poison, T::Ground, T::Rock, T::Ghost},    {T::Steel});
        row(T::Ground,   {T::Fire, T::Electric, T::Poison, T::Rock, T::Steel}, {T::Grass, T::Bug},                   {T::Flying});
        row(T::Flying,   {T::Grass, T::Fighting, T::Bug},               {T::Electric, T::Rock, T::Steel},             {});
        row(T::Psychic,  {T::Fighting, T::Poison},                      {T::Psychic, T::Steel},                       {T::Dark});
        row(T::Bug,      {T::Grass, T::Psychic, T::Dark},
            {T::Fire, T::Fighting, T::Poison, T::Flying, T::Ghost, T::Steel, T::Fairy}, {});
        row(T::Rock,     {T::Fire, T::Ice, T::Flying, T::Bug},          {T::Fighting, T::Ground, T::Steel},           {});
        row(T::Ghost,    {T::Psychic, T::Ghost},                        {T::Dark},                                    {T::Normal});
        row(T::Dragon,   {T::Dragon},                                   {T::Steel},                                   {T::Fairy});
        row(T::Dark,     {T::Psychic, T::Ghost},                        {T::Fighting, T::Dark, T::Fairy},             {});
        row(T::Steel,    {T::Ice, T::Rock, T::Fairy},                   {T::Fire, T::Water, T::Electric, T::Steel},   {});
        row(T::Fairy,    {T::Fighting, T::Dragon, T::Dark},             {T::Fire, T::Poison, T::Steel},               {});
    }

    void row(Type attack,
             std::initializer_list<Type> super_effective,
             std::initializer_list<Type> resisted,
             std::initializer_list<Type> immune) {
        int a = static_cast<int>(attack);
        for (Type d : super_effective) table[a][static_cast<int>(d)] = 2.0f;
        for (Type d : resisted) table[a][static_cast<int>(d)] = 0.5f;
        for (Type d : immune) table[a][static_cast<int>(d)] = 0.0f;
    }
};

const TypeChart& chart() {
    static const TypeChart instance;
    return instance;
}

}  // namespace

std::string stat_to_string(Stat s) {
    switch (s) {
        case Stat::HP: return "hp";
        case Stat::Atk: return "atk";
        case Stat::Def: return "def";
        case Stat::SpA: return "spa";
        case Stat::SpD: return "spd";
        case Stat::Spe: return "spe";
    }
    return "unknown";
}

std::string type_to_string(Type t) {
    if (t == Type::None) return "none";
    return TYPE_NAMES[static_cast<int>(t)];
}

Type type_from_string(const std::string& name) {
    for (int i = 0; i < NUM_TYPES; ++i) {
        if (name == TYPE_NAMES[i]) {
            return static_cast<Type>(i);
        }
    }
    if (name == "none" || name.empty()) return Type::None;
    throw std::invalid_argument("Unknown type: " + name);
}

float type_effectiveness(Type attack, Type defend) {
    if (attack == Type::None || defend == Type::None) return 1.0f;
    return chart().table[static_cast<int>(attack)][static_cast<int>(defend)];
}

float type_effectiveness(Type attack, const std::array<Type, 2>& defend) {
    float mult = type_effectiveness(attack, defend[0]);
    if (defend[1] != defend[0]) {
        mult *= type_effectiveness(attack, defend[1]);
    }
    return mult;
}

}  // namespace vgc
