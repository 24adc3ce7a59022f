#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace vgc {

// Sides are absolute: Self is the agent, Opponent the other player
enum class Side : uint8_t {
    Self = 0,
    Opponent = 1
};

constexpr int NUM_SIDES = 2;
constexpr int ACTIVE_SLOTS = 2;
constexpr int LEVEL = 50;

inline Side opposite(Side s) {
    return s == Side::Self ? Side::Opponent : Side::Self;
}

inline int side_index(Side s) {
    return static_cast<int>(s);
}

inline std::string side_to_string(Side s) {
    return s == Side::Self ? "self" : "opponent";
}

enum class Stat : uint8_t {
    HP = 0,
    Atk,
    Def,
    SpA,
    SpD,
    Spe
};

constexpr int NUM_STATS = 6;

using StatBlock = std::array<int, NUM_STATS>;

inline int stat_index(Stat s) {
    return static_cast<int>(s);
}

std::string stat_to_string(Stat s);

enum class Type : uint8_t {
    Normal = 0,
    Fire,
    Water,
    Electric,
    Grass,
    Ice,
    Fighting,
    Poison,
    Ground,
    Flying,
    Psychic,
    Bug,
    Rock,
    Ghost,
    Dragon,
    Dark,
    Steel,
    Fairy,
    None     // Typeless (Struggle) or empty second type
};

constexpr int NUM_TYPES = 18;

std::string type_to_string(Type t);

/**
 * Parse a lowercase type name ("fairy", "steel", ...).
 * @throws std::invalid_argument on unknown names
 */
Type type_from_string(const std::string& name);

/**
 * Type effectiveness multiplier of an attacking type against one defending type.
 * Type::None on either side is neutral.
 */
float type_effectiveness(Type attack, Type defend);

// Combined multiplier against a dual-typed defender
float type_effectiveness(Type attack, const std::array<Type, 2>& defend);

enum class Status : uint8_t {
    None = 0,
    Burn,
    Paralysis,
    Sleep,
    Poison,
    Toxic,
    Freeze
};

enum class Weather : uint8_t {
    None = 0,
    Sun,
    Rain,
    Sand,
    Snow
};

enum class Terrain : uint8_t {
    None = 0,
    Electric,
    Grassy,
    Psychic,
    Misty
};

enum class MoveCategory : uint8_t {
    Physical = 0,
    Special,
    Status
};

enum class MoveTarget : uint8_t {
    Normal = 0,        // One adjacent Pokemon, chosen
    AllAdjacentFoes,
    AllAdjacent,
    Self,
    AllySide,
    FoeSide,
    Field
};

// Static action tags, shared by move data and candidate actions
enum ActionTag : uint32_t {
    TAG_NONE          = 0,
    TAG_PROTECT       = 1u << 0,
    TAG_SPEED_CONTROL = 1u << 1,
    TAG_PIVOT         = 1u << 2,
    TAG_SPREAD        = 1u << 3,
    TAG_PRIORITY      = 1u << 4,
    TAG_REDIRECTION   = 1u << 5,
    TAG_SETUP         = 1u << 6,
    TAG_HEALING       = 1u << 7,
    TAG_FAKE_OUT      = 1u << 8,
    TAG_SCREEN        = 1u << 9,
    TAG_SWITCH        = 1u << 10,
    TAG_TERA          = 1u << 11
};

}  // namespace vgc
