#pragma once

#include "vgc/core/dex.hpp"
#include "vgc/core/hash.hpp"
#include "vgc/core/types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <variant>

namespace vgc {

// Target slot encoding: foes are negative, allies positive, 0 = spread/self/field
constexpr int8_t TARGET_NONE = 0;
constexpr int8_t TARGET_FOE_A = -1;
constexpr int8_t TARGET_FOE_B = -2;
constexpr int8_t TARGET_ALLY_A = 1;
constexpr int8_t TARGET_ALLY_B = 2;

inline int8_t foe_target(int slot) { return static_cast<int8_t>(-(slot + 1)); }
inline int8_t ally_target(int slot) { return static_cast<int8_t>(slot + 1); }
inline bool is_foe_target(int8_t t) { return t < 0; }
inline bool is_ally_target(int8_t t) { return t > 0; }
inline int target_slot(int8_t t) { return t < 0 ? -t - 1 : t - 1; }

struct MoveChoice {
    std::string move_id;
    int8_t target = TARGET_NONE;
};

struct SwitchChoice {
    int8_t roster_index = -1;
};

struct TeraMoveChoice {
    std::string move_id;
    int8_t target = TARGET_NONE;
};

// Empty or fainted slot
struct PassChoice {};

using ActionChoice = std::variant<MoveChoice, SwitchChoice, TeraMoveChoice, PassChoice>;

// Helper for exhaustive std::visit with lambdas
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

/**
 * One legal atomic action for a single active slot.
 */
struct CandidateAction {
    ActionChoice choice;
    int8_t priority = 0;
    bool self_targeting = false;
    bool spread = false;
    uint32_t tags = TAG_NONE;

    CandidateAction() : choice(PassChoice{}) {}

    static CandidateAction use_move(const MoveData& move, int8_t target) {
        CandidateAction a;
        a.choice = MoveChoice{move.id, target};
        a.fill_move_metadata(move, target);
        return a;
    }

    static CandidateAction terastallize(const MoveData& move, int8_t target) {
        CandidateAction a;
        a.choice = TeraMoveChoice{move.id, target};
        a.fill_move_metadata(move, target);
        a.tags |= TAG_TERA;
        return a;
    }

    static CandidateAction switch_to(int roster_index) {
        CandidateAction a;
        a.choice = SwitchChoice{static_cast<int8_t>(roster_index)};
        a.priority = 7;  // Switches resolve before any move
        a.tags = TAG_SWITCH;
        return a;
    }

    static CandidateAction pass() { return CandidateAction(); }

    bool is_move() const { return std::holds_alternative<MoveChoice>(choice); }
    bool is_switch() const { return std::holds_alternative<SwitchChoice>(choice); }
    bool is_tera() const { return std::holds_alternative<TeraMoveChoice>(choice); }
    bool is_pass() const { return std::holds_alternative<PassChoice>(choice); }

    // Move id for Move / TerastallizeAndMove, empty otherwise
    std::string move_id() const {
        return std::visit(overloaded{
            [](const MoveChoice& m) { return m.move_id; },
            [](const TeraMoveChoice& m) { return m.move_id; },
            [](const SwitchChoice&) { return std::string(); },
            [](const PassChoice&) { return std::string(); }
        }, choice);
    }

    int8_t target() const {
        return std::visit(overloaded{
            [](const MoveChoice& m) { return m.target; },
            [](const TeraMoveChoice& m) { return m.target; },
            [](const SwitchChoice&) { return TARGET_NONE; },
            [](const PassChoice&) { return TARGET_NONE; }
        }, choice);
    }

    int switch_index() const {
        if (const auto* s = std::get_if<SwitchChoice>(&choice)) {
            return s->roster_index;
        }
        return -1;
    }

    bool has_tag(uint32_t tag) const { return (tags & tag) != 0; }

    std::string to_string() const {
        return std::visit(overloaded{
            [](const MoveChoice& m) {
                return "move:" + m.move_id + ":" + std::to_string(m.target);
            },
            [](const TeraMoveChoice& m) {
                return "tera:" + m.move_id + ":" + std::to_string(m.target);
            },
            [](const SwitchChoice& s) {
                return "switch:" + std::to_string(s.roster_index);
            },
            [](const PassChoice&) { return std::string("pass"); }
        }, choice);
    }

    uint64_t signature() const { return hash_string(to_string()); }

    bool operator==(const CandidateAction& other) const {
        return choice.index() == other.choice.index() &&
               to_string() == other.to_string();
    }

    bool operator!=(const CandidateAction& other) const {
        return !(*this == other);
    }

private:
    void fill_move_metadata(const MoveData& move, int8_t target) {
        priority = static_cast<int8_t>(move.priority);
        self_targeting = move.target == MoveTarget::Self ||
                         move.target == MoveTarget::AllySide ||
                         is_ally_target(target);
        spread = move.is_spread();
        tags = move.tags;
        if (spread) tags |= TAG_SPREAD;
        if (move.priority > 0 && move.is_damaging()) tags |= TAG_PRIORITY;
    }
};

/**
 * One CandidateAction per active slot on one side.
 */
struct JointAction {
    std::array<CandidateAction, ACTIVE_SLOTS> slots;
    int size = ACTIVE_SLOTS;

    JointAction() = default;

    JointAction(const CandidateAction& a, const CandidateAction& b)
        : slots{{a, b}}, size(ACTIVE_SLOTS) {}

    static JointAction single(const CandidateAction& a) {
        JointAction j;
        j.slots[0] = a;
        j.size = 1;
        return j;
    }

    const CandidateAction& operator[](int slot) const { return slots[slot]; }
    CandidateAction& operator[](int slot) { return slots[slot]; }

    int tera_count() const {
        int n = 0;
        for (int i = 0; i < size; ++i) n += slots[i].is_tera() ? 1 : 0;
        return n;
    }

    bool has_tag(uint32_t tag) const {
        for (int i = 0; i < size; ++i) {
            if (slots[i].has_tag(tag)) return true;
        }
        return false;
    }

    // "type:move:target|type:move:target"
    std::string to_string() const {
        std::string s = slots[0].to_string();
        for (int i = 1; i < size; ++i) {
            s += "|" + slots[i].to_string();
        }
        return s;
    }

    uint64_t signature() const { return hash_string(to_string()); }

    bool operator==(const JointAction& other) const {
        if (size != other.size) return false;
        for (int i = 0; i < size; ++i) {
            if (slots[i] != other.slots[i]) return false;
        }
        return true;
    }

    bool operator!=(const JointAction& other) const {
        return !(*this == other);
    }
};

// Both sides' choices for one turn, indexed by side_index()
using TurnActions = std::array<JointAction, NUM_SIDES>;

}  // namespace vgc
