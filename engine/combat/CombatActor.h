// Combat actor: attributes, pools, weapon and the derived combat numbers.
#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <random>
#include <string>

#include "../math/GridPos.h"
#include "CombatRules.h"

namespace Neon::Combat {

// Index into the encounter's actor arena. Never a live handle.
using ActorId = std::uint32_t;
constexpr ActorId kInvalidActor = std::numeric_limits<ActorId>::max();

enum class Team { Player, Opponent };

enum class CoverKind { None, Half, Full };

enum class WeaponClass { Melee, Ranged, Tech };

struct Weapon {
    std::string id;
    std::string name{"Unarmed"};
    int damage{10};
    int accuracy{75};       // base hit chance, percent
    int range{1};           // tiles
    float armorPen{0.0f};   // 0..1 fraction of armor ignored
    float critMultiplier{2.0f};
    WeaponClass type{WeaponClass::Ranged};
};

// Core attribute set, nominal range 1..10. Constant for an encounter.
struct Attributes {
    int body{5};
    int reflexes{5};
    int intelligence{5};
    int tech{5};
    int cool{5};
};

// Fully-initialized input produced by the character/enemy factory.
struct ActorDefinition {
    std::string name;
    Team team{Team::Player};
    GridPos position{};
    Attributes attributes{};
    int maxHp{100};
    std::optional<int> startingHp{};  // wounded carry-over; clamped to [1, maxHp]
    int armor{15};                    // 0..100
    int morale{100};                  // 0..100
    int maxAp{3};
    CoverKind cover{CoverKind::None};
    Weapon weapon{};
};

class CombatActor {
public:
    explicit CombatActor(const ActorDefinition& def);

    const std::string& name() const { return name_; }
    Team team() const { return team_; }
    const GridPos& position() const { return position_; }
    const Attributes& attributes() const { return attributes_; }
    const Weapon& weapon() const { return weapon_; }

    int hp() const { return hp_; }
    int maxHp() const { return maxHp_; }
    int armor() const { return armor_; }
    int morale() const { return morale_; }
    int ap() const { return ap_; }
    int maxAp() const { return maxAp_; }

    bool alive() const { return alive_; }
    bool hasActed() const { return hasActed_; }
    bool hasMoved() const { return hasMoved_; }
    bool inCover() const { return cover_ != CoverKind::None; }
    CoverKind cover() const { return cover_; }

    // --- Derived numbers (pure) ---
    int initiativeBonus() const { return attributes_.reflexes * 2; }
    int rollInitiative(std::mt19937& rng) const;
    int dodgeChance(const CombatRules& rules = {}) const;
    int critChance(const CombatRules& rules = {}) const;
    float moraleModifier() const;
    int movementRange(int baseMovementRange) const;
    float hpPercentage() const;
    bool canAfford(int cost) const { return ap_ >= cost; }

    // --- Mutators ---
    // Returns HP actually removed. Dead actors take no damage.
    int applyDamage(int amount, const CombatRules& rules = {});
    bool spendAp(int cost);
    void moveTo(const GridPos& pos);
    void takeCover(CoverKind kind);
    void leaveCover() { cover_ = CoverKind::None; }
    void adjustMorale(int delta);
    void markDefeated();
    void startTurn();
    void endTurn() { hasActed_ = true; }

private:
    std::string name_;
    Team team_{Team::Player};
    GridPos position_{};
    Attributes attributes_{};
    Weapon weapon_{};

    int hp_{0};
    int maxHp_{0};
    int armor_{0};
    int morale_{100};
    int ap_{0};
    int maxAp_{0};

    bool alive_{true};
    bool hasActed_{false};
    bool hasMoved_{false};
    CoverKind cover_{CoverKind::None};
};

const char* toString(Team team);
const char* toString(CoverKind kind);
const char* toString(WeaponClass type);

}  // namespace Neon::Combat
