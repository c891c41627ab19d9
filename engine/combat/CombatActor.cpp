#include "CombatActor.h"

#include <algorithm>

namespace Neon::Combat {

CombatActor::CombatActor(const ActorDefinition& def)
    : name_(def.name),
      team_(def.team),
      position_(def.position),
      attributes_(def.attributes),
      weapon_(def.weapon),
      maxHp_(std::max(1, def.maxHp)),
      armor_(std::clamp(def.armor, 0, 100)),
      morale_(std::clamp(def.morale, 0, 100)),
      maxAp_(std::max(0, def.maxAp)),
      cover_(def.cover) {
    hp_ = def.startingHp ? std::clamp(*def.startingHp, 1, maxHp_) : maxHp_;
    ap_ = maxAp_;
}

int CombatActor::rollInitiative(std::mt19937& rng) const {
    std::uniform_int_distribution<int> d10(1, 10);
    return initiativeBonus() + d10(rng);
}

int CombatActor::dodgeChance(const CombatRules& rules) const {
    return std::min(rules.dodgeCap, attributes_.reflexes * rules.dodgePerReflex);
}

int CombatActor::critChance(const CombatRules& rules) const { return attributes_.cool * rules.critPerCool; }

float CombatActor::moraleModifier() const { return 1.0f + (static_cast<float>(morale_) - 50.0f) / 200.0f; }

int CombatActor::movementRange(int baseMovementRange) const { return baseMovementRange + attributes_.reflexes / 4; }

float CombatActor::hpPercentage() const {
    if (maxHp_ <= 0) return 0.0f;
    return static_cast<float>(hp_) / static_cast<float>(maxHp_) * 100.0f;
}

int CombatActor::applyDamage(int amount, const CombatRules& rules) {
    if (!alive_ || amount <= 0) return 0;
    const int dealt = std::min(amount, hp_);
    hp_ -= dealt;

    // Morale reacts to the size of the incoming hit, not to what was left to lose.
    const float share = static_cast<float>(amount) / static_cast<float>(maxHp_);
    if (share >= rules.heavyHitFraction) {
        adjustMorale(-rules.heavyHitMoraleLoss);
    } else if (share >= rules.solidHitFraction) {
        adjustMorale(-rules.solidHitMoraleLoss);
    }

    if (hp_ <= 0) {
        hp_ = 0;
        alive_ = false;
        cover_ = CoverKind::None;
    }
    return dealt;
}

bool CombatActor::spendAp(int cost) {
    if (cost < 0 || ap_ < cost) return false;
    ap_ -= cost;
    return true;
}

void CombatActor::moveTo(const GridPos& pos) {
    position_ = pos;
    hasMoved_ = true;
    cover_ = CoverKind::None;
}

void CombatActor::takeCover(CoverKind kind) { cover_ = kind; }

void CombatActor::adjustMorale(int delta) { morale_ = std::clamp(morale_ + delta, 0, 100); }

void CombatActor::markDefeated() {
    hp_ = 0;
    alive_ = false;
    ap_ = 0;
    cover_ = CoverKind::None;
}

void CombatActor::startTurn() {
    ap_ = maxAp_;
    hasActed_ = false;
    hasMoved_ = false;
}

const char* toString(Team team) { return team == Team::Player ? "player" : "opponent"; }

const char* toString(CoverKind kind) {
    switch (kind) {
        case CoverKind::Half: return "half";
        case CoverKind::Full: return "full";
        case CoverKind::None:
        default: return "none";
    }
}

const char* toString(WeaponClass type) {
    switch (type) {
        case WeaponClass::Melee: return "melee";
        case WeaponClass::Tech: return "tech";
        case WeaponClass::Ranged:
        default: return "ranged";
    }
}

}  // namespace Neon::Combat
