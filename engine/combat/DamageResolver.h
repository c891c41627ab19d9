// Stateless attack resolver: hit chance, hit roll, damage with crit/morale/armor/cover.
#pragma once

#include <random>
#include <string>

#include "CombatActor.h"
#include "CombatRules.h"

namespace Neon::Combat {

struct DamageBreakdown {
    float variance{1.0f};
    float baseDamage{0.0f};
    float statBonus{0.0f};
    bool crit{false};
    float critMultiplier{1.0f};
    float moraleModifier{1.0f};
    float armorReduction{0.0f};
    float coverMultiplier{1.0f};
    float total{0.0f};  // before rounding and floor
    int damage{0};      // final, >= rules.minDamagePerHit
};

struct AttackOutcome {
    int hitChance{0};
    int hitRoll{0};
    bool hit{false};
    DamageBreakdown damage{};
    std::string debug;
};

// weapon.accuracy - dodge - cover penalty, clamped to [hitChanceMin, hitChanceMax].
int computeHitChance(const CombatActor& attacker, const CombatActor& defender, const CombatRules& rules);

// Deterministic core of the damage formula; `variance` and `crit` are the already-rolled inputs.
DamageBreakdown computeDamage(const CombatActor& attacker,
                              const CombatActor& defender,
                              float variance,
                              bool crit,
                              const CombatRules& rules);

// Rolls variance and crit, then applies computeDamage.
DamageBreakdown rollDamage(const CombatActor& attacker,
                           const CombatActor& defender,
                           std::mt19937& rng,
                           const CombatRules& rules);

// Full attack: hit roll (1..100 <= hit chance) then damage on a hit. Caller owns state mutation.
AttackOutcome ResolveAttack(const CombatActor& attacker,
                            const CombatActor& defender,
                            std::mt19937& rng,
                            const CombatRules& rules);

}  // namespace Neon::Combat
