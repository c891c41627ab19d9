// Implementation of the attack resolver.
#include "DamageResolver.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace Neon::Combat {

namespace {

int coverHitPenalty(CoverKind kind, const CombatRules& rules) {
    switch (kind) {
        case CoverKind::Half: return rules.coverHalfHitPenalty;
        case CoverKind::Full: return rules.coverFullHitPenalty;
        case CoverKind::None:
        default: return 0;
    }
}

float coverDamageMultiplier(CoverKind kind, const CombatRules& rules) {
    switch (kind) {
        case CoverKind::Half: return rules.coverHalfDamageMultiplier;
        case CoverKind::Full: return rules.coverFullDamageMultiplier;
        case CoverKind::None:
        default: return 1.0f;
    }
}

int rollPercent(std::mt19937& rng) {
    std::uniform_int_distribution<int> d100(1, 100);
    return d100(rng);
}

}  // namespace

int computeHitChance(const CombatActor& attacker, const CombatActor& defender, const CombatRules& rules) {
    int hit = attacker.weapon().accuracy - defender.dodgeChance(rules);
    if (defender.inCover()) {
        hit -= coverHitPenalty(defender.cover(), rules);
    }
    return std::clamp(hit, rules.hitChanceMin, rules.hitChanceMax);
}

DamageBreakdown computeDamage(const CombatActor& attacker,
                              const CombatActor& defender,
                              float variance,
                              bool crit,
                              const CombatRules& rules) {
    const Weapon& weapon = attacker.weapon();
    const Attributes& attr = attacker.attributes();
    DamageBreakdown out{};
    out.variance = variance;
    out.baseDamage = static_cast<float>(weapon.damage) * variance;
    out.statBonus = (weapon.type == WeaponClass::Melee)
                        ? static_cast<float>(attr.body * rules.meleeBonusPerBody)
                        : static_cast<float>(attr.reflexes * rules.rangedBonusPerReflex);
    out.crit = crit;
    out.critMultiplier = crit ? weapon.critMultiplier : 1.0f;
    out.moraleModifier = attacker.moraleModifier();

    float total = (out.baseDamage + out.statBonus) * out.critMultiplier * out.moraleModifier;

    const float effectiveArmor = static_cast<float>(defender.armor()) * (1.0f - weapon.armorPen);
    out.armorReduction = effectiveArmor * rules.armorReductionMultiplier;
    total -= out.armorReduction;

    // Tech attacks ignore cover mitigation.
    if (defender.inCover() && weapon.type != WeaponClass::Tech) {
        out.coverMultiplier = coverDamageMultiplier(defender.cover(), rules);
        total *= out.coverMultiplier;
    }

    out.total = total;
    out.damage = std::max(rules.minDamagePerHit, static_cast<int>(std::lround(total)));
    return out;
}

DamageBreakdown rollDamage(const CombatActor& attacker,
                           const CombatActor& defender,
                           std::mt19937& rng,
                           const CombatRules& rules) {
    std::uniform_real_distribution<float> band(rules.damageVarianceMin, rules.damageVarianceMax);
    const float variance = band(rng);
    const bool crit = rollPercent(rng) <= attacker.critChance(rules);
    return computeDamage(attacker, defender, variance, crit, rules);
}

AttackOutcome ResolveAttack(const CombatActor& attacker,
                            const CombatActor& defender,
                            std::mt19937& rng,
                            const CombatRules& rules) {
    AttackOutcome out{};
    out.hitChance = computeHitChance(attacker, defender, rules);
    out.hitRoll = rollPercent(rng);
    out.hit = out.hitRoll <= out.hitChance;

    std::ostringstream dbg;
    dbg.setf(std::ios::fixed);
    dbg.precision(2);
    if (!out.hit) {
        dbg << "MISS (roll=" << out.hitRoll << " > hit=" << out.hitChance << ")";
        out.debug = dbg.str();
        return out;
    }

    out.damage = rollDamage(attacker, defender, rng, rules);
    dbg << "hit=" << out.hitChance << " roll=" << out.hitRoll << " var=" << out.damage.variance
        << " crit=" << (out.damage.crit ? 1 : 0) << " morale=" << out.damage.moraleModifier
        << " armor=" << out.damage.armorReduction << " cover=" << out.damage.coverMultiplier
        << " dmg=" << out.damage.damage;
    out.debug = dbg.str();
    return out;
}

}  // namespace Neon::Combat
