// Hit chance and damage formula checks, including the clamps and the cover/tech interplay.
#include <cassert>
#include <cmath>
#include <random>

#include "../engine/combat/DamageResolver.h"

using namespace Neon::Combat;

namespace {

CombatActor makeActor(int reflexes, int body, int morale, int armor, Weapon weapon, CoverKind cover = CoverKind::None) {
    ActorDefinition def{};
    def.name = "A";
    def.attributes.reflexes = reflexes;
    def.attributes.body = body;
    def.morale = morale;
    def.armor = armor;
    def.maxHp = 100;
    def.cover = cover;
    def.weapon = weapon;
    return CombatActor(def);
}

Weapon rifle(int damage, int accuracy, float armorPen, WeaponClass type = WeaponClass::Ranged) {
    Weapon w{};
    w.name = "Rifle";
    w.damage = damage;
    w.accuracy = accuracy;
    w.range = 10;
    w.armorPen = armorPen;
    w.critMultiplier = 2.0f;
    w.type = type;
    return w;
}

}  // namespace

int main() {
    const CombatRules rules{};

    // Perfect accuracy against an undodgeable, uncovered target caps at 95.
    {
        const auto att = makeActor(5, 5, 50, 0, rifle(20, 100, 0.0f));
        const auto def = makeActor(0, 5, 50, 0, rifle(20, 50, 0.0f));
        assert(computeHitChance(att, def, rules) == 95);
    }

    // Dodge and cover subtract; the result never drops below 5.
    {
        const auto att = makeActor(5, 5, 50, 0, rifle(20, 90, 0.0f));
        const auto half = makeActor(2, 5, 50, 0, rifle(20, 50, 0.0f), CoverKind::Half);
        assert(computeHitChance(att, half, rules) == 90 - 6 - 25);
        const auto full = makeActor(2, 5, 50, 0, rifle(20, 50, 0.0f), CoverKind::Full);
        assert(computeHitChance(att, full, rules) == 90 - 6 - 40);

        const auto weak = makeActor(5, 5, 50, 0, rifle(20, 10, 0.0f));
        const auto slippery = makeActor(10, 5, 50, 0, rifle(20, 50, 0.0f), CoverKind::Full);
        assert(computeHitChance(weak, slippery, rules) == 5);
    }

    // Any combination stays inside [5, 95].
    {
        for (int acc = -50; acc <= 200; acc += 25) {
            for (int ref = 0; ref <= 12; ref += 3) {
                for (CoverKind c : {CoverKind::None, CoverKind::Half, CoverKind::Full}) {
                    const auto att = makeActor(5, 5, 50, 0, rifle(20, acc, 0.0f));
                    const auto def = makeActor(ref, 5, 50, 0, rifle(20, 50, 0.0f), c);
                    const int hit = computeHitChance(att, def, rules);
                    assert(hit >= 5 && hit <= 95);
                }
            }
        }
    }

    // Heavy armor, no penetration: the floor of 1 wins even at top variance.
    {
        const auto att = makeActor(0, 0, 50, 0, rifle(10, 80, 0.0f));
        const auto tank = makeActor(0, 5, 50, 100, rifle(10, 50, 0.0f));
        const auto res = computeDamage(att, tank, 1.15f, false, rules);
        assert(res.total < 1.0f);
        assert(res.damage == 1);

        std::mt19937 rng(11);
        for (int i = 0; i < 500; ++i) {
            assert(rollDamage(att, tank, rng, rules).damage >= 1);
        }
    }

    // Ranged: (20 + 5*2) * 1.0 - 10 * (1 - 0.5) = 25.
    {
        const auto att = makeActor(5, 5, 50, 0, rifle(20, 80, 0.5f));
        const auto def = makeActor(3, 5, 50, 10, rifle(10, 50, 0.0f));
        const auto res = computeDamage(att, def, 1.0f, false, rules);
        assert(std::abs(res.statBonus - 10.0f) < 0.001f);
        assert(std::abs(res.armorReduction - 5.0f) < 0.001f);
        assert(res.damage == 25);

        const auto crit = computeDamage(att, def, 1.0f, true, rules);
        assert(crit.crit);
        assert(crit.damage == 55);

        // High morale scales before armor: 30 * 1.25 - 5 = 32.5, rounded half away from zero.
        const auto brave = makeActor(5, 5, 100, 0, rifle(20, 80, 0.5f));
        assert(computeDamage(brave, def, 1.0f, false, rules).damage == 33);
    }

    // Melee uses body instead of reflexes.
    {
        const auto att = makeActor(9, 4, 50, 0, rifle(10, 80, 0.0f, WeaponClass::Melee));
        const auto def = makeActor(3, 5, 50, 0, rifle(10, 50, 0.0f));
        assert(computeDamage(att, def, 1.0f, false, rules).damage == 22);
    }

    // Cover cuts damage for ranged and melee, not for tech.
    {
        const auto gun = makeActor(5, 5, 50, 0, rifle(20, 80, 0.5f));
        const auto zap = makeActor(5, 5, 50, 0, rifle(20, 80, 0.5f, WeaponClass::Tech));
        const auto half = makeActor(3, 5, 50, 10, rifle(10, 50, 0.0f), CoverKind::Half);
        const auto full = makeActor(3, 5, 50, 10, rifle(10, 50, 0.0f), CoverKind::Full);
        assert(computeDamage(gun, half, 1.0f, false, rules).damage == 19);
        assert(computeDamage(gun, full, 1.0f, false, rules).damage == 15);
        assert(computeDamage(zap, half, 1.0f, false, rules).damage == 25);
        assert(computeDamage(zap, full, 1.0f, false, rules).damage == 25);
        // Tech still has to get past the hit penalty.
        assert(computeHitChance(zap, full, rules) == 80 - 9 - 40);
    }

    // Full resolution: hit iff roll <= chance, and every hit deals at least 1.
    {
        const auto att = makeActor(5, 5, 50, 0, rifle(20, 60, 0.0f));
        const auto def = makeActor(4, 5, 50, 20, rifle(10, 50, 0.0f), CoverKind::Half);
        std::mt19937 rng(2024);
        int hits = 0;
        for (int i = 0; i < 1000; ++i) {
            const auto out = ResolveAttack(att, def, rng, rules);
            assert(out.hitChance == 60 - 12 - 25);
            assert(out.hitRoll >= 1 && out.hitRoll <= 100);
            assert(out.hit == (out.hitRoll <= out.hitChance));
            assert(!out.debug.empty());
            if (out.hit) {
                ++hits;
                assert(out.damage.damage >= 1);
                assert(out.damage.variance >= 0.85f && out.damage.variance <= 1.15f);
            } else {
                assert(out.damage.damage == 0);
            }
        }
        assert(hits > 150 && hits < 320);
    }

    return 0;
}
