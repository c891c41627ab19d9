// Tunable constants for the tactical combat engine (data-driven, sane defaults).
#pragma once

#include <string>

namespace Neon::Combat {

struct CombatRules {
    // Grid
    int gridWidth{20};
    int gridHeight{15};

    // Action points
    int maxActionPoints{3};
    int apMove{1};
    int apAttack{2};
    int apTakeCover{1};
    int apLeaveCover{0};

    // Movement
    int baseMovementRange{4};  // tiles, + reflexes / 4

    // Hit resolution (percent)
    int dodgeCap{20};
    int dodgePerReflex{3};
    int critPerCool{2};
    int coverHalfHitPenalty{25};
    int coverFullHitPenalty{40};
    int hitChanceMin{5};
    int hitChanceMax{95};

    // Damage
    float damageVarianceMin{0.85f};
    float damageVarianceMax{1.15f};
    int meleeBonusPerBody{3};
    int rangedBonusPerReflex{2};
    float armorReductionMultiplier{1.0f};
    float coverHalfDamageMultiplier{0.75f};
    float coverFullDamageMultiplier{0.60f};
    int minDamagePerHit{1};

    // Morale loss when a single hit takes a large share of max HP.
    float heavyHitFraction{0.30f};
    int heavyHitMoraleLoss{20};
    float solidHitFraction{0.15f};
    int solidHitMoraleLoss{10};

    // Escape negotiation
    int escapeMinRound{3};
    float escapeLowHpPercent{50.0f};
    int escapeOutnumberRatio{2};
    int escapeBaseChance{45};
    int escapePerReflex{2};
    int escapeChanceMin{5};
    int escapeChanceMax{95};
    int escapeSacrificeChance{93};
    int escapeMoralePenalty{20};
    float escapeFailureDamageFraction{0.20f};
};

// False (with the first offending field in `reason`) when a rule set would break the combat math:
// inverted min/max pairs, negative costs, fractions outside [0, 1], percentages outside [0, 100].
bool rulesAreValid(const CombatRules& rules, std::string* reason = nullptr);

}  // namespace Neon::Combat
