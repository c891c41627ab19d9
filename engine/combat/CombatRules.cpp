#include "CombatRules.h"

namespace Neon::Combat {

namespace {

bool inPercent(int v) { return v >= 0 && v <= 100; }

bool inUnit(float v) { return v >= 0.0f && v <= 1.0f; }

}  // namespace

bool rulesAreValid(const CombatRules& r, std::string* reason) {
    auto fail = [reason](const char* what) {
        if (reason) *reason = what;
        return false;
    };

    if (r.gridWidth <= 0 || r.gridHeight <= 0) return fail("grid size must be positive");

    if (r.maxActionPoints < 0) return fail("actionPoints.max must be >= 0");
    if (r.apMove < 0 || r.apAttack < 0 || r.apTakeCover < 0 || r.apLeaveCover < 0) {
        return fail("action costs must be >= 0");
    }
    if (r.baseMovementRange < 0) return fail("baseMovementRange must be >= 0");

    if (r.dodgeCap < 0 || r.dodgePerReflex < 0 || r.critPerCool < 0) return fail("dodge/crit factors must be >= 0");
    if (r.coverHalfHitPenalty < 0 || r.coverFullHitPenalty < 0) return fail("cover hit penalties must be >= 0");
    if (!inPercent(r.hitChanceMin) || !inPercent(r.hitChanceMax)) return fail("hit chance bounds must be in [0, 100]");
    if (r.hitChanceMin > r.hitChanceMax) return fail("hit.min must not exceed hit.max");

    if (r.damageVarianceMin <= 0.0f || r.damageVarianceMin > r.damageVarianceMax) {
        return fail("damage variance must satisfy 0 < varianceMin <= varianceMax");
    }
    if (r.meleeBonusPerBody < 0 || r.rangedBonusPerReflex < 0) return fail("stat damage bonuses must be >= 0");
    if (r.armorReductionMultiplier < 0.0f) return fail("armorReductionMultiplier must be >= 0");
    if (!inUnit(r.coverHalfDamageMultiplier) || !inUnit(r.coverFullDamageMultiplier)) {
        return fail("cover damage multipliers must be in [0, 1]");
    }
    if (r.minDamagePerHit < 1) return fail("damage.minPerHit must be >= 1");

    if (!inUnit(r.heavyHitFraction) || !inUnit(r.solidHitFraction)) return fail("morale hit fractions must be in [0, 1]");
    if (r.heavyHitMoraleLoss < 0 || r.solidHitMoraleLoss < 0) return fail("morale losses must be >= 0");

    if (r.escapeMinRound < 1) return fail("escape.minRound must be >= 1");
    if (r.escapeLowHpPercent < 0.0f || r.escapeLowHpPercent > 100.0f) return fail("escape.lowHpPercent must be in [0, 100]");
    if (r.escapeOutnumberRatio < 1) return fail("escape.outnumberRatio must be >= 1");
    if (r.escapePerReflex < 0) return fail("escape.perReflex must be >= 0");
    if (!inPercent(r.escapeChanceMin) || !inPercent(r.escapeChanceMax) || !inPercent(r.escapeSacrificeChance)) {
        return fail("escape chances must be in [0, 100]");
    }
    if (r.escapeChanceMin > r.escapeChanceMax) return fail("escape.chanceMin must not exceed escape.chanceMax");
    if (r.escapeMoralePenalty < 0) return fail("escape.moralePenalty must be >= 0");
    if (!inUnit(r.escapeFailureDamageFraction)) return fail("escape.failureDamageFraction must be in [0, 1]");
    return true;
}

}  // namespace Neon::Combat
