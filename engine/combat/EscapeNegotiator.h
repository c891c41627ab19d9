// Round-gated escape availability and escape attempt resolution.
#pragma once

#include <random>
#include <vector>

#include "CombatActor.h"
#include "CombatRules.h"

namespace Neon::Combat {

// Result of the condition phase. Produced at a round boundary, committed before anyone reads it.
struct EscapeAssessment {
    int round{0};
    bool evaluated{false};  // false before escapeMinRound
    bool lowHp{false};
    bool casualties{false};
    bool outnumbered{false};
    float averageHpPercent{0.0f};

    bool available() const { return evaluated && (lowHp || casualties || outnumbered); }
};

struct EscapeResolution {
    bool success{false};
    bool sacrificed{false};
    int chance{0};
    int roll{0};
    int penaltyDamage{0};  // applied to the leader on a failed solo attempt
};

class EscapeNegotiator {
public:
    explicit EscapeNegotiator(CombatRules rules = {}) : rules_(rules) {}

    EscapeAssessment assess(int round,
                            const std::vector<CombatActor>& actors,
                            const std::vector<ActorId>& playerIds,
                            const std::vector<ActorId>& opponentIds) const;

    // Sacrifice: fixed chance. Solo: base + leader.reflexes * factor, clamped.
    int successChance(const CombatActor& leader, bool withSacrifice) const;

    // Applies all side effects for a roll in [1, 100]. `sacrifice` is kInvalidActor for a solo attempt.
    // The sacrifice (if any) is removed from play whatever the roll.
    EscapeResolution resolve(std::vector<CombatActor>& actors,
                             const std::vector<ActorId>& playerIds,
                             ActorId sacrifice,
                             int roll) const;

    static int rollPercent(std::mt19937& rng);

    const CombatRules& rules() const { return rules_; }

private:
    CombatRules rules_;
};

}  // namespace Neon::Combat
