#include "EscapeNegotiator.h"

#include <algorithm>

namespace Neon::Combat {

EscapeAssessment EscapeNegotiator::assess(int round,
                                          const std::vector<CombatActor>& actors,
                                          const std::vector<ActorId>& playerIds,
                                          const std::vector<ActorId>& opponentIds) const {
    EscapeAssessment out{};
    out.round = round;
    if (round < rules_.escapeMinRound) return out;

    int livingPlayers = 0;
    float hpSum = 0.0f;
    for (ActorId id : playerIds) {
        const auto& a = actors[id];
        if (!a.alive()) continue;
        ++livingPlayers;
        hpSum += a.hpPercentage();
    }
    // A wiped player team is a defeat, not an escape window.
    if (livingPlayers == 0) return out;

    int livingOpponents = 0;
    for (ActorId id : opponentIds) {
        if (actors[id].alive()) ++livingOpponents;
    }

    out.evaluated = true;
    out.averageHpPercent = hpSum / static_cast<float>(livingPlayers);
    out.lowHp = out.averageHpPercent < rules_.escapeLowHpPercent;
    out.casualties = livingPlayers < static_cast<int>(playerIds.size());
    out.outnumbered = livingOpponents >= livingPlayers * rules_.escapeOutnumberRatio;
    return out;
}

int EscapeNegotiator::successChance(const CombatActor& leader, bool withSacrifice) const {
    if (withSacrifice) return rules_.escapeSacrificeChance;
    const int chance = rules_.escapeBaseChance + leader.attributes().reflexes * rules_.escapePerReflex;
    return std::clamp(chance, rules_.escapeChanceMin, rules_.escapeChanceMax);
}

EscapeResolution EscapeNegotiator::resolve(std::vector<CombatActor>& actors,
                                           const std::vector<ActorId>& playerIds,
                                           ActorId sacrifice,
                                           int roll) const {
    EscapeResolution out{};
    if (playerIds.empty()) return out;

    CombatActor& leader = actors[playerIds.front()];
    out.sacrificed = sacrifice != kInvalidActor;
    out.chance = successChance(leader, out.sacrificed);
    out.roll = roll;
    out.success = roll <= out.chance;

    if (out.sacrificed) {
        actors[sacrifice].markDefeated();
    }

    if (out.success) {
        for (ActorId id : playerIds) {
            auto& a = actors[id];
            if (a.alive()) a.adjustMorale(-rules_.escapeMoralePenalty);
        }
    } else if (!out.sacrificed) {
        out.penaltyDamage = static_cast<int>(static_cast<float>(leader.maxHp()) * rules_.escapeFailureDamageFraction);
        out.penaltyDamage = leader.applyDamage(out.penaltyDamage, rules_);
    }
    return out;
}

int EscapeNegotiator::rollPercent(std::mt19937& rng) {
    std::uniform_int_distribution<int> d100(1, 100);
    return d100(rng);
}

}  // namespace Neon::Combat
