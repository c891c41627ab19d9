#include "AutoPilot.h"

#include <limits>

namespace Neon::Skirmish {

using namespace Neon::Combat;

bool AutoPilot::step(CombatEncounter& encounter) {
    if (!encounter.combatActive() || !encounter.isPlayerTurn()) return false;
    if (tryEscape(encounter)) return true;
    if (tryAttack(encounter)) return true;
    if (tryAdvance(encounter)) return true;
    (void)encounter.submit(ActionRequest::endTurn());  // end turn is always accepted on a player turn
    return true;
}

int AutoPilot::playTurn(CombatEncounter& encounter) {
    const ActorId actor = encounter.currentActorId();
    const int cap = encounter.rules().maxActionPoints + 4;
    int steps = 0;
    while (encounter.combatActive() && encounter.isPlayerTurn() && encounter.currentActorId() == actor) {
        if (steps >= cap) {
            (void)encounter.submit(ActionRequest::endTurn());
            break;
        }
        if (!step(encounter)) break;
        ++steps;
    }
    return steps;
}

bool AutoPilot::tryEscape(CombatEncounter& encounter) {
    if (!encounter.escapeAvailable() || encounter.escapeAttemptedThisRound()) return false;
    const auto& players = encounter.playerIds();
    const auto& leader = encounter.actor(players.front());
    if (!leader.alive() || leader.hpPercentage() >= cfg_.retreatHpPercent) return false;

    ActorId sacrifice = kInvalidActor;
    if (cfg_.allowSacrifice) {
        // Leave behind the most wounded non-leader who is still standing.
        float lowest = std::numeric_limits<float>::max();
        for (std::size_t i = 1; i < players.size(); ++i) {
            const auto& a = encounter.actor(players[i]);
            if (a.alive() && a.hpPercentage() < lowest) {
                lowest = a.hpPercentage();
                sacrifice = players[i];
            }
        }
    }
    const EscapeResult result = encounter.attemptEscape(sacrifice);
    return result.status == ActionResult::Ok;
}

bool AutoPilot::tryAttack(CombatEncounter& encounter) {
    const ActorId self = encounter.currentActorId();
    const auto& me = encounter.actor(self);
    if (!me.canAfford(encounter.rules().apAttack)) return false;
    const auto targets = encounter.getValidTargets(self);
    const ActorId target = OpponentController::closest(me, encounter.actors(), targets);
    if (target == kInvalidActor) return false;
    return encounter.submit(ActionRequest::attack(target)) == ActionResult::Ok;
}

bool AutoPilot::tryAdvance(CombatEncounter& encounter) {
    const ActorId self = encounter.currentActorId();
    const auto& me = encounter.actor(self);
    if (!me.canAfford(encounter.rules().apMove)) return false;
    const ActorId chase = OpponentController::closest(me, encounter.actors(), encounter.opponentIds());
    if (chase == kInvalidActor) return false;

    // Already in weapon range: holding still beats wandering off.
    const GridPos goal = encounter.actor(chase).position();
    int bestDist = gridDistance(me.position(), goal);
    if (bestDist <= me.weapon().range) return false;

    bool found = false;
    GridPos best{};
    for (const auto& dest : encounter.getValidMoves(self)) {
        const int d = gridDistance(dest, goal);
        if (d < bestDist) {
            bestDist = d;
            best = dest;
            found = true;
        }
    }
    if (!found) return false;
    const GridPos delta = best - me.position();
    return encounter.submit(ActionRequest::move(delta.x, delta.y)) == ActionResult::Ok;
}

}  // namespace Neon::Skirmish
