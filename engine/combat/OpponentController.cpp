#include "OpponentController.h"

#include <limits>

namespace Neon::Combat {

ActorId OpponentController::closest(const CombatActor& from,
                                    const std::vector<CombatActor>& actors,
                                    const std::vector<ActorId>& candidates) {
    ActorId best = kInvalidActor;
    int bestDist = std::numeric_limits<int>::max();
    for (ActorId id : candidates) {
        const auto& c = actors[id];
        if (!c.alive()) continue;
        const int d = gridDistance(from.position(), c.position());
        // Strict compare keeps roster order on ties (candidates arrive in roster order).
        if (d < bestDist) {
            bestDist = d;
            best = id;
        }
    }
    return best;
}

AiDecision OpponentController::decide(ActorId self,
                                      const std::vector<CombatActor>& actors,
                                      const std::vector<ActorId>& targets,
                                      const std::vector<ActorId>& players,
                                      const TilePredicate& canEnter) const {
    AiDecision out{};
    const auto& me = actors[self];
    if (!me.alive()) return out;

    if (!targets.empty() && me.canAfford(rules_.apAttack)) {
        const ActorId target = closest(me, actors, targets);
        if (target != kInvalidActor) {
            out.action = AiAction::Attack;
            out.target = target;
            return out;
        }
    }

    if (!me.canAfford(rules_.apMove)) return out;
    const ActorId chase = closest(me, actors, players);
    if (chase == kInvalidActor) return out;

    const GridPos delta = actors[chase].position() - me.position();
    const GridPos dest = me.position() + GridPos{signOf(delta.x), signOf(delta.y)};
    if (dest == me.position()) return out;
    if (canEnter && !canEnter(dest)) return out;

    out.action = AiAction::Move;
    out.target = chase;
    out.destination = dest;
    return out;
}

}  // namespace Neon::Combat
