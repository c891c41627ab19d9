// Very simple opponent AI: shoot the closest target in range, else step toward the closest player.
#pragma once

#include <functional>
#include <vector>

#include "CombatActor.h"
#include "CombatRules.h"

namespace Neon::Combat {

enum class AiAction { Attack, Move, Idle };

struct AiDecision {
    AiAction action{AiAction::Idle};
    ActorId target{kInvalidActor};
    GridPos destination{};
};

class OpponentController {
public:
    // True when the tile is inside the grid and no other living actor stands on it.
    using TilePredicate = std::function<bool(const GridPos&)>;

    explicit OpponentController(CombatRules rules = {}) : rules_(rules) {}

    // `targets` are the actors `self` may legally attack right now (alive, hostile, in range).
    // `players` are all player-team ids, living or not.
    AiDecision decide(ActorId self,
                      const std::vector<CombatActor>& actors,
                      const std::vector<ActorId>& targets,
                      const std::vector<ActorId>& players,
                      const TilePredicate& canEnter) const;

    // Closest living candidate by grid distance; ties go to the earlier roster entry.
    static ActorId closest(const CombatActor& from,
                           const std::vector<CombatActor>& actors,
                           const std::vector<ActorId>& candidates);

private:
    CombatRules rules_;
};

}  // namespace Neon::Combat
