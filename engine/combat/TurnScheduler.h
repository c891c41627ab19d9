// Initiative ordering and the turn cursor for one encounter.
#pragma once

#include <cstddef>
#include <functional>
#include <random>
#include <vector>

#include "CombatActor.h"

namespace Neon::Combat {

struct InitiativeRoll {
    ActorId id{kInvalidActor};
    int initiative{0};
};

class TurnScheduler {
public:
    using RoundHook = std::function<void(int round)>;

    // Rolls once per actor in arena order and sorts descending. Ties keep arena order.
    // Returns false (and leaves the order empty) when no actor is alive.
    bool build(const std::vector<CombatActor>& actors, std::mt19937& rng);

    // Moves the cursor to the next living actor, wrapping as often as needed.
    // Every wrap bumps the round and calls `onNewRound` before the next actor is selected.
    // Returns kInvalidActor if nobody in the order is alive.
    ActorId advance(const std::vector<CombatActor>& actors, const RoundHook& onNewRound = {});

    const std::vector<ActorId>& order() const { return order_; }
    const std::vector<InitiativeRoll>& rolls() const { return rolls_; }
    std::size_t cursor() const { return cursor_; }
    ActorId current() const { return order_.empty() ? kInvalidActor : order_[cursor_]; }
    int round() const { return round_; }

private:
    std::vector<InitiativeRoll> rolls_;
    std::vector<ActorId> order_;
    std::size_t cursor_{0};
    int round_{1};
};

}  // namespace Neon::Combat
