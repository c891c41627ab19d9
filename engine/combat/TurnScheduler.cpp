#include "TurnScheduler.h"

#include <algorithm>

namespace Neon::Combat {

bool TurnScheduler::build(const std::vector<CombatActor>& actors, std::mt19937& rng) {
    rolls_.clear();
    order_.clear();
    cursor_ = 0;
    round_ = 1;

    for (std::size_t i = 0; i < actors.size(); ++i) {
        if (!actors[i].alive()) continue;
        rolls_.push_back({static_cast<ActorId>(i), actors[i].rollInitiative(rng)});
    }
    std::stable_sort(rolls_.begin(), rolls_.end(), [](const InitiativeRoll& a, const InitiativeRoll& b) {
        return a.initiative > b.initiative;
    });
    order_.reserve(rolls_.size());
    for (const auto& r : rolls_) order_.push_back(r.id);
    return !order_.empty();
}

ActorId TurnScheduler::advance(const std::vector<CombatActor>& actors, const RoundHook& onNewRound) {
    if (order_.empty()) return kInvalidActor;

    // Bounded scan: one full lap plus the step off the current slot.
    for (std::size_t steps = 0; steps <= order_.size(); ++steps) {
        ++cursor_;
        if (cursor_ >= order_.size()) {
            cursor_ = 0;
            ++round_;
            if (onNewRound) onNewRound(round_);
        }
        const ActorId id = order_[cursor_];
        if (id < actors.size() && actors[id].alive()) {
            return id;
        }
    }
    return kInvalidActor;
}

}  // namespace Neon::Combat
