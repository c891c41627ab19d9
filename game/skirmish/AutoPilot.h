// Scripted stand-in for the player: drives player-team turns through the public action API.
#pragma once

#include "../../engine/combat/CombatEncounter.h"

namespace Neon::Skirmish {

struct AutoPilotConfig {
    float retreatHpPercent{25.0f};  // leader HP below this triggers an escape attempt
    bool allowSacrifice{true};
};

class AutoPilot {
public:
    explicit AutoPilot(AutoPilotConfig cfg = {}) : cfg_(cfg) {}

    // Performs one action for the active player actor. Returns false if it is not a player turn.
    bool step(Combat::CombatEncounter& encounter);

    // Steps until the turn passes to an opponent or combat ends.
    int playTurn(Combat::CombatEncounter& encounter);

private:
    bool tryEscape(Combat::CombatEncounter& encounter);
    bool tryAttack(Combat::CombatEncounter& encounter);
    bool tryAdvance(Combat::CombatEncounter& encounter);

    AutoPilotConfig cfg_;
};

}  // namespace Neon::Skirmish
