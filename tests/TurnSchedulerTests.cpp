// Initiative ordering, dead-actor skipping and round wrap behaviour.
#include <cassert>
#include <random>
#include <string>
#include <vector>

#include "../engine/combat/TurnScheduler.h"

using namespace Neon::Combat;

namespace {

std::vector<CombatActor> roster(const std::vector<int>& reflexes) {
    std::vector<CombatActor> out;
    for (std::size_t i = 0; i < reflexes.size(); ++i) {
        ActorDefinition def{};
        def.name = "Actor" + std::to_string(i);
        def.team = i % 2 == 0 ? Team::Player : Team::Opponent;
        def.position = {static_cast<int>(i), 0};
        def.attributes.reflexes = reflexes[i];
        out.emplace_back(def);
    }
    return out;
}

}  // namespace

int main() {
    // Same seed, same order.
    {
        const auto actors = roster({3, 7, 5, 5, 9});
        std::mt19937 a(99);
        std::mt19937 b(99);
        TurnScheduler s1;
        TurnScheduler s2;
        assert(s1.build(actors, a));
        assert(s2.build(actors, b));
        assert(s1.order() == s2.order());
        assert(s1.order().size() == actors.size());
        for (std::size_t i = 0; i < s1.rolls().size(); ++i) {
            assert(s1.rolls()[i].initiative == s2.rolls()[i].initiative);
        }
        assert(s1.round() == 1);
        assert(s1.current() == s1.order().front());
    }

    // Sorted descending; equal initiative keeps arena order.
    {
        const auto actors = roster({4, 4, 4, 4, 4, 4});
        bool sawTie = false;
        for (unsigned seed = 1; seed <= 200; ++seed) {
            std::mt19937 rng(seed);
            TurnScheduler s;
            assert(s.build(actors, rng));
            const auto& rolls = s.rolls();
            for (std::size_t i = 1; i < rolls.size(); ++i) {
                assert(rolls[i - 1].initiative >= rolls[i].initiative);
                if (rolls[i - 1].initiative == rolls[i].initiative) {
                    sawTie = true;
                    assert(rolls[i - 1].id < rolls[i].id);
                }
            }
        }
        assert(sawTie);
    }

    // Dead actors are never rolled and never selected.
    {
        auto actors = roster({5, 5, 5, 5});
        actors[2].markDefeated();
        std::mt19937 rng(3);
        TurnScheduler s;
        assert(s.build(actors, rng));
        assert(s.order().size() == 3);
        for (ActorId id : s.order()) assert(id != 2);

        const ActorId skipped = s.order()[1];
        actors[skipped].markDefeated();
        const ActorId next = s.advance(actors);
        assert(next == s.order()[2]);
        assert(actors[next].alive());
        assert(s.round() == 1);
    }

    // Wrapping bumps the round and runs the hook before selection.
    {
        const auto actors = roster({5, 6, 7});
        std::mt19937 rng(8);
        TurnScheduler s;
        assert(s.build(actors, rng));
        std::vector<int> hooked;
        auto hook = [&hooked](int round) { hooked.push_back(round); };
        assert(s.advance(actors, hook) == s.order()[1]);
        assert(s.advance(actors, hook) == s.order()[2]);
        assert(hooked.empty());
        assert(s.advance(actors, hook) == s.order()[0]);
        assert(s.round() == 2);
        assert(hooked.size() == 1 && hooked[0] == 2);
    }

    // Last actor standing keeps getting turns, one round each.
    {
        auto actors = roster({5, 6, 7});
        std::mt19937 rng(21);
        TurnScheduler s;
        assert(s.build(actors, rng));
        const ActorId survivor = s.order()[0];
        for (ActorId id : s.order()) {
            if (id != survivor) actors[id].markDefeated();
        }
        assert(s.advance(actors) == survivor);
        assert(s.round() == 2);
        assert(s.advance(actors) == survivor);
        assert(s.round() == 3);

        actors[survivor].markDefeated();
        assert(s.advance(actors) == kInvalidActor);
    }

    // Nobody alive: no order.
    {
        auto actors = roster({5, 5});
        for (auto& a : actors) a.markDefeated();
        std::mt19937 rng(1);
        TurnScheduler s;
        assert(!s.build(actors, rng));
        assert(s.order().empty());
        assert(s.current() == kInvalidActor);
    }

    return 0;
}
