// Shop operations on a roster's attached shop, with shop-phase triggers.
#pragma once

#include <cstddef>

#include "../../engine/core/Error.h"
#include "../../engine/effects/Event.h"
#include "../config/GameConfig.h"
#include "../content/EntityProvider.h"
#include "../systems/EventEngine.h"
#include "../team/Roster.h"

namespace Arena::Game {

// Every mutator validates fully before touching state: a failed call leaves roster and shop unchanged.
class TeamShopping {
public:
    TeamShopping(Roster& roster, const EntityProvider& provider, const GameConfig& config);

    ErrorCode open();
    ErrorCode close();
    ErrorCode roll();
    ErrorCode freeze(std::size_t slot);
    ErrorCode unfreeze(std::size_t slot);
    // Buys shop slot into roster position; a same-name pet there is merged into.
    ErrorCode buy(std::size_t slot, int destination);
    ErrorCode sell(int position);
    ErrorCode move(int from, int to);

    const Effects::EventLog& log() const { return log_; }

private:
    EngineContext context();
    Shop* openShop();
    ErrorCode finishOperation(EventEngine& engine);
    ErrorCode buyPet(Shop& shop, std::size_t slot, int destination);
    ErrorCode buyFood(Shop& shop, std::size_t slot, int destination);

    Roster& roster_;
    const EntityProvider& provider_;
    const GameConfig& config_;
    Effects::EventLog log_;
    FaintLedger fainted_;
};

// Merge rule: stats become the max of both, then the donor's experience plus one is added.
int mergePets(Pet& target, const Pet& donor, const EconomyRules& rules);

}  // namespace Arena::Game
