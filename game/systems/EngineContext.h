// Everything an effect may read or mutate while one event cascade runs.
#pragma once

#include <array>
#include <set>
#include <utility>

#include "../../engine/effects/Event.h"
#include "../config/GameConfig.h"
#include "../content/EntityProvider.h"
#include "../shop/Shop.h"
#include "../team/Roster.h"

namespace Arena::Game {

// (side index, pet id) of every pet that already fainted in this battle or session.
using FaintLedger = std::set<std::pair<int, Effects::PetId>>;

struct EngineContext {
    std::array<Roster*, 2> rosters{nullptr, nullptr};
    Shop* shop{nullptr};
    const EntityProvider* provider{nullptr};
    const GameConfig* config{nullptr};
    Effects::EventLog* log{nullptr};
    int turn{0};
    Effects::Phase phase{Effects::Phase::Shop};

    Roster* roster(Effects::Side side) const { return rosters[static_cast<std::size_t>(Effects::sideIndex(side))]; }

    // Live lookup by id; nullptr once the pet is gone from its roster entirely.
    Pet* find(const Effects::PetRef& ref) const {
        Roster* r = roster(ref.side);
        return r ? r->findById(ref.id) : nullptr;
    }

    Effects::PetRef refTo(Effects::Side side, const Pet& pet) const {
        return Effects::PetRef{side, pet.position, pet.id};
    }
};

}  // namespace Arena::Game
