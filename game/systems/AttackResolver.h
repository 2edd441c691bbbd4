// Simultaneous exchange between the two front pets.
#pragma once

#include <array>
#include <optional>

#include "EngineContext.h"
#include "EventEngine.h"

namespace Arena::Game {

// Applies both hits from a pre-attack snapshot, then queues Attack, Hurt, Faint and KnockOut
// events on the engine. Returns the two attackers (side A, side B), empty if either side had none.
std::array<std::optional<Effects::PetRef>, 2> resolveAttack(EngineContext& ctx, EventEngine& engine);

}  // namespace Arena::Game
