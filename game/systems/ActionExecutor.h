// Executes one effect's action against its resolved targets.
#pragma once

#include <vector>

#include "../../engine/effects/EffectTypes.h"
#include "EngineContext.h"

namespace Arena::Game {

// Mutates rosters/shop through ctx, records each target hit in ctx.log and returns the
// secondary events the action raised (Hurt, Summoned, Levelup). Faint detection is left to the engine.
std::vector<Effects::Event> executeAction(EngineContext& ctx, const Effects::Event& cause,
                                          const Effects::PetRef& owner, const Effects::Effect& effect);

}  // namespace Arena::Game
