// Maps a target selector onto concrete pets for one effect execution.
#pragma once

#include <vector>

#include "../../engine/effects/EffectTypes.h"
#include "EngineContext.h"

namespace Arena::Game {

// Living targets in selector order; random picks draw from the owner's roster stream.
std::vector<Effects::PetRef> resolveTargets(const EngineContext& ctx, const Effects::Event& cause,
                                            const Effects::PetRef& owner, const Effects::TargetSelector& selector);

// Current slot of the owner, or its slot at event time when it has left the roster.
int ownerPosition(const EngineContext& ctx, const Effects::PetRef& owner);

}  // namespace Arena::Game
