// Live pet and held-item instances built from definitions.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../../engine/core/Error.h"
#include "../../engine/effects/EffectTypes.h"
#include "../../engine/gameplay/StatValue.h"
#include "../config/GameConfig.h"
#include "../content/EntityProvider.h"

namespace Arena::Game {

struct Item {
    FoodDefinitionPtr definition;
    std::optional<Effects::Effect> effect;
    bool holdable{false};
    bool singleUse{false};

    const std::string& name() const { return definition->name; }
    // Single-use items whose effect has been spent are removed at cleanup.
    bool consumed() const { return singleUse && effect && effect->exhausted(); }
};

struct Pet {
    PetDefinitionPtr definition;
    int level{1};
    int experience{0};
    Gameplay::StatValue stats{};
    std::optional<Item> item;
    std::vector<Effects::Effect> effects;
    Effects::PetId id{Effects::kInvalidPet};
    int position{-1};

    const std::string& name() const { return definition->name; }
    int tier() const { return definition->tier; }
    bool alive() const { return !stats.fainted(); }

    // Each point adds the merge bonus to both stats; returns the number of levels gained.
    int addExperience(int amount, const EconomyRules& rules);
    // Reload effects for the current level from the definition.
    void refreshEffects();
};

// Damage modifier of the held item, if it still has uses left.
const Gameplay::DamageModifier* heldModifier(const Pet& pet);
void spendItemUse(Pet& pet);

// Total experience a pet holds on reaching the given level (2 -> 2, 3 -> 5).
int experienceForLevel(int level);

Result<Pet> makePet(const EntityProvider& provider, const std::string& name, int level, const GameConfig& config);
Result<Item> makeFood(const EntityProvider& provider, const std::string& name);

}  // namespace Arena::Game
