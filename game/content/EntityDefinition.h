// Immutable pet and food templates handed out by an EntityProvider.
#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../engine/effects/EffectTypes.h"

namespace Arena::Game {

constexpr int kMaxPetLevel = 3;

struct PetDefinition {
    std::string name;
    int tier{1};
    std::string pack{"Turtle"};
    int cost{3};
    int attack{1};
    int health{1};
    bool token{false};  // summoned only, never offered by a shop
    std::array<std::vector<Effects::Effect>, kMaxPetLevel> effects;

    const std::vector<Effects::Effect>& effectsAt(int level) const;
};

struct FoodDefinition {
    std::string name;
    int tier{1};
    std::string pack{"Turtle"};
    int cost{3};
    bool holdable{false};
    bool singleUse{false};
    std::optional<Effects::Effect> effect;
};

using PetDefinitionPtr = std::shared_ptr<const PetDefinition>;
using FoodDefinitionPtr = std::shared_ptr<const FoodDefinition>;

}  // namespace Arena::Game
