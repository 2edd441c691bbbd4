#include "Pet.h"

#include <algorithm>

namespace Arena::Game {

int experienceForLevel(int level) {
    if (level <= 1) return 0;
    const int prev = level - 1;
    return prev * (prev - 1) + (prev + 1);
}

int Pet::addExperience(int amount, const EconomyRules& rules) {
    int gained = 0;
    for (int i = 0; i < amount && level < rules.maxLevel; ++i) {
        ++experience;
        stats.add(rules.mergeStatBonus, rules.mergeStatBonus);
        if (experience >= experienceForLevel(level + 1)) {
            ++level;
            ++gained;
        }
    }
    if (gained > 0) {
        refreshEffects();
    }
    return gained;
}

void Pet::refreshEffects() { effects = definition->effectsAt(level); }

const Gameplay::DamageModifier* heldModifier(const Pet& pet) {
    if (!pet.item || !pet.item->effect) return nullptr;
    return Effects::damageModifier(*pet.item->effect);
}

void spendItemUse(Pet& pet) {
    if (!pet.item || !pet.item->effect) return;
    auto& uses = pet.item->effect->uses;
    if (uses && *uses > 0) --*uses;
}

Result<Pet> makePet(const EntityProvider& provider, const std::string& name, int level, const GameConfig& config) {
    auto def = provider.findPet(name);
    if (!def) {
        return Result<Pet>::failure(ErrorCode::UnknownEntity);
    }
    Pet pet{};
    pet.definition = def;
    pet.level = std::clamp(level, 1, std::max(1, config.economy.maxLevel));
    pet.experience = experienceForLevel(pet.level);
    pet.stats = Gameplay::StatValue(def->attack, def->health, config.statLimits);
    pet.refreshEffects();
    return Result<Pet>::success(std::move(pet));
}

Result<Item> makeFood(const EntityProvider& provider, const std::string& name) {
    auto def = provider.findFood(name);
    if (!def) {
        return Result<Item>::failure(ErrorCode::UnknownEntity);
    }
    Item item{};
    item.definition = def;
    item.effect = def->effect;
    item.holdable = def->holdable;
    item.singleUse = def->singleUse;
    return Result<Item>::success(std::move(item));
}

}  // namespace Arena::Game
