// Lookup interface for pet/food definitions plus the in-memory catalog.
#pragma once

#include <map>
#include <string>
#include <vector>

#include "EntityDefinition.h"

namespace Arena::Game {

class EntityProvider {
public:
    virtual ~EntityProvider() = default;

    // nullptr when the name is unknown.
    virtual PetDefinitionPtr findPet(const std::string& name) const = 0;
    virtual FoodDefinitionPtr findFood(const std::string& name) const = 0;

    // Shop pools, ordered by tier then name.
    virtual std::vector<std::string> petNames(int maxTier, const std::string& pack) const = 0;
    virtual std::vector<std::string> foodNames(int maxTier, const std::string& pack) const = 0;
    // Pets of exactly this tier; used for level-up bonus pets.
    virtual std::vector<std::string> petNamesAtTier(int tier, const std::string& pack) const = 0;
};

class Catalog : public EntityProvider {
public:
    void addPet(PetDefinition def);
    void addFood(FoodDefinition def);

    PetDefinitionPtr findPet(const std::string& name) const override;
    FoodDefinitionPtr findFood(const std::string& name) const override;
    std::vector<std::string> petNames(int maxTier, const std::string& pack) const override;
    std::vector<std::string> foodNames(int maxTier, const std::string& pack) const override;
    std::vector<std::string> petNamesAtTier(int tier, const std::string& pack) const override;

    std::size_t petCount() const { return pets_.size(); }
    std::size_t foodCount() const { return foods_.size(); }

private:
    std::map<std::string, PetDefinitionPtr> pets_;
    std::map<std::string, FoodDefinitionPtr> foods_;
};

// Built-in Turtle pack subset used when no content file is supplied.
Catalog defaultCatalog();

}  // namespace Arena::Game
