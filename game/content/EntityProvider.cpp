#include "EntityProvider.h"

#include <algorithm>
#include <functional>
#include <utility>

namespace Arena::Game {

using namespace Arena::Effects;

const std::vector<Effect>& PetDefinition::effectsAt(int level) const {
    const int idx = std::clamp(level, 1, kMaxPetLevel) - 1;
    return effects[static_cast<std::size_t>(idx)];
}

void Catalog::addPet(PetDefinition def) {
    auto name = def.name;
    pets_[name] = std::make_shared<const PetDefinition>(std::move(def));
}

void Catalog::addFood(FoodDefinition def) {
    auto name = def.name;
    foods_[name] = std::make_shared<const FoodDefinition>(std::move(def));
}

PetDefinitionPtr Catalog::findPet(const std::string& name) const {
    auto it = pets_.find(name);
    return it == pets_.end() ? nullptr : it->second;
}

FoodDefinitionPtr Catalog::findFood(const std::string& name) const {
    auto it = foods_.find(name);
    return it == foods_.end() ? nullptr : it->second;
}

namespace {
template <typename Ptr, typename Pred>
std::vector<std::string> collectNames(const std::map<std::string, Ptr>& defs, Pred pred) {
    std::vector<std::pair<int, std::string>> hits;
    for (const auto& [name, def] : defs) {
        if (pred(*def)) hits.emplace_back(def->tier, name);
    }
    std::sort(hits.begin(), hits.end());
    std::vector<std::string> out;
    out.reserve(hits.size());
    for (auto& h : hits) out.push_back(std::move(h.second));
    return out;
}
}  // namespace

std::vector<std::string> Catalog::petNames(int maxTier, const std::string& pack) const {
    return collectNames(pets_, [&](const PetDefinition& d) {
        return !d.token && d.tier <= maxTier && d.pack == pack;
    });
}

std::vector<std::string> Catalog::foodNames(int maxTier, const std::string& pack) const {
    return collectNames(foods_, [&](const FoodDefinition& d) { return d.tier <= maxTier && d.pack == pack; });
}

std::vector<std::string> Catalog::petNamesAtTier(int tier, const std::string& pack) const {
    return collectNames(pets_, [&](const PetDefinition& d) {
        return !d.token && d.tier == tier && d.pack == pack;
    });
}

namespace {

Effect makeEffect(EventKind kind, TriggerScope scope, TargetSelector target, Action action,
                  std::optional<int> uses = std::nullopt) {
    Effect e{};
    e.trigger = Trigger{kind, scope};
    e.target = target;
    e.action = std::move(action);
    e.uses = uses;
    return e;
}

TargetSelector select(SelectorKind kind, TargetTeam team = TargetTeam::Friend, int count = 1) {
    TargetSelector s{};
    s.kind = kind;
    s.team = team;
    s.count = count;
    return s;
}

PetDefinition pet(std::string name, int tier, int attack, int health,
                  const std::function<std::vector<Effect>(int)>& perLevel = {}) {
    PetDefinition d{};
    d.name = std::move(name);
    d.tier = tier;
    d.attack = attack;
    d.health = health;
    if (perLevel) {
        for (int lvl = 1; lvl <= kMaxPetLevel; ++lvl) {
            d.effects[static_cast<std::size_t>(lvl - 1)] = perLevel(lvl);
        }
    }
    return d;
}

PetDefinition token(std::string name, int attack, int health) {
    auto d = pet(std::move(name), 1, attack, health);
    d.token = true;
    d.cost = 0;
    return d;
}

FoodDefinition food(std::string name, int tier, bool holdable, bool singleUse, std::optional<Effect> effect) {
    FoodDefinition d{};
    d.name = std::move(name);
    d.tier = tier;
    d.holdable = holdable;
    d.singleUse = singleUse;
    d.effect = std::move(effect);
    return d;
}

Effect modifierEffect(Gameplay::DamageModifier mod, std::optional<int> uses) {
    return makeEffect(EventKind::DamageCalc, TriggerScope::Self, select(SelectorKind::Self), mod, uses);
}

}  // namespace

Catalog defaultCatalog() {
    Catalog c;

    // Tier 1
    c.addPet(pet("Ant", 1, 2, 1, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::Faint, TriggerScope::Self, select(SelectorKind::Random),
                                              BuffStats{2 * lvl, lvl}, 1)};
    }));
    c.addPet(pet("Beaver", 1, 3, 2, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::Sell, TriggerScope::Self,
                                              select(SelectorKind::Random, TargetTeam::Friend, 2),
                                              BuffStats{0, lvl}, 1)};
    }));
    c.addPet(pet("Cricket", 1, 1, 2, [](int lvl) {
        SummonPet s{};
        s.name = "Zombie Cricket";
        s.attack = lvl;
        s.health = lvl;
        return std::vector<Effect>{
            makeEffect(EventKind::Faint, TriggerScope::Self, select(SelectorKind::None), s, 1)};
    }));
    c.addPet(pet("Duck", 1, 2, 3, [](int lvl) {
        return std::vector<Effect>{
            makeEffect(EventKind::Sell, TriggerScope::Self, select(SelectorKind::None), BuffShopPets{0, lvl}, 1)};
    }));
    c.addPet(pet("Fish", 1, 2, 2, [](int lvl) {
        if (lvl >= kMaxPetLevel) return std::vector<Effect>{};
        return std::vector<Effect>{makeEffect(EventKind::Levelup, TriggerScope::Self, select(SelectorKind::All),
                                              BuffStats{lvl, lvl}, 1)};
    }));
    c.addPet(pet("Horse", 1, 2, 1, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::Summoned, TriggerScope::Friend,
                                              select(SelectorKind::TriggerAfflicted), BuffStats{lvl, 0})};
    }));
    c.addPet(pet("Mosquito", 1, 2, 2, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::StartOfBattle, TriggerScope::Team,
                                              select(SelectorKind::Random, TargetTeam::Enemy, lvl),
                                              DealDamage{1}, 1)};
    }));
    c.addPet(pet("Otter", 1, 1, 2, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::BuyPet, TriggerScope::Self,
                                              select(SelectorKind::Random, TargetTeam::Friend, lvl),
                                              BuffStats{1, 1})};
    }));
    c.addPet(pet("Pig", 1, 4, 1, [](int lvl) {
        return std::vector<Effect>{
            makeEffect(EventKind::Sell, TriggerScope::Self, select(SelectorKind::None), GainGold{lvl}, 1)};
    }));

    // Tier 2
    c.addPet(pet("Flamingo", 2, 4, 2, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::Faint, TriggerScope::Self,
                                              select(SelectorKind::Behind, TargetTeam::Friend, 2),
                                              BuffStats{lvl, lvl}, 1)};
    }));
    c.addPet(pet("Hedgehog", 2, 3, 2, [](int lvl) {
        return std::vector<Effect>{
            makeEffect(EventKind::Faint, TriggerScope::Self, select(SelectorKind::All, TargetTeam::Friend),
                       DealDamage{2 * lvl}, 1),
            makeEffect(EventKind::Faint, TriggerScope::Self, select(SelectorKind::All, TargetTeam::Enemy),
                       DealDamage{2 * lvl}, 1)};
    }));
    c.addPet(pet("Peacock", 2, 2, 5, [](int lvl) {
        return std::vector<Effect>{
            makeEffect(EventKind::Hurt, TriggerScope::Self, select(SelectorKind::Self), BuffStats{4, 0}, lvl)};
    }));
    c.addPet(pet("Rat", 2, 4, 5, [](int lvl) {
        SummonPet s{};
        s.name = "Dirty Rat";
        s.count = lvl;
        s.team = TargetTeam::Enemy;
        return std::vector<Effect>{
            makeEffect(EventKind::Faint, TriggerScope::Self, select(SelectorKind::None), s, 1)};
    }));
    c.addPet(pet("Shrimp", 2, 2, 3, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::Sell, TriggerScope::Friend, select(SelectorKind::Random),
                                              BuffStats{0, lvl})};
    }));
    c.addPet(pet("Swan", 2, 1, 3, [](int lvl) {
        return std::vector<Effect>{
            makeEffect(EventKind::StartTurn, TriggerScope::Team, select(SelectorKind::None), GainGold{lvl})};
    }));

    // Tier 3
    c.addPet(pet("Blowfish", 3, 3, 5, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::Hurt, TriggerScope::Self,
                                              select(SelectorKind::Random, TargetTeam::Enemy),
                                              DealDamage{2 * lvl})};
    }));
    c.addPet(pet("Camel", 3, 2, 5, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::Hurt, TriggerScope::Self,
                                              select(SelectorKind::Behind, TargetTeam::Friend, 1),
                                              BuffStats{lvl, 2 * lvl}, 1)};
    }));
    c.addPet(pet("Dog", 3, 3, 4, [](int lvl) {
        return std::vector<Effect>{
            makeEffect(EventKind::Summoned, TriggerScope::Friend, select(SelectorKind::Self), BuffStats{lvl, 0})};
    }));
    c.addPet(pet("Elephant", 3, 3, 5, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::BeforeAttack, TriggerScope::Self,
                                              select(SelectorKind::Behind, TargetTeam::Friend, lvl),
                                              DealDamage{1})};
    }));
    c.addPet(pet("Giraffe", 3, 2, 4, [](int lvl) {
        return std::vector<Effect>{makeEffect(EventKind::EndTurn, TriggerScope::Team,
                                              select(SelectorKind::Ahead, TargetTeam::Friend, lvl),
                                              BuffStats{1, 1})};
    }));
    c.addPet(pet("Kangaroo", 3, 1, 2, [](int lvl) {
        return std::vector<Effect>{
            makeEffect(EventKind::Attack, TriggerScope::Ahead, select(SelectorKind::Self), BuffStats{lvl, lvl})};
    }));
    c.addPet(pet("Ox", 3, 1, 3, [](int lvl) {
        return std::vector<Effect>{
            makeEffect(EventKind::Faint, TriggerScope::Ahead, select(SelectorKind::Self), GrantItem{"Melon"}, 1),
            makeEffect(EventKind::Faint, TriggerScope::Ahead, select(SelectorKind::Self), BuffStats{lvl, 0}, 1)};
    }));
    c.addPet(pet("Sheep", 3, 2, 2, [](int lvl) {
        SummonPet s{};
        s.name = "Ram";
        s.attack = 2 * lvl;
        s.health = 2 * lvl;
        s.count = 2;
        return std::vector<Effect>{
            makeEffect(EventKind::Faint, TriggerScope::Self, select(SelectorKind::None), s, 1)};
    }));

    // Summon-only tokens
    c.addPet(token("Zombie Cricket", 1, 1));
    c.addPet(token("Dirty Rat", 1, 1));
    c.addPet(token("Ram", 2, 2));
    c.addPet(token("Bee", 1, 1));

    // Foods
    c.addFood(food("Apple", 1, false, true,
                   makeEffect(EventKind::AteFood, TriggerScope::Self, select(SelectorKind::Self), BuffStats{1, 1}, 1)));
    {
        SummonPet bee{};
        bee.name = "Bee";
        c.addFood(food("Honey", 1, true, true,
                       makeEffect(EventKind::Faint, TriggerScope::Self, select(SelectorKind::None), bee, 1)));
    }
    {
        Gameplay::DamageModifier bone{};
        bone.attackBonus = 3;
        c.addFood(food("Meat Bone", 2, true, false, modifierEffect(bone, std::nullopt)));
    }
    c.addFood(food("Sleeping Pill", 2, false, true,
                   makeEffect(EventKind::AteFood, TriggerScope::Self, select(SelectorKind::Self), KillTarget{}, 1)));
    {
        Gameplay::DamageModifier garlic{};
        garlic.damageReduction = 2;
        c.addFood(food("Garlic", 3, true, false, modifierEffect(garlic, std::nullopt)));
    }
    c.addFood(food("Salad Bowl", 3, false, true,
                   [] {
                       auto s = select(SelectorKind::Random, TargetTeam::Friend, 2);
                       s.excludeSelf = false;
                       return makeEffect(EventKind::AteFood, TriggerScope::Self, s, BuffStats{1, 1}, 1);
                   }()));
    {
        Gameplay::DamageModifier melon{};
        melon.damageReduction = 20;
        melon.allowZeroDamage = true;
        c.addFood(food("Melon", 4, true, true, modifierEffect(melon, 1)));
    }
    {
        Gameplay::DamageModifier peanut{};
        peanut.lethal = true;
        c.addFood(food("Peanut", 6, true, true, modifierEffect(peanut, 1)));
    }
    {
        Gameplay::DamageModifier coconut{};
        coconut.invulnerable = true;
        coconut.allowZeroDamage = true;
        c.addFood(food("Coconut", 6, true, true, modifierEffect(coconut, 1)));
    }
    return c;
}

}  // namespace Arena::Game
