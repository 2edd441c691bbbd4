// Effect definitions: trigger, target selector, action and use counter.
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "../gameplay/Combat.h"
#include "Event.h"

namespace Arena::Effects {

// Which pets an event must involve for an effect to respond.
enum class TriggerScope {
    Self,    // owner is the afflicted pet
    Friend,  // another pet on the owner's side
    Ahead,   // nearest occupied slot in front of the owner
    Enemy,   // a pet on the other side
    Team,    // event raised for the owner's side as a whole
    Any
};

struct Trigger {
    EventKind kind{EventKind::StartTurn};
    TriggerScope scope{TriggerScope::Self};
};

enum class TargetTeam { Friend, Enemy };

enum class SelectorKind {
    None,
    Self,
    Ahead,
    Behind,
    All,
    Random,
    Slot,
    Lowest,
    Highest,
    First,
    Last,
    TriggerAfflicted,
    TriggerSource
};

enum class StatKey { Attack, Health };

struct TargetSelector {
    SelectorKind kind{SelectorKind::Self};
    TargetTeam team{TargetTeam::Friend};
    int count{1};          // Ahead/Behind/Random
    int slot{0};           // Slot
    StatKey stat{StatKey::Health};  // Lowest/Highest
    bool excludeSelf{true};
};

struct BuffStats {
    int attack{0};
    int health{0};
};

struct DealDamage {
    int amount{0};
};

struct SetStats {
    std::optional<int> attack;
    std::optional<int> health;
};

// invert: swap the target's own attack and health; otherwise exchange stats with the owner.
struct SwapStats {
    bool invert{false};
};

struct SummonPet {
    std::string name;
    int level{1};
    std::optional<int> attack;
    std::optional<int> health;
    int count{1};
    TargetTeam team{TargetTeam::Friend};
};

struct GrantItem {
    std::string name;
};

struct GainExperience {
    int amount{1};
};

struct KillTarget {};

struct GainGold {
    int amount{1};
};

struct BuffShopPets {
    int attack{0};
    int health{0};
};

using Action = std::variant<BuffStats, DealDamage, SetStats, SwapStats, SummonPet, GrantItem, GainExperience,
                            KillTarget, GainGold, BuffShopPets, Gameplay::DamageModifier>;

struct Effect {
    Trigger trigger{};
    TargetSelector target{};
    Action action{BuffStats{}};
    std::optional<int> uses;  // nullopt = unlimited
    bool temporary{false};

    bool exhausted() const { return uses.has_value() && *uses <= 0; }
};

// True when executing the action can leave a pet at zero health.
bool canProduceFaint(const Action& action);
std::string_view actionName(const Action& action);
const Gameplay::DamageModifier* damageModifier(const Effect& effect);

std::string_view toString(TriggerScope scope);
std::string_view toString(SelectorKind kind);
std::optional<TriggerScope> parseScopeKey(const std::string& k);
std::optional<SelectorKind> parseSelectorKey(const std::string& k);
std::optional<TargetTeam> parseTeamKey(const std::string& k);
std::optional<StatKey> parseStatKey(const std::string& k);

}  // namespace Arena::Effects
