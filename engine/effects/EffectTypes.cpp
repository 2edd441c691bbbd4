#include "EffectTypes.h"

#include <type_traits>

namespace Arena::Effects {

namespace {
template <class>
inline constexpr bool kAlwaysFalse = false;
}  // namespace

bool canProduceFaint(const Action& action) {
    return std::visit(
        [](const auto& a) -> bool {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, BuffStats>) {
                return a.health < 0;
            } else if constexpr (std::is_same_v<T, DealDamage> || std::is_same_v<T, KillTarget> ||
                                 std::is_same_v<T, SetStats> || std::is_same_v<T, SwapStats>) {
                return true;
            } else {
                return false;
            }
        },
        action);
}

std::string_view actionName(const Action& action) {
    return std::visit(
        [](const auto& a) -> std::string_view {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, BuffStats>) return "BuffStats";
            else if constexpr (std::is_same_v<T, DealDamage>) return "DealDamage";
            else if constexpr (std::is_same_v<T, SetStats>) return "SetStats";
            else if constexpr (std::is_same_v<T, SwapStats>) return "SwapStats";
            else if constexpr (std::is_same_v<T, SummonPet>) return "SummonPet";
            else if constexpr (std::is_same_v<T, GrantItem>) return "GrantItem";
            else if constexpr (std::is_same_v<T, GainExperience>) return "GainExperience";
            else if constexpr (std::is_same_v<T, KillTarget>) return "KillTarget";
            else if constexpr (std::is_same_v<T, GainGold>) return "GainGold";
            else if constexpr (std::is_same_v<T, BuffShopPets>) return "BuffShopPets";
            else if constexpr (std::is_same_v<T, Gameplay::DamageModifier>) return "DamageModifier";
            else static_assert(kAlwaysFalse<T>, "unhandled action");
        },
        action);
}

const Gameplay::DamageModifier* damageModifier(const Effect& effect) {
    if (effect.trigger.kind != EventKind::DamageCalc || effect.exhausted()) {
        return nullptr;
    }
    return std::get_if<Gameplay::DamageModifier>(&effect.action);
}

std::string_view toString(TriggerScope scope) {
    switch (scope) {
        case TriggerScope::Self: return "Self";
        case TriggerScope::Friend: return "Friend";
        case TriggerScope::Ahead: return "Ahead";
        case TriggerScope::Enemy: return "Enemy";
        case TriggerScope::Team: return "Team";
        case TriggerScope::Any: return "Any";
    }
    return "Unknown";
}

std::string_view toString(SelectorKind kind) {
    switch (kind) {
        case SelectorKind::None: return "None";
        case SelectorKind::Self: return "Self";
        case SelectorKind::Ahead: return "Ahead";
        case SelectorKind::Behind: return "Behind";
        case SelectorKind::All: return "All";
        case SelectorKind::Random: return "Random";
        case SelectorKind::Slot: return "Slot";
        case SelectorKind::Lowest: return "Lowest";
        case SelectorKind::Highest: return "Highest";
        case SelectorKind::First: return "First";
        case SelectorKind::Last: return "Last";
        case SelectorKind::TriggerAfflicted: return "TriggerAfflicted";
        case SelectorKind::TriggerSource: return "TriggerSource";
    }
    return "Unknown";
}

std::optional<TriggerScope> parseScopeKey(const std::string& k) {
    if (k == "Self") return TriggerScope::Self;
    if (k == "Friend") return TriggerScope::Friend;
    if (k == "Ahead") return TriggerScope::Ahead;
    if (k == "Enemy") return TriggerScope::Enemy;
    if (k == "Team") return TriggerScope::Team;
    if (k == "Any") return TriggerScope::Any;
    return std::nullopt;
}

std::optional<SelectorKind> parseSelectorKey(const std::string& k) {
    if (k == "None") return SelectorKind::None;
    if (k == "Self") return SelectorKind::Self;
    if (k == "Ahead") return SelectorKind::Ahead;
    if (k == "Behind") return SelectorKind::Behind;
    if (k == "All") return SelectorKind::All;
    if (k == "Random") return SelectorKind::Random;
    if (k == "Slot") return SelectorKind::Slot;
    if (k == "Lowest") return SelectorKind::Lowest;
    if (k == "Highest") return SelectorKind::Highest;
    if (k == "First") return SelectorKind::First;
    if (k == "Last") return SelectorKind::Last;
    if (k == "TriggerAfflicted") return SelectorKind::TriggerAfflicted;
    if (k == "TriggerSource") return SelectorKind::TriggerSource;
    return std::nullopt;
}

std::optional<TargetTeam> parseTeamKey(const std::string& k) {
    if (k == "Friend") return TargetTeam::Friend;
    if (k == "Enemy") return TargetTeam::Enemy;
    return std::nullopt;
}

std::optional<StatKey> parseStatKey(const std::string& k) {
    if (k == "attack") return StatKey::Attack;
    if (k == "health") return StatKey::Health;
    return std::nullopt;
}

}  // namespace Arena::Effects
