// Attack damage rules shared by the battle orchestrator and tests.
#pragma once

#include <algorithm>

namespace Arena::Gameplay {

struct DamageRules {
    int minDamage{1};
    int maxDamage{150};
};

// Held-item adjustments applied while a single exchange is resolved.
struct DamageModifier {
    int attackBonus{0};       // added to the holder's outgoing hit
    int damageReduction{0};   // subtracted from hits the holder takes
    bool allowZeroDamage{false};
    bool lethal{false};       // any nonzero hit from the holder kills
    bool invulnerable{false}; // holder takes no damage at all

    bool empty() const {
        return attackBonus == 0 && damageReduction == 0 && !allowZeroDamage && !lethal && !invulnerable;
    }
};

struct HitResult {
    int damage{0};
    bool lethal{false};
};

inline HitResult computeHit(int attack, const DamageModifier& attacker, const DamageModifier& defender,
                            const DamageRules& rules) {
    HitResult out{};
    if (defender.invulnerable) {
        return out;
    }
    int damage = attack + attacker.attackBonus - defender.damageReduction;
    const int floor = defender.allowZeroDamage ? 0 : rules.minDamage;
    damage = std::clamp(damage, floor, std::max(floor, rules.maxDamage));
    out.damage = damage;
    out.lethal = attacker.lethal && damage > 0;
    return out;
}

}  // namespace Arena::Gameplay
