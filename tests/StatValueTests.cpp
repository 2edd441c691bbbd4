// Saturating stat arithmetic and attack damage rules.
#include <cassert>

#include "../engine/gameplay/Combat.h"
#include "../engine/gameplay/StatValue.h"

using namespace Arena::Gameplay;

int main() {
    {
        StatValue s(2, 3);
        s.add(5, 5);
        assert(s.attack() == 7 && s.health() == 8);
        s.subtract(10, 10);
        // Floors at zero rather than going negative.
        assert(s.attack() == 0 && s.health() == 0);
        assert(s.fainted());
    }
    {
        StatValue s(49, 1);
        s.add(1000000, 2147483647);
        assert(s.attack() == 50 && s.health() == 50);
        s.subtract(-2147483647 - 1, 0);
        assert(s.attack() == 50);
    }
    {
        StatValue s(-4, 99);
        assert(s.attack() == 0 && s.health() == 50);
        s.set(3, 4);
        s.setAttack(-1);
        s.setHealth(60);
        assert(s.attack() == 0 && s.health() == 50);
    }
    {
        StatValue a(1, 2);
        StatValue b(3, 4);
        a.swap(b);
        assert(a == StatValue(3, 4));
        assert(b == StatValue(1, 2));
        a.invert();
        assert(a.attack() == 4 && a.health() == 3);
    }
    {
        StatLimits tight{0, 10};
        StatValue s(8, 8, tight);
        s.add(5, 5);
        assert(s.attack() == 10 && s.health() == 10);
        s.setLimits(StatLimits{0, 5});
        assert(s.attack() == 5 && s.health() == 5);
    }
    {
        // Plain hit, minimum damage, maximum damage.
        DamageRules rules{};
        DamageModifier none{};
        assert(computeHit(3, none, none, rules).damage == 3);
        assert(computeHit(0, none, none, rules).damage == 1);
        assert(computeHit(500, none, none, rules).damage == 150);
    }
    {
        DamageRules rules{};
        DamageModifier none{};
        DamageModifier garlic{};
        garlic.damageReduction = 2;
        assert(computeHit(5, none, garlic, rules).damage == 3);
        assert(computeHit(2, none, garlic, rules).damage == 1);

        DamageModifier melon{};
        melon.damageReduction = 20;
        melon.allowZeroDamage = true;
        assert(computeHit(5, none, melon, rules).damage == 0);

        DamageModifier coconut{};
        coconut.invulnerable = true;
        assert(computeHit(40, none, coconut, rules).damage == 0);

        DamageModifier bone{};
        bone.attackBonus = 3;
        assert(computeHit(2, bone, none, rules).damage == 5);
    }
    {
        DamageRules rules{};
        DamageModifier none{};
        DamageModifier peanut{};
        peanut.lethal = true;
        auto hit = computeHit(1, peanut, none, rules);
        assert(hit.lethal && hit.damage == 1);

        DamageModifier coconut{};
        coconut.invulnerable = true;
        hit = computeHit(1, peanut, coconut, rules);
        assert(!hit.lethal && hit.damage == 0);
    }
    return 0;
}
