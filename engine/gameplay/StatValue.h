// Clamped attack/health pair shared by pets, items and actions.
#pragma once

#include <cstdint>

namespace Arena::Gameplay {

struct StatLimits {
    int minimum{0};
    int maximum{50};
};

// All mutators saturate at the limits; none of them fail.
class StatValue {
public:
    StatValue() = default;
    StatValue(int attack, int health, StatLimits limits = {});

    int attack() const { return attack_; }
    int health() const { return health_; }
    const StatLimits& limits() const { return limits_; }

    void add(const StatValue& delta);
    void add(int attackDelta, int healthDelta);
    void subtract(const StatValue& delta);
    void subtract(int attackDelta, int healthDelta);
    void set(int attack, int health);
    void setAttack(int attack);
    void setHealth(int health);
    void swap(StatValue& other);
    // Exchange attack and health on the same pet.
    void invert();
    void setLimits(StatLimits limits);

    bool fainted() const { return health_ <= limits_.minimum; }

    bool operator==(const StatValue& o) const { return attack_ == o.attack_ && health_ == o.health_; }
    bool operator!=(const StatValue& o) const { return !(*this == o); }

private:
    int clamp(std::int64_t v) const;

    int attack_{0};
    int health_{0};
    StatLimits limits_{};
};

}  // namespace Arena::Gameplay
