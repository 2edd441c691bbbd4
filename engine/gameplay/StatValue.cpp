#include "StatValue.h"

#include <algorithm>

namespace Arena::Gameplay {

StatValue::StatValue(int attack, int health, StatLimits limits) : limits_(limits) {
    set(attack, health);
}

int StatValue::clamp(std::int64_t v) const {
    const std::int64_t lo = limits_.minimum;
    const std::int64_t hi = std::max(limits_.minimum, limits_.maximum);
    return static_cast<int>(std::clamp(v, lo, hi));
}

void StatValue::add(const StatValue& delta) { add(delta.attack_, delta.health_); }

void StatValue::add(int attackDelta, int healthDelta) {
    attack_ = clamp(static_cast<std::int64_t>(attack_) + attackDelta);
    health_ = clamp(static_cast<std::int64_t>(health_) + healthDelta);
}

void StatValue::subtract(const StatValue& delta) { subtract(delta.attack_, delta.health_); }

void StatValue::subtract(int attackDelta, int healthDelta) {
    attack_ = clamp(static_cast<std::int64_t>(attack_) - attackDelta);
    health_ = clamp(static_cast<std::int64_t>(health_) - healthDelta);
}

void StatValue::set(int attack, int health) {
    attack_ = clamp(attack);
    health_ = clamp(health);
}

void StatValue::setAttack(int attack) { attack_ = clamp(attack); }

void StatValue::setHealth(int health) { health_ = clamp(health); }

void StatValue::swap(StatValue& other) {
    const int a = attack_;
    const int h = health_;
    set(other.attack_, other.health_);
    other.set(a, h);
}

void StatValue::invert() { set(health_, attack_); }

void StatValue::setLimits(StatLimits limits) {
    limits_ = limits;
    set(attack_, health_);
}

}  // namespace Arena::Gameplay
