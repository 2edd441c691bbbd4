// Seeded random stream owned by a roster or a shop.
#pragma once

#include <cstdint>
#include <optional>
#include <random>

namespace Arena {

class RandomStream {
public:
    RandomStream() { reseed(std::nullopt); }
    explicit RandomStream(std::optional<std::uint64_t> seed) { reseed(seed); }

    // No seed draws from std::random_device; tests always pass one.
    void reseed(std::optional<std::uint64_t> seed) {
        seed_ = seed;
        if (seed) {
            engine_.seed(*seed);
        } else {
            std::random_device rd;
            engine_.seed((static_cast<std::uint64_t>(rd()) << 32) | rd());
        }
    }

    std::optional<std::uint64_t> seed() const { return seed_; }

    // Uniform index in [0, count). count must be positive.
    std::size_t index(std::size_t count) {
        std::uniform_int_distribution<std::size_t> dist(0, count - 1);
        return dist(engine_);
    }

    std::mt19937_64& engine() { return engine_; }

private:
    std::optional<std::uint64_t> seed_;
    std::mt19937_64 engine_;
};

}  // namespace Arena
