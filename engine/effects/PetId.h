// Stable pet handle; positions change, ids never do.
#pragma once

#include <cstdint>

namespace Arena::Effects {

using PetId = std::uint32_t;
constexpr PetId kInvalidPet = 0;

}  // namespace Arena::Effects
