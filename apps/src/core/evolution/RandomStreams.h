#pragma once

#include <cstdint>
#include <random>

namespace GeneticCars {

enum class StreamPurpose : uint32_t {
    Initial = 0,
    RandomInjection = 1,
    Breeding = 2,
    Fallback = 3,
};

/**
 * Independent generator for one (seed, generation, individual, purpose) slot.
 *
 * Every random draw in the engine comes from a stream derived here, so the result of
 * building an individual does not depend on which worker built it or in what order.
 */
std::mt19937 deriveStream(
    uint64_t seed, uint32_t generation, uint32_t individualIndex, StreamPurpose purpose);

} // namespace GeneticCars
