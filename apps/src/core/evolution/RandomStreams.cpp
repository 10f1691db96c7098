#include "RandomStreams.h"

namespace GeneticCars {

std::mt19937 deriveStream(
    uint64_t seed, uint32_t generation, uint32_t individualIndex, StreamPurpose purpose)
{
    // seed_seq's mixing is fully specified by the standard, unlike the distributions.
    std::seed_seq sequence{
        static_cast<uint32_t>(seed & 0xFFFFFFFFu),
        static_cast<uint32_t>(seed >> 32),
        generation,
        individualIndex,
        static_cast<uint32_t>(purpose),
    };
    return std::mt19937(sequence);
}

} // namespace GeneticCars
