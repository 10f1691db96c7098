// Loadable operator module: strand-switching crossover plus a fixed number of bit flips.
// Build it as a shared library and point EvolutionConfig::operatorModule at the result.

#include "core/evolution/OperatorModuleAbi.h"

#include <algorithm>
#include <random>
#include <vector>

extern "C" {

int geneticcars_crossover(
    const uint8_t* a,
    const uint8_t* b,
    size_t bitCount,
    double rate,
    uint64_t seed,
    uint8_t* offspring)
{
    if (!a || !b || !offspring) {
        return 1;
    }
    if (!(rate >= 0.0 && rate <= 1.0)) {
        return 2;
    }

    std::mt19937_64 rng(seed);
    std::bernoulli_distribution switchStrand(rate);

    const uint8_t* source = a;
    for (size_t i = 0; i < bitCount; ++i) {
        if (i > 0 && switchStrand(rng)) {
            source = source == a ? b : a;
        }
        offspring[i] = source[i];
    }
    return 0;
}

int geneticcars_mutate(
    const uint8_t* genome, size_t bitCount, int flipCount, uint64_t seed, uint8_t* mutant)
{
    if (!genome || !mutant) {
        return 1;
    }

    std::copy(genome, genome + bitCount, mutant);
    if (flipCount <= 0 || bitCount == 0) {
        return 0;
    }

    // Partial Fisher-Yates shuffle picks distinct positions.
    std::vector<size_t> positions(bitCount);
    for (size_t i = 0; i < bitCount; ++i) {
        positions[i] = i;
    }

    std::mt19937_64 rng(seed);
    const size_t count = std::min(static_cast<size_t>(flipCount), bitCount);
    for (size_t i = 0; i < count; ++i) {
        std::uniform_int_distribution<size_t> pick(i, bitCount - 1);
        std::swap(positions[i], positions[pick(rng)]);
        mutant[positions[i]] ^= 1u;
    }
    return 0;
}

} // extern "C"
