// Test module exporting only the crossover entry point.

#include "core/evolution/OperatorModuleAbi.h"

extern "C" {

// Always copies parent A, which is a valid crossover for any rate.
int geneticcars_crossover(
    const uint8_t* a,
    const uint8_t* b,
    size_t bitCount,
    double rate,
    uint64_t seed,
    uint8_t* offspring)
{
    (void)b;
    (void)rate;
    (void)seed;
    for (size_t i = 0; i < bitCount; ++i) {
        offspring[i] = a[i];
    }
    return 0;
}

} // extern "C"
