#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Entry points an external operator module exports. Either may be omitted; the engine
 * falls back to its built-in operator for a missing role.
 *
 * Genomes cross the boundary as one byte per bit, each 0 or 1. The output buffer holds
 * bitCount bytes. `seed` comes from the calling individual's random stream so a module
 * that derives all randomness from it keeps runs reproducible.
 *
 * Both functions return 0 on success; any other value is reported as an operator failure.
 * They are called from several breeding threads at once and must be reentrant.
 */

#define GENETICCARS_CROSSOVER_SYMBOL "geneticcars_crossover"
#define GENETICCARS_MUTATE_SYMBOL "geneticcars_mutate"

typedef int (*GeneticCarsCrossoverFn)(
    const uint8_t* a,
    const uint8_t* b,
    size_t bitCount,
    double rate,
    uint64_t seed,
    uint8_t* offspring);

typedef int (*GeneticCarsMutateFn)(
    const uint8_t* genome, size_t bitCount, int flipCount, uint64_t seed, uint8_t* mutant);

int geneticcars_crossover(
    const uint8_t* a,
    const uint8_t* b,
    size_t bitCount,
    double rate,
    uint64_t seed,
    uint8_t* offspring);

int geneticcars_mutate(
    const uint8_t* genome, size_t bitCount, int flipCount, uint64_t seed, uint8_t* mutant);

#ifdef __cplusplus
}
#endif
