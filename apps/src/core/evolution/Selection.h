#pragma once

#include "EvolutionConfig.h"
#include "Individual.h"

#include <cstddef>
#include <random>
#include <vector>

namespace GeneticCars {

/**
 * Ids ordered best first: fitness descending, ties broken by lower id.
 * Every individual must have a fitness.
 */
std::vector<IndividualId> rankByFitness(const std::vector<Individual>& individuals);

/**
 * Tournament selection over a ranking: draw `tournamentSize` rank positions uniformly
 * (with replacement) and return the best of them.
 */
size_t tournamentSelect(size_t rankedCount, int tournamentSize, std::mt19937& rng);

/**
 * Linear rank weighting: position r (0 = best) is chosen with weight rankedCount - r.
 */
size_t rankProportionalSelect(size_t rankedCount, std::mt19937& rng);

// Rank position of one parent under the configured policy.
size_t selectParent(const EvolutionConfig& config, size_t rankedCount, std::mt19937& rng);

} // namespace GeneticCars
