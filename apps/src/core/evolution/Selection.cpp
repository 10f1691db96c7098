#include "Selection.h"

#include "core/Assert.h"

#include <algorithm>
#include <numeric>

namespace GeneticCars {

std::vector<IndividualId> rankByFitness(const std::vector<Individual>& individuals)
{
    std::vector<size_t> order(individuals.size());
    std::iota(order.begin(), order.end(), size_t{ 0 });

    for (const auto& individual : individuals) {
        GENETICCARS_ASSERT(individual.fitness.has_value(), "Ranking needs every fitness");
    }

    std::sort(order.begin(), order.end(), [&](size_t lhs, size_t rhs) {
        const double a = *individuals[lhs].fitness;
        const double b = *individuals[rhs].fitness;
        if (a != b) {
            return a > b;
        }
        return individuals[lhs].id < individuals[rhs].id;
    });

    std::vector<IndividualId> ranked;
    ranked.reserve(order.size());
    for (const size_t index : order) {
        ranked.push_back(individuals[index].id);
    }
    return ranked;
}

size_t tournamentSelect(size_t rankedCount, int tournamentSize, std::mt19937& rng)
{
    GENETICCARS_ASSERT(rankedCount > 0, "Selection needs a non-empty ranking");
    GENETICCARS_ASSERT(tournamentSize > 0, "Tournament size must be positive");

    std::uniform_int_distribution<size_t> dist(0, rankedCount - 1);

    size_t best = dist(rng);
    for (int i = 1; i < tournamentSize; i++) {
        best = std::min(best, dist(rng));
    }
    return best;
}

size_t rankProportionalSelect(size_t rankedCount, std::mt19937& rng)
{
    GENETICCARS_ASSERT(rankedCount > 0, "Selection needs a non-empty ranking");

    const uint64_t n = rankedCount;
    const uint64_t totalWeight = n * (n + 1) / 2;
    std::uniform_int_distribution<uint64_t> dist(0, totalWeight - 1);
    uint64_t ticket = dist(rng);

    for (size_t position = 0; position < rankedCount; ++position) {
        const uint64_t weight = n - position;
        if (ticket < weight) {
            return position;
        }
        ticket -= weight;
    }
    return rankedCount - 1;
}

size_t selectParent(const EvolutionConfig& config, size_t rankedCount, std::mt19937& rng)
{
    switch (config.selectionPolicy) {
        case SelectionPolicy::Tournament:
            return tournamentSelect(rankedCount, config.tournamentSize, rng);
        case SelectionPolicy::RankProportional:
            return rankProportionalSelect(rankedCount, rng);
    }
    return tournamentSelect(rankedCount, config.tournamentSize, rng);
}

} // namespace GeneticCars
