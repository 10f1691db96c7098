#include "GeneticOperators.h"

#include "core/Assert.h"

#include <algorithm>
#include <unordered_set>

namespace GeneticCars {

size_t expectedFlipCount(int flipCount, size_t length)
{
    if (flipCount <= 0 || length == 0) {
        return 0;
    }
    return std::min(static_cast<size_t>(flipCount), length);
}

std::vector<size_t> sampleUniqueIndices(size_t domainSize, size_t count, std::mt19937& rng)
{
    count = std::min(count, domainSize);
    std::vector<size_t> indices;
    indices.reserve(count);

    if (count == 0) {
        return indices;
    }

    // Floyd's algorithm: one draw per selected index, no rejection loop.
    std::unordered_set<size_t> selected;
    selected.reserve(count * 2);

    const size_t start = domainSize - count;
    for (size_t j = start; j < domainSize; ++j) {
        std::uniform_int_distribution<size_t> dist(0, j);
        const size_t t = dist(rng);
        if (!selected.insert(t).second) {
            selected.insert(j);
        }
    }

    indices.assign(selected.begin(), selected.end());
    // Set iteration order is unspecified; sort so results depend only on the rng.
    std::sort(indices.begin(), indices.end());
    return indices;
}

Genome PointCrossover::crossover(
    const Genome& a, const Genome& b, double rate, std::mt19937& rng) const
{
    GENETICCARS_ASSERT(a.size() == b.size(), "Crossover parents must have equal length");

    std::bernoulli_distribution switchStrand(std::clamp(rate, 0.0, 1.0));
    bool fromB = false;
    std::vector<size_t> differing;

    for (size_t i = 0; i < a.size(); ++i) {
        if (i > 0 && switchStrand(rng)) {
            fromB = !fromB;
        }
        if (fromB && a.bit(i) != b.bit(i)) {
            differing.push_back(i);
        }
    }

    return a.withFlippedBits(differing);
}

Genome UniformCrossover::crossover(
    const Genome& a, const Genome& b, double rate, std::mt19937& rng) const
{
    GENETICCARS_ASSERT(a.size() == b.size(), "Crossover parents must have equal length");

    std::bernoulli_distribution takeB(std::clamp(rate, 0.0, 1.0));
    std::vector<size_t> differing;

    for (size_t i = 0; i < a.size(); ++i) {
        if (takeB(rng) && a.bit(i) != b.bit(i)) {
            differing.push_back(i);
        }
    }

    return a.withFlippedBits(differing);
}

Genome BitFlipMutation::mutate(const Genome& genome, int flipCount, std::mt19937& rng) const
{
    const size_t count = expectedFlipCount(flipCount, genome.size());
    return genome.withFlippedBits(sampleUniqueIndices(genome.size(), count, rng));
}

Result<std::monostate, EvolutionError> checkCrossoverResult(
    const Genome& a, const Genome& b, const Genome& offspring)
{
    using R = Result<std::monostate, EvolutionError>;

    if (offspring.size() != a.size()) {
        return R::error(
            EvolutionError::operatorFailure(
                "Crossover returned " + std::to_string(offspring.size()) + " bits, expected "
                + std::to_string(a.size())));
    }
    for (size_t i = 0; i < offspring.size(); ++i) {
        const bool bit = offspring.bit(i);
        if (bit != a.bit(i) && bit != b.bit(i)) {
            return R::error(
                EvolutionError::operatorFailure(
                    "Crossover bit " + std::to_string(i) + " comes from neither parent"));
        }
    }
    return R::okay(std::monostate{});
}

Result<std::monostate, EvolutionError> checkMutationResult(
    const Genome& parent, const Genome& mutant, int flipCount)
{
    using R = Result<std::monostate, EvolutionError>;

    if (mutant.size() != parent.size()) {
        return R::error(
            EvolutionError::operatorFailure(
                "Mutation returned " + std::to_string(mutant.size()) + " bits, expected "
                + std::to_string(parent.size())));
    }

    const size_t expected = expectedFlipCount(flipCount, parent.size());
    const size_t flipped = parent.hammingDistance(mutant);
    if (flipped != expected) {
        return R::error(
            EvolutionError::operatorFailure(
                "Mutation flipped " + std::to_string(flipped) + " bits, expected "
                + std::to_string(expected)));
    }
    return R::okay(std::monostate{});
}

} // namespace GeneticCars
