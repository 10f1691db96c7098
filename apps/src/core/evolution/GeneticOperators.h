#pragma once

#include "EvolutionError.h"
#include "Genome.h"
#include "core/Result.h"

#include <random>
#include <string>
#include <variant>

namespace GeneticCars {

namespace OperatorName {
inline constexpr const char* PointCrossover = "PointCrossover";
inline constexpr const char* UniformCrossover = "UniformCrossover";
inline constexpr const char* BitFlip = "BitFlip";
} // namespace OperatorName

/**
 * Combines two parent genomes into one offspring.
 *
 * Contract: the offspring has the parents' length and every bit equals the bit of A or the
 * bit of B at the same position. A rate of 0 returns A unchanged. Implementations are
 * called concurrently from breeding workers and must not keep mutable state.
 */
class CrossoverOperator {
public:
    virtual ~CrossoverOperator() = default;

    virtual std::string name() const = 0;

    virtual Genome crossover(
        const Genome& a, const Genome& b, double rate, std::mt19937& rng) const = 0;
};

/**
 * Flips exactly min(flipCount, length) distinct bits of a genome.
 */
class MutationOperator {
public:
    virtual ~MutationOperator() = default;

    virtual std::string name() const = 0;

    virtual Genome mutate(const Genome& genome, int flipCount, std::mt19937& rng) const = 0;
};

// Walks the genome starting on A and switches strand between adjacent bits with
// probability `rate`.
class PointCrossover : public CrossoverOperator {
public:
    std::string name() const override { return OperatorName::PointCrossover; }
    Genome crossover(
        const Genome& a, const Genome& b, double rate, std::mt19937& rng) const override;
};

// Takes each bit from B with probability `rate`, otherwise from A.
class UniformCrossover : public CrossoverOperator {
public:
    std::string name() const override { return OperatorName::UniformCrossover; }
    Genome crossover(
        const Genome& a, const Genome& b, double rate, std::mt19937& rng) const override;
};

class BitFlipMutation : public MutationOperator {
public:
    std::string name() const override { return OperatorName::BitFlip; }
    Genome mutate(const Genome& genome, int flipCount, std::mt19937& rng) const override;
};

// Distinct indices in [0, domainSize), sorted ascending.
std::vector<size_t> sampleUniqueIndices(size_t domainSize, size_t count, std::mt19937& rng);

// Number of bits a mutation with `flipCount` must flip on a genome of `length` bits.
size_t expectedFlipCount(int flipCount, size_t length);

Result<std::monostate, EvolutionError> checkCrossoverResult(
    const Genome& a, const Genome& b, const Genome& offspring);

Result<std::monostate, EvolutionError> checkMutationResult(
    const Genome& parent, const Genome& mutant, int flipCount);

} // namespace GeneticCars
