#pragma once

#include "EvolutionConfig.h"
#include "EvolutionError.h"
#include "GenerationObserver.h"
#include "HighScoreLedger.h"
#include "Individual.h"
#include "OperatorRegistry.h"
#include "PhenotypeDecoder.h"
#include "VehicleDefinition.h"
#include "core/Result.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace GeneticCars {

enum class GenerationPhase : uint8_t {
    Evaluating = 0, // Waiting for a fitness report per individual.
    Advancing = 1,  // Building the next population.
};

/**
 * Owns the current population and turns reported fitness values into the next generation.
 *
 * The harness loop is:
 *   1. simulate phenotypes() and call reportFitness() once per individual;
 *   2. call advance() once isGenerationComplete();
 *   3. repeat with the new population.
 *
 * The next population is laid out as numClones clones of the best-ranked individuals,
 * numRandom fresh random genomes, then offspring bred from the ranking, with ids 0..P-1 in
 * that order. All randomness is derived from (seed, generation, id, purpose), so runs with
 * the same seed, config and fitness reports are bit-identical regardless of thread count.
 */
class GenerationManager {
public:
    // Validates the config and binds operators from the default registry.
    static Result<std::unique_ptr<GenerationManager>, EvolutionError> create(
        const EvolutionConfig& config, uint64_t seed);

    // Same, with operators bound by the caller.
    static Result<std::unique_ptr<GenerationManager>, EvolutionError> create(
        const EvolutionConfig& config, uint64_t seed, OperatorSet operators);

    GenerationManager(const GenerationManager&) = delete;
    GenerationManager& operator=(const GenerationManager&) = delete;

    Result<std::monostate, EvolutionError> reportFitness(IndividualId id, double fitness);

    size_t pendingCount() const { return pendingCount_; }
    bool isGenerationComplete() const { return pendingCount_ == 0; }

    /**
     * Builds the next generation. Fails with IncompleteGeneration while any fitness is
     * missing, or OperatorFailure when a built-in operator fails after a fallback retry; on
     * failure the current generation is left untouched. On success the returned report
     * lists operator failures that were recovered by fallback.
     */
    Result<OperatorFailureReport, EvolutionError> advance();

    // Drops the population and high scores and restarts at generation 1.
    void reseed(uint64_t seed);

    // Ids of the current generation, best first. Needs every fitness reported.
    Result<std::vector<IndividualId>, EvolutionError> ranking() const;

    const std::vector<Individual>& currentPopulation() const { return population_; }
    const std::vector<VehicleDefinition>& phenotypes() const { return phenotypes_; }
    const VehicleDefinition& phenotype(IndividualId id) const;

    const HighScoreLedger& highScores() const { return ledger_; }
    uint32_t generation() const { return generation_; }
    GenerationPhase phase() const { return phase_; }
    uint64_t seed() const { return seed_; }
    const EvolutionConfig& config() const { return config_; }
    const PhenotypeDecoder& decoder() const { return decoder_; }

    // Binding problems that were recovered by falling back to built-in operators.
    const std::vector<EvolutionError>& operatorWarnings() const { return operators_.warnings; }

    // Not owned; may be null.
    void setObserver(GenerationObserver* observer) { observer_ = observer; }

private:
    struct BreedOutcome {
        std::optional<Genome> genome;
        int crossoverFailures = 0;
        int mutationFailures = 0;
        std::vector<EvolutionError> failures;
        std::optional<EvolutionError> fatal;
    };

    GenerationManager(const EvolutionConfig& config, uint64_t seed, OperatorSet operators);

    void createInitialPopulation();
    BreedOutcome breed(
        uint32_t nextGeneration, IndividualId childId, const std::vector<IndividualId>& ranked)
        const;
    std::vector<VehicleDefinition> decodeAll(const std::vector<Individual>& individuals) const;
    void notifyGenerationAdvanced();

    EvolutionConfig config_;
    uint64_t seed_ = 0;
    PhenotypeDecoder decoder_;
    OperatorSet operators_;
    HighScoreLedger ledger_;
    GenerationObserver* observer_ = nullptr;

    uint32_t generation_ = 1;
    GenerationPhase phase_ = GenerationPhase::Evaluating;
    std::vector<Individual> population_;
    std::vector<VehicleDefinition> phenotypes_;
    size_t pendingCount_ = 0;
};

} // namespace GeneticCars
