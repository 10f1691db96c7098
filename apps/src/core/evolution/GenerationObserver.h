#pragma once

#include "EvolutionError.h"
#include "Individual.h"

#include <cstdint>
#include <vector>

namespace GeneticCars {

// Breeding attempts whose first-choice operator failed during one generation advance.
struct OperatorFailureReport {
    int crossoverFailures = 0;
    int mutationFailures = 0;
    std::vector<EvolutionError> errors;

    int total() const { return crossoverFailures + mutationFailures; }
};

/**
 * Presentation-side hooks. Callbacks run on the thread that called into the manager,
 * after the manager's state is consistent. Defaults do nothing.
 */
class GenerationObserver {
public:
    virtual ~GenerationObserver() = default;

    // The new population is in place and waiting for fitness reports.
    virtual void onGenerationAdvanced(
        uint32_t generation, const std::vector<Individual>& individuals)
    {
        (void)generation;
        (void)individuals;
    }

    // A generation's best individual made it onto the high-score ledger.
    virtual void onChampion(uint32_t generation, IndividualId individualId, double fitness)
    {
        (void)generation;
        (void)individualId;
        (void)fitness;
    }

    virtual void onOperatorFailures(uint32_t generation, const OperatorFailureReport& report)
    {
        (void)generation;
        (void)report;
    }
};

} // namespace GeneticCars
