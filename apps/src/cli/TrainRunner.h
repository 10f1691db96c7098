#pragma once

#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/GenerationObserver.h"
#include "core/evolution/HeadlessEvaluator.h"
#include "core/evolution/HighScoreLedger.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace GeneticCars {
namespace Client {

/**
 * Results from a completed training run.
 */
struct TrainResults {
    uint64_t seed = 0;
    int totalGenerations = 0;
    int populationSize = 0;
    int genomeBits = 0;
    double durationSec = 0.0;

    double bestFitnessAllTime = 0.0;
    double bestFitnessLastGen = 0.0;
    double averageFitnessLastGen = 0.0;
    std::string bestGenome;

    int operatorFailures = 0;
    std::vector<std::string> operatorWarnings;

    bool completed = false;
    std::string errorMessage;
};

/**
 * Runs the evolution engine in-process, scoring every generation with the headless
 * evaluator in place of the physics harness.
 */
class TrainRunner : public GenerationObserver {
public:
    explicit TrainRunner(double trackLength = HeadlessEvaluator::DefaultTrackLength);

    TrainResults run(const EvolutionConfig& config, uint64_t seed, int generations);

    /**
     * Request stop of current training (from signal handler).
     */
    void requestStop();

    // Ledger contents at the end of the last run.
    const std::vector<HighScoreEntry>& highScores() const { return highScores_; }

    void onChampion(uint32_t generation, IndividualId individualId, double fitness) override;
    void onOperatorFailures(uint32_t generation, const OperatorFailureReport& report) override;

private:
    HeadlessEvaluator evaluator_;
    std::atomic<bool> stopRequested_{ false };
    std::vector<HighScoreEntry> highScores_;

    void displayProgress(
        uint32_t generation, int maxGenerations, double bestThisGen, double bestAllTime, double avg);
};

} // namespace Client
} // namespace GeneticCars
