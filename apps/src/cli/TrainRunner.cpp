#include "TrainRunner.h"
#include "core/LoggingChannels.h"
#include "core/evolution/GenerationManager.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace GeneticCars {
namespace Client {

TrainRunner::TrainRunner(double trackLength) : evaluator_(trackLength)
{}

TrainResults TrainRunner::run(const EvolutionConfig& config, uint64_t seed, int generations)
{
    TrainResults results;
    results.seed = seed;
    results.populationSize = config.populationSize;
    highScores_.clear();
    stopRequested_ = false;

    auto managerResult = GenerationManager::create(config, seed);
    if (managerResult.isError()) {
        results.errorMessage = managerResult.errorValue().toString();
        LOG_ERROR(Cli, "{}", results.errorMessage);
        return results;
    }
    auto& manager = *managerResult.value();
    manager.setObserver(this);

    results.genomeBits = static_cast<int>(manager.decoder().genomeLength());
    for (const auto& warning : manager.operatorWarnings()) {
        results.operatorWarnings.push_back(warning.toString());
    }

    LOG_INFO(Cli, "Starting evolution training:");
    LOG_INFO(Cli, "  Seed: {}", seed);
    LOG_INFO(Cli, "  Generations: {}", generations);
    LOG_INFO(Cli, "  Population: {}", config.populationSize);
    LOG_INFO(Cli, "  Clones / random: {} / {}", config.numClones, config.numRandom);
    LOG_INFO(Cli, "  Crossover rate: {}", config.crossoverRate);
    LOG_INFO(Cli, "  Mutation flips: {}", config.mutationFlipCount);

    const auto startTime = std::chrono::steady_clock::now();

    while (!stopRequested_ && results.totalGenerations < generations) {
        const auto& phenotypes = manager.phenotypes();
        double best = 0.0;
        double sum = 0.0;
        std::string bestGenome;

        for (size_t i = 0; i < phenotypes.size(); ++i) {
            const double distance = evaluator_.evaluate(phenotypes[i]);
            auto report = manager.reportFitness(static_cast<IndividualId>(i), distance);
            if (report.isError()) {
                results.errorMessage = report.errorValue().toString();
                LOG_ERROR(Cli, "{}", results.errorMessage);
                return results;
            }

            sum += distance;
            if (i == 0 || distance > best) {
                best = distance;
                bestGenome = manager.currentPopulation()[i].genome.toString();
            }
        }

        const uint32_t evaluatedGeneration = manager.generation();
        results.bestFitnessLastGen = best;
        results.averageFitnessLastGen = phenotypes.empty() ? 0.0 : sum / phenotypes.size();
        if (results.totalGenerations == 0 || best > results.bestFitnessAllTime) {
            results.bestFitnessAllTime = best;
            results.bestGenome = bestGenome;
        }

        auto advanced = manager.advance();
        if (advanced.isError()) {
            results.errorMessage = advanced.errorValue().toString();
            LOG_ERROR(Cli, "{}", results.errorMessage);
            break;
        }
        results.operatorFailures += advanced.value().total();
        results.totalGenerations++;

        displayProgress(
            evaluatedGeneration,
            generations,
            results.bestFitnessLastGen,
            results.bestFitnessAllTime,
            results.averageFitnessLastGen);
    }

    const auto endTime = std::chrono::steady_clock::now();
    results.durationSec = std::chrono::duration<double>(endTime - startTime).count();
    results.completed = results.errorMessage.empty() && results.totalGenerations == generations;
    highScores_ = manager.highScores().entries();

    if (results.completed) {
        LOG_INFO(Cli, "Evolution complete!");
    }
    else if (stopRequested_) {
        LOG_INFO(Cli, "Evolution stopped after {} generations", results.totalGenerations);
    }

    manager.setObserver(nullptr);
    return results;
}

void TrainRunner::requestStop()
{
    stopRequested_ = true;
}

void TrainRunner::onChampion(uint32_t generation, IndividualId individualId, double fitness)
{
    LOG_INFO(
        Cli, "New high score: generation {}, individual {}, {:.2f} m", generation, individualId, fitness);
}

void TrainRunner::onOperatorFailures(uint32_t generation, const OperatorFailureReport& report)
{
    LOG_WARN(
        Cli,
        "Generation {}: {} operator failures fell back to built-ins",
        generation,
        report.total());
}

void TrainRunner::displayProgress(
    uint32_t generation, int maxGenerations, double bestThisGen, double bestAllTime, double avg)
{
    std::cerr << "Gen " << std::setw(3) << generation << "/" << maxGenerations << " ";
    std::cerr << "gen=" << std::fixed << std::setprecision(2) << bestThisGen << " ";
    std::cerr << "best=" << std::setprecision(2) << bestAllTime << " ";
    std::cerr << "avg=" << std::setprecision(2) << avg;
    std::cerr << std::endl;
}

} // namespace Client
} // namespace GeneticCars
