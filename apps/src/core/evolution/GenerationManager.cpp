#include "GenerationManager.h"

#include "GeneticOperators.h"
#include "ParallelFor.h"
#include "RandomStreams.h"
#include "Selection.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <cmath>
#include <exception>

namespace GeneticCars {

namespace {

Result<Genome, EvolutionError> runCrossover(
    const CrossoverOperator& op, const Genome& a, const Genome& b, double rate, std::mt19937& rng)
{
    try {
        Genome offspring = op.crossover(a, b, rate, rng);
        auto check = checkCrossoverResult(a, b, offspring);
        if (check.isError()) {
            return Result<Genome, EvolutionError>::error(
                EvolutionError::operatorFailure(op.name() + ": " + check.errorValue().message));
        }
        return Result<Genome, EvolutionError>::okay(std::move(offspring));
    }
    catch (const std::exception& e) {
        return Result<Genome, EvolutionError>::error(
            EvolutionError::operatorFailure(op.name() + " threw: " + e.what()));
    }
    catch (...) {
        // Converted rather than rethrown: a breeding worker thread must not unwind.
        return Result<Genome, EvolutionError>::error(
            EvolutionError::operatorFailure(op.name() + " threw a non-standard exception"));
    }
}

Result<Genome, EvolutionError> runMutation(
    const MutationOperator& op, const Genome& genome, int flipCount, std::mt19937& rng)
{
    try {
        Genome mutant = op.mutate(genome, flipCount, rng);
        auto check = checkMutationResult(genome, mutant, flipCount);
        if (check.isError()) {
            return Result<Genome, EvolutionError>::error(
                EvolutionError::operatorFailure(op.name() + ": " + check.errorValue().message));
        }
        return Result<Genome, EvolutionError>::okay(std::move(mutant));
    }
    catch (const std::exception& e) {
        return Result<Genome, EvolutionError>::error(
            EvolutionError::operatorFailure(op.name() + " threw: " + e.what()));
    }
    catch (...) {
        // Converted rather than rethrown: a breeding worker thread must not unwind.
        return Result<Genome, EvolutionError>::error(
            EvolutionError::operatorFailure(op.name() + " threw a non-standard exception"));
    }
}

} // namespace

Result<std::unique_ptr<GenerationManager>, EvolutionError> GenerationManager::create(
    const EvolutionConfig& config, uint64_t seed)
{
    using R = Result<std::unique_ptr<GenerationManager>, EvolutionError>;

    auto valid = validateEvolutionConfig(config);
    if (valid.isError()) {
        return R::error(valid.errorValue());
    }

    auto operators = OperatorRegistry::createDefault().bind(config);
    if (operators.isError()) {
        return R::error(operators.errorValue());
    }

    return create(config, seed, std::move(operators.value()));
}

Result<std::unique_ptr<GenerationManager>, EvolutionError> GenerationManager::create(
    const EvolutionConfig& config, uint64_t seed, OperatorSet operators)
{
    using R = Result<std::unique_ptr<GenerationManager>, EvolutionError>;

    auto valid = validateEvolutionConfig(config);
    if (valid.isError()) {
        LOG_ERROR(Config, "Rejected evolution config: {}", valid.errorValue().message);
        return R::error(valid.errorValue());
    }
    if (!operators.crossover || !operators.mutation || !operators.builtInCrossover
        || !operators.builtInMutation) {
        return R::error(EvolutionError::configuration("Operator set is incomplete"));
    }

    for (const auto& warning : operators.warnings) {
        LOG_WARN(Operators, "Operator binding: {}", warning.toString());
    }

    return R::okay(
        std::unique_ptr<GenerationManager>(
            new GenerationManager(config, seed, std::move(operators))));
}

GenerationManager::GenerationManager(
    const EvolutionConfig& config, uint64_t seed, OperatorSet operators)
    : config_(config),
      seed_(seed),
      decoder_(GenomeLayout(config.bodyPointCount, config.wheelCount)),
      operators_(std::move(operators)),
      ledger_(static_cast<size_t>(config.highScoreCapacity))
{
    LOG_INFO(
        Evolution,
        "Evolution engine: population {}, clones {}, random {}, crossover rate {}, flips {}, "
        "genome {} bits, seed {}",
        config_.populationSize,
        config_.numClones,
        config_.numRandom,
        config_.crossoverRate,
        config_.mutationFlipCount,
        decoder_.genomeLength(),
        seed_);

    createInitialPopulation();
}

void GenerationManager::createInitialPopulation()
{
    const auto populationSize = static_cast<size_t>(config_.populationSize);

    generation_ = 1;
    population_.clear();
    population_.reserve(populationSize);
    for (size_t i = 0; i < populationSize; ++i) {
        const auto id = static_cast<IndividualId>(i);
        auto rng = deriveStream(seed_, generation_, id, StreamPurpose::Initial);
        population_.push_back(
            Individual{
                .id = id,
                .genome = Genome::random(decoder_.genomeLength(), rng),
                .origin = IndividualOrigin::RandomInjection,
            });
    }

    phenotypes_ = decodeAll(population_);
    pendingCount_ = populationSize;
    phase_ = GenerationPhase::Evaluating;
}

Result<std::monostate, EvolutionError> GenerationManager::reportFitness(
    IndividualId id, double fitness)
{
    using R = Result<std::monostate, EvolutionError>;

    if (id >= population_.size()) {
        return R::error(
            EvolutionError::invalidFitnessReport(
                "Unknown individual " + std::to_string(id) + " in generation "
                + std::to_string(generation_)));
    }
    if (!std::isfinite(fitness)) {
        return R::error(
            EvolutionError::invalidFitnessReport(
                "Fitness for individual " + std::to_string(id) + " is not finite"));
    }

    Individual& individual = population_[id];
    GENETICCARS_ASSERT(individual.id == id, "Population ids must match their positions");
    if (individual.fitness.has_value()) {
        return R::error(
            EvolutionError::invalidFitnessReport(
                "Individual " + std::to_string(id) + " already has a fitness"));
    }

    individual.fitness = fitness;
    --pendingCount_;
    LOG_DEBUG(
        Evolution,
        "Generation {} individual {} travelled {:.2f} m ({} pending)",
        generation_,
        id,
        fitness,
        pendingCount_);

    return R::okay(std::monostate{});
}

Result<std::vector<IndividualId>, EvolutionError> GenerationManager::ranking() const
{
    if (!isGenerationComplete()) {
        return Result<std::vector<IndividualId>, EvolutionError>::error(
            EvolutionError::incompleteGeneration(
                std::to_string(pendingCount_) + " individuals have no fitness yet"));
    }
    return Result<std::vector<IndividualId>, EvolutionError>::okay(rankByFitness(population_));
}

const VehicleDefinition& GenerationManager::phenotype(IndividualId id) const
{
    GENETICCARS_ASSERT_INDEX(id, phenotypes_.size(), "Phenotype");
    return phenotypes_[id];
}

Result<OperatorFailureReport, EvolutionError> GenerationManager::advance()
{
    using R = Result<OperatorFailureReport, EvolutionError>;

    if (!isGenerationComplete()) {
        return R::error(
            EvolutionError::incompleteGeneration(
                "Generation " + std::to_string(generation_) + " still waits for "
                + std::to_string(pendingCount_) + " fitness reports"));
    }

    phase_ = GenerationPhase::Advancing;

    const auto populationSize = static_cast<size_t>(config_.populationSize);
    const auto cloneCount = static_cast<size_t>(config_.numClones);
    const auto randomCount = static_cast<size_t>(config_.numRandom);
    const size_t bredStart = cloneCount + randomCount;
    GENETICCARS_ASSERT(bredStart <= populationSize, "Quotas exceed the population size");
    GENETICCARS_ASSERT(population_.size() == populationSize, "Population size drifted");

    const std::vector<IndividualId> ranked = rankByFitness(population_);
    const uint32_t nextGeneration = generation_ + 1;

    std::vector<Individual> next(populationSize);

    for (size_t i = 0; i < cloneCount; ++i) {
        const Individual& source = population_[ranked[i % ranked.size()]];
        next[i] = Individual{
            .id = static_cast<IndividualId>(i),
            .genome = source.genome,
            .origin = IndividualOrigin::Cloned,
        };
    }

    for (size_t i = cloneCount; i < bredStart; ++i) {
        const auto id = static_cast<IndividualId>(i);
        auto rng = deriveStream(seed_, nextGeneration, id, StreamPurpose::RandomInjection);
        next[i] = Individual{
            .id = id,
            .genome = Genome::random(decoder_.genomeLength(), rng),
            .origin = IndividualOrigin::RandomInjection,
        };
    }

    const size_t bredCount = populationSize - bredStart;
    std::vector<BreedOutcome> outcomes(bredCount);
    parallelFor(bredCount, config_.maxParallelBreeding, [&](size_t k) {
        outcomes[k] = breed(nextGeneration, static_cast<IndividualId>(bredStart + k), ranked);
    });

    OperatorFailureReport report;
    std::optional<EvolutionError> fatal;
    for (auto& outcome : outcomes) {
        report.crossoverFailures += outcome.crossoverFailures;
        report.mutationFailures += outcome.mutationFailures;
        for (auto& failure : outcome.failures) {
            report.errors.push_back(std::move(failure));
        }
        if (outcome.fatal.has_value() && !fatal.has_value()) {
            fatal = outcome.fatal;
        }
    }

    if (fatal.has_value()) {
        LOG_ERROR(
            Operators,
            "Generation {} not advanced, built-in operator failed: {}",
            generation_,
            fatal->message);
        phase_ = GenerationPhase::Evaluating;
        return R::error(*fatal);
    }

    for (size_t k = 0; k < bredCount; ++k) {
        GENETICCARS_ASSERT(outcomes[k].genome.has_value(), "Breeding produced no genome");
        next[bredStart + k] = Individual{
            .id = static_cast<IndividualId>(bredStart + k),
            .genome = std::move(*outcomes[k].genome),
            .origin = IndividualOrigin::Bred,
        };
    }

    for (size_t i = 0; i < next.size(); ++i) {
        GENETICCARS_ASSERT(next[i].id == i, "Next generation ids must be sequential");
        GENETICCARS_ASSERT(
            next[i].genome.size() == decoder_.genomeLength(),
            "Next generation genome has the wrong length");
    }

    std::vector<VehicleDefinition> nextPhenotypes = decodeAll(next);

    // Commit. Nothing below can fail.
    const uint32_t completedGeneration = generation_;
    const IndividualId bestId = ranked.front();
    const double bestFitness = *population_[bestId].fitness;
    const std::optional<int> championRank =
        ledger_.record(completedGeneration, bestId, bestFitness);

    population_ = std::move(next);
    phenotypes_ = std::move(nextPhenotypes);
    generation_ = nextGeneration;
    pendingCount_ = populationSize;
    phase_ = GenerationPhase::Evaluating;

    LOG_INFO(
        Evolution,
        "Generation {} best {:.2f} m (id {}); generation {} ready",
        completedGeneration,
        bestFitness,
        bestId,
        generation_);
    if (report.total() > 0) {
        LOG_WARN(
            Operators,
            "Generation {}: {} crossover and {} mutation failures recovered by built-ins",
            generation_,
            report.crossoverFailures,
            report.mutationFailures);
    }

    if (observer_) {
        if (championRank.has_value()) {
            observer_->onChampion(completedGeneration, bestId, bestFitness);
        }
        if (report.total() > 0) {
            observer_->onOperatorFailures(generation_, report);
        }
    }
    notifyGenerationAdvanced();

    return R::okay(std::move(report));
}

GenerationManager::BreedOutcome GenerationManager::breed(
    uint32_t nextGeneration, IndividualId childId, const std::vector<IndividualId>& ranked) const
{
    BreedOutcome outcome;

    auto rng = deriveStream(seed_, nextGeneration, childId, StreamPurpose::Breeding);
    const size_t rankA = selectParent(config_, ranked.size(), rng);
    const size_t rankB = selectParent(config_, ranked.size(), rng);
    const Genome& parentA = population_[ranked[rankA]].genome;
    const Genome& parentB = population_[ranked[rankB]].genome;

    // Only built when a first-choice operator fails.
    std::optional<std::mt19937> fallbackRng;
    auto fallbackStream = [&]() -> std::mt19937& {
        if (!fallbackRng.has_value()) {
            fallbackRng = deriveStream(seed_, nextGeneration, childId, StreamPurpose::Fallback);
        }
        return *fallbackRng;
    };

    auto crossed = runCrossover(*operators_.crossover, parentA, parentB, config_.crossoverRate, rng);
    if (crossed.isError()) {
        ++outcome.crossoverFailures;
        outcome.failures.push_back(crossed.errorValue());
        crossed = runCrossover(
            *operators_.builtInCrossover, parentA, parentB, config_.crossoverRate, fallbackStream());
        if (crossed.isError()) {
            outcome.fatal = crossed.errorValue();
            return outcome;
        }
    }

    auto mutated = runMutation(*operators_.mutation, crossed.value(), config_.mutationFlipCount, rng);
    if (mutated.isError()) {
        ++outcome.mutationFailures;
        outcome.failures.push_back(mutated.errorValue());
        mutated = runMutation(
            *operators_.builtInMutation,
            crossed.value(),
            config_.mutationFlipCount,
            fallbackStream());
        if (mutated.isError()) {
            outcome.fatal = mutated.errorValue();
            return outcome;
        }
    }

    outcome.genome = std::move(mutated.value());
    return outcome;
}

std::vector<VehicleDefinition> GenerationManager::decodeAll(
    const std::vector<Individual>& individuals) const
{
    std::vector<VehicleDefinition> definitions(individuals.size());
    parallelFor(individuals.size(), config_.maxParallelBreeding, [&](size_t i) {
        auto decoded = decoder_.decode(individuals[i].genome);
        GENETICCARS_ASSERT(decoded.isValue(), "Engine genome failed to decode");
        definitions[i] = std::move(decoded.value());
    });
    return definitions;
}

void GenerationManager::reseed(uint64_t seed)
{
    LOG_INFO(Evolution, "Reseeding with {}; discarding generation {}", seed, generation_);
    seed_ = seed;
    ledger_.reset();
    createInitialPopulation();
    notifyGenerationAdvanced();
}

void GenerationManager::notifyGenerationAdvanced()
{
    if (observer_) {
        observer_->onGenerationAdvanced(generation_, population_);
    }
}

} // namespace GeneticCars
