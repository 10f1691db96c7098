#include "EvolutionConfig.h"

#include "VehicleDefinition.h"

#include <cmath>

namespace GeneticCars {

Result<std::monostate, EvolutionError> validateEvolutionConfig(const EvolutionConfig& config)
{
    using R = Result<std::monostate, EvolutionError>;
    auto reject = [](const std::string& message) {
        return R::error(EvolutionError::configuration(message));
    };

    if (config.populationSize < 1) {
        return reject("populationSize must be at least 1");
    }
    if (config.numClones < 0 || config.numRandom < 0) {
        return reject("numClones and numRandom must not be negative");
    }
    if (config.numClones + config.numRandom > config.populationSize) {
        return reject(
            "numClones + numRandom (" + std::to_string(config.numClones + config.numRandom)
            + ") exceeds populationSize (" + std::to_string(config.populationSize) + ")");
    }
    if (!std::isfinite(config.crossoverRate) || config.crossoverRate < 0.0
        || config.crossoverRate > 1.0) {
        return reject("crossoverRate must lie in [0, 1]");
    }
    if (config.mutationFlipCount < 0) {
        return reject("mutationFlipCount must not be negative");
    }
    if (config.highScoreCapacity < 1) {
        return reject("highScoreCapacity must be at least 1");
    }
    if (config.selectionPolicy == SelectionPolicy::Tournament && config.tournamentSize < 1) {
        return reject("tournamentSize must be at least 1");
    }
    if (config.maxParallelBreeding < 0) {
        return reject("maxParallelBreeding must not be negative");
    }
    if (config.bodyPointCount < VehicleLimits::MinBodyPoints
        || config.bodyPointCount > VehicleLimits::MaxBodyPoints) {
        return reject(
            "bodyPointCount must lie in [" + std::to_string(VehicleLimits::MinBodyPoints) + ", "
            + std::to_string(VehicleLimits::MaxBodyPoints) + "]");
    }
    if (config.wheelCount < VehicleLimits::MinWheels
        || config.wheelCount > VehicleLimits::MaxWheels) {
        return reject(
            "wheelCount must lie in [" + std::to_string(VehicleLimits::MinWheels) + ", "
            + std::to_string(VehicleLimits::MaxWheels) + "]");
    }
    if (config.crossoverOperator.empty() || config.mutationOperator.empty()) {
        return reject("Operator names must not be empty");
    }
    if (config.operatorModule.has_value() && config.operatorModule->empty()) {
        return reject("operatorModule must not be an empty path");
    }

    return R::okay(std::monostate{});
}

} // namespace GeneticCars
