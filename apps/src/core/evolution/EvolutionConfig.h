#pragma once

#include "EvolutionError.h"
#include "core/ReflectSerializer.h"
#include "core/Result.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace GeneticCars {

enum class SelectionPolicy : uint8_t {
    Tournament = 0,       // Best-ranked of `tournamentSize` uniform draws.
    RankProportional = 1, // Weight P - rank.
};

/**
 * Configuration for one evolution run. Loaded from evolution.json and validated once by
 * validateEvolutionConfig() before it reaches the GenerationManager.
 */
struct EvolutionConfig {
    int populationSize = 20;
    int numClones = 2;       // Top-ranked individuals copied unchanged.
    int numRandom = 2;       // Fresh random genomes injected each generation.
    double crossoverRate = 0.4;
    int mutationFlipCount = 3;
    int highScoreCapacity = 20;

    SelectionPolicy selectionPolicy = SelectionPolicy::Tournament;
    int tournamentSize = 3;
    int maxParallelBreeding = 0; // 0 = auto (use detected core count).

    // Vehicle shape; fixes the genome length for the run.
    int bodyPointCount = 8;
    int wheelCount = 2;

    // Built-in operator names (see OperatorRegistry) and an optional shared library that
    // overrides either role.
    std::string crossoverOperator = "PointCrossover";
    std::string mutationOperator = "BitFlip";
    std::optional<std::string> operatorModule;
};

Result<std::monostate, EvolutionError> validateEvolutionConfig(const EvolutionConfig& config);

inline void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    config = ReflectSerializer::from_json<EvolutionConfig>(j);
}

} // namespace GeneticCars
