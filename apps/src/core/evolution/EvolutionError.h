#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace GeneticCars {

struct EvolutionError {
    enum class Kind : uint8_t {
        InvalidGenomeLength = 0,
        ConfigurationError = 1,
        OperatorFailure = 2,
        IncompleteGeneration = 3,
        InvalidFitnessReport = 4,
    };

    Kind kind = Kind::ConfigurationError;
    std::string message;

    static EvolutionError invalidGenomeLength(std::string message)
    {
        return EvolutionError{ .kind = Kind::InvalidGenomeLength, .message = std::move(message) };
    }

    static EvolutionError configuration(std::string message)
    {
        return EvolutionError{ .kind = Kind::ConfigurationError, .message = std::move(message) };
    }

    static EvolutionError operatorFailure(std::string message)
    {
        return EvolutionError{ .kind = Kind::OperatorFailure, .message = std::move(message) };
    }

    static EvolutionError incompleteGeneration(std::string message)
    {
        return EvolutionError{ .kind = Kind::IncompleteGeneration, .message = std::move(message) };
    }

    static EvolutionError invalidFitnessReport(std::string message)
    {
        return EvolutionError{ .kind = Kind::InvalidFitnessReport, .message = std::move(message) };
    }

    std::string toString() const;
};

const char* toString(EvolutionError::Kind kind);

} // namespace GeneticCars
