#include "EvolutionError.h"

namespace GeneticCars {

const char* toString(EvolutionError::Kind kind)
{
    switch (kind) {
        case EvolutionError::Kind::InvalidGenomeLength:
            return "InvalidGenomeLength";
        case EvolutionError::Kind::ConfigurationError:
            return "ConfigurationError";
        case EvolutionError::Kind::OperatorFailure:
            return "OperatorFailure";
        case EvolutionError::Kind::IncompleteGeneration:
            return "IncompleteGeneration";
        case EvolutionError::Kind::InvalidFitnessReport:
            return "InvalidFitnessReport";
    }
    return "Unknown";
}

std::string EvolutionError::toString() const
{
    return std::string(GeneticCars::toString(kind)) + ": " + message;
}

} // namespace GeneticCars
