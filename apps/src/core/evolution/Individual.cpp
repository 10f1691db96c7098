#include "Individual.h"

#include <nlohmann/json.hpp>

namespace GeneticCars {

const char* toString(IndividualOrigin origin)
{
    switch (origin) {
        case IndividualOrigin::Bred:
            return "Bred";
        case IndividualOrigin::Cloned:
            return "Cloned";
        case IndividualOrigin::RandomInjection:
            return "RandomInjection";
    }
    return "Unknown";
}

void to_json(nlohmann::json& j, const Individual& individual)
{
    j = nlohmann::json{
        { "id", individual.id },
        { "origin", toString(individual.origin) },
        { "genome", individual.genome },
    };
    if (individual.fitness.has_value()) {
        j["fitness"] = *individual.fitness;
    }
}

} // namespace GeneticCars
