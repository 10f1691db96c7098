#pragma once

#include "Genome.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>

namespace GeneticCars {

enum class IndividualOrigin : uint8_t {
    Bred = 0,
    Cloned = 1,
    RandomInjection = 2,
};

const char* toString(IndividualOrigin origin);

using IndividualId = uint32_t;

struct Individual {
    IndividualId id = 0; // Position in the generation, 0..P-1.
    Genome genome;
    IndividualOrigin origin = IndividualOrigin::RandomInjection;
    std::optional<double> fitness; // Distance travelled, once reported.
};

void to_json(nlohmann::json& j, const Individual& individual);

} // namespace GeneticCars
