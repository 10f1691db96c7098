#pragma once

#include "EvolutionError.h"
#include "GenomeLayout.h"
#include "VehicleDefinition.h"
#include "core/Result.h"

#include <cstdint>

namespace GeneticCars {

class Genome;

/**
 * Maps genomes onto vehicle definitions using a fixed GenomeLayout.
 *
 * Decoding is pure: the same genome always yields the same definition, and every
 * correct-length genome decodes to a definition that passes VehicleDefinition::validate().
 */
class PhenotypeDecoder {
public:
    explicit PhenotypeDecoder(GenomeLayout layout);

    const GenomeLayout& layout() const { return layout_; }
    size_t genomeLength() const { return layout_.bitCount(); }

    Result<VehicleDefinition, EvolutionError> decode(const Genome& genome) const;

    // Raw field bits to a value inside [spec.min, spec.max].
    static double mapField(const FieldSpec& spec, uint64_t raw);

private:
    GenomeLayout layout_;
};

} // namespace GeneticCars
