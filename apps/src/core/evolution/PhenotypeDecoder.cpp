#include "PhenotypeDecoder.h"

#include "Genome.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <cmath>

namespace GeneticCars {

PhenotypeDecoder::PhenotypeDecoder(GenomeLayout layout) : layout_(std::move(layout))
{}

double PhenotypeDecoder::mapField(const FieldSpec& spec, uint64_t raw)
{
    if (spec.curve == FieldCurve::Modulo) {
        const auto span = static_cast<uint64_t>(spec.max - spec.min);
        if (span == 0) {
            return spec.min;
        }
        return spec.min + static_cast<double>(raw % span);
    }

    const double maxRaw = std::ldexp(1.0, static_cast<int>(spec.width)) - 1.0;
    double fraction = maxRaw > 0.0 ? static_cast<double>(raw) / maxRaw : 0.0;
    fraction = std::clamp(fraction, 0.0, 1.0);
    if (spec.curve == FieldCurve::SquareRoot) {
        fraction = std::sqrt(fraction);
    }

    // Re-clamp so rounding can never push a value outside its declared range.
    return std::clamp(spec.min + (spec.max - spec.min) * fraction, spec.min, spec.max);
}

Result<VehicleDefinition, EvolutionError> PhenotypeDecoder::decode(const Genome& genome) const
{
    if (genome.size() != layout_.bitCount()) {
        LOG_WARN(
            Phenotype,
            "Genome length {} does not match layout length {}",
            genome.size(),
            layout_.bitCount());
        return Result<VehicleDefinition, EvolutionError>::error(
            EvolutionError::invalidGenomeLength(
                "Expected " + std::to_string(layout_.bitCount()) + " bits, got "
                + std::to_string(genome.size())));
    }

    VehicleDefinition def;
    def.bodyPointDistances.resize(static_cast<size_t>(layout_.bodyPointCount()));
    def.wheelAttachments.resize(static_cast<size_t>(layout_.wheelCount()));
    def.wheelRadii.resize(static_cast<size_t>(layout_.wheelCount()));
    def.wheelDensities.resize(static_cast<size_t>(layout_.wheelCount()));

    for (const auto& spec : layout_.fields()) {
        const double value = mapField(spec, genome.extract(spec.offset, spec.width));
        const auto index = static_cast<size_t>(spec.index);
        switch (spec.field) {
            case GeneField::BodyPointDistance:
                def.bodyPointDistances[index] = value;
                break;
            case GeneField::WheelAttachment:
                def.wheelAttachments[index] = static_cast<int>(value);
                break;
            case GeneField::WheelRadius:
                def.wheelRadii[index] = value;
                break;
            case GeneField::WheelDensity:
                def.wheelDensities[index] = value;
                break;
            case GeneField::BodyDensity:
                def.bodyDensity = value;
                break;
            case GeneField::WheelTorque:
                def.wheelTorque = value;
                break;
            case GeneField::WheelSpeed:
                def.wheelSpeed = value;
                break;
        }
    }

    LOG_TRACE(
        Phenotype,
        "Decoded vehicle: {} body points, {} wheels, torque {:.1f}, speed {:.1f}",
        def.bodyPointCount(),
        def.wheelCount(),
        def.wheelTorque,
        def.wheelSpeed);

    // Field mapping already lands in range; the clamp pass is the post-decode validation
    // every definition goes through before it reaches the harness.
    return Result<VehicleDefinition, EvolutionError>::okay(def.clamped());
}

} // namespace GeneticCars
