#include "GenomeLayout.h"

#include "VehicleDefinition.h"
#include "core/Assert.h"

namespace GeneticCars {

const char* toString(GeneField field)
{
    switch (field) {
        case GeneField::BodyPointDistance:
            return "BodyPointDistance";
        case GeneField::WheelAttachment:
            return "WheelAttachment";
        case GeneField::WheelRadius:
            return "WheelRadius";
        case GeneField::WheelDensity:
            return "WheelDensity";
        case GeneField::BodyDensity:
            return "BodyDensity";
        case GeneField::WheelTorque:
            return "WheelTorque";
        case GeneField::WheelSpeed:
            return "WheelSpeed";
    }
    return "Unknown";
}

GenomeLayout::GenomeLayout(int bodyPointCount, int wheelCount)
    : bodyPointCount_(bodyPointCount), wheelCount_(wheelCount)
{
    using namespace VehicleLimits;

    GENETICCARS_ASSERT(
        bodyPointCount >= MinBodyPoints && bodyPointCount <= MaxBodyPoints,
        "GenomeLayout: body point count out of range");
    GENETICCARS_ASSERT(
        wheelCount >= MinWheels && wheelCount <= MaxWheels,
        "GenomeLayout: wheel count out of range");

    for (int i = 0; i < bodyPointCount_; ++i) {
        append(
            GeneField::BodyPointDistance,
            i,
            DistanceBits,
            MinBodyPointDistance,
            MaxBodyPointDistance,
            FieldCurve::Linear);
    }

    const size_t indexBits = attachmentBits(bodyPointCount_);
    for (int i = 0; i < wheelCount_; ++i) {
        append(
            GeneField::WheelAttachment,
            i,
            indexBits,
            0.0,
            static_cast<double>(bodyPointCount_),
            FieldCurve::Modulo);
    }
    for (int i = 0; i < wheelCount_; ++i) {
        append(
            GeneField::WheelRadius,
            i,
            WheelRadiusBits,
            MinWheelRadius,
            MaxWheelRadius,
            FieldCurve::Linear);
    }
    for (int i = 0; i < wheelCount_; ++i) {
        append(
            GeneField::WheelDensity,
            i,
            WheelDensityBits,
            MinWheelDensity,
            MaxWheelDensity,
            FieldCurve::SquareRoot);
    }

    append(
        GeneField::BodyDensity,
        0,
        BodyDensityBits,
        MinBodyDensity,
        MaxBodyDensity,
        FieldCurve::SquareRoot);
    append(GeneField::WheelTorque, 0, TorqueBits, MinWheelTorque, MaxWheelTorque, FieldCurve::Linear);
    append(GeneField::WheelSpeed, 0, SpeedBits, MinWheelSpeed, MaxWheelSpeed, FieldCurve::Linear);
}

GenomeLayout GenomeLayout::standard()
{
    return GenomeLayout(DefaultBodyPointCount, DefaultWheelCount);
}

size_t GenomeLayout::attachmentBits(int bodyPointCount)
{
    // ceil(log2(n)), at least one bit.
    size_t bits = 1;
    while ((size_t{ 1 } << bits) < static_cast<size_t>(bodyPointCount)) {
        ++bits;
    }
    return bits;
}

const FieldSpec& GenomeLayout::field(GeneField kind, int index) const
{
    for (const auto& spec : fields_) {
        if (spec.field == kind && spec.index == index) {
            return spec;
        }
    }
    GENETICCARS_ASSERT(false, "GenomeLayout: no such field");
    return fields_.front();
}

void GenomeLayout::append(
    GeneField kind, int index, size_t width, double min, double max, FieldCurve curve)
{
    fields_.push_back(
        FieldSpec{
            .field = kind,
            .index = index,
            .offset = bitCount_,
            .width = width,
            .min = min,
            .max = max,
            .curve = curve,
        });
    bitCount_ += width;
}

} // namespace GeneticCars
