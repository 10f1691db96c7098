#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace GeneticCars {

enum class GeneField : uint8_t {
    BodyPointDistance = 0,
    WheelAttachment = 1,
    WheelRadius = 2,
    WheelDensity = 3,
    BodyDensity = 4,
    WheelTorque = 5,
    WheelSpeed = 6,
};

// How the raw field value is mapped into its range.
enum class FieldCurve : uint8_t {
    Linear = 0,
    SquareRoot = 1, // min + (max - min) * sqrt(fraction); denser towards max.
    Modulo = 2,     // Integer index wrapped into [min, max).
};

const char* toString(GeneField field);

struct FieldSpec {
    GeneField field = GeneField::BodyPointDistance;
    int index = 0; // Which body point or wheel; 0 for scalar fields.
    size_t offset = 0;
    size_t width = 0;
    double min = 0.0;
    double max = 0.0;
    FieldCurve curve = FieldCurve::Linear;
};

/**
 * Bit-level schema of a vehicle genome.
 *
 * Fields are laid out back to back in the order: body point distances, wheel attachments,
 * wheel radii, wheel densities, body density, wheel torque, wheel speed. The genome length is
 * the sum of all field widths.
 */
class GenomeLayout {
public:
    static constexpr size_t DistanceBits = 8;
    static constexpr size_t WheelRadiusBits = 8;
    static constexpr size_t WheelDensityBits = 8;
    static constexpr size_t BodyDensityBits = 8;
    static constexpr size_t TorqueBits = 10;
    static constexpr size_t SpeedBits = 10;

    static constexpr int DefaultBodyPointCount = 8;
    static constexpr int DefaultWheelCount = 2;

    // Counts must lie inside VehicleLimits; callers validate first.
    GenomeLayout(int bodyPointCount, int wheelCount);

    static GenomeLayout standard();

    // Bits needed to address any body point.
    static size_t attachmentBits(int bodyPointCount);

    int bodyPointCount() const { return bodyPointCount_; }
    int wheelCount() const { return wheelCount_; }
    size_t bitCount() const { return bitCount_; }
    const std::vector<FieldSpec>& fields() const { return fields_; }

    const FieldSpec& field(GeneField kind, int index = 0) const;

private:
    void append(GeneField kind, int index, size_t width, double min, double max, FieldCurve curve);

    int bodyPointCount_ = DefaultBodyPointCount;
    int wheelCount_ = DefaultWheelCount;
    size_t bitCount_ = 0;
    std::vector<FieldSpec> fields_;
};

} // namespace GeneticCars
