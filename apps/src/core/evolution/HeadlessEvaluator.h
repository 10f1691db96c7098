#pragma once

#include "VehicleDefinition.h"

namespace GeneticCars {

/**
 * Closed-form stand-in for the physics harness, used by the CLI and tests.
 *
 * Scores a vehicle from its mass, the drive force of wheels mounted on the lower half of
 * the body, and the wheels' top speed. The score saturates towards the track length. It is
 * deterministic and cheap; it is not a physics simulation.
 */
class HeadlessEvaluator {
public:
    static constexpr double DefaultTrackLength = 300.0; // m

    explicit HeadlessEvaluator(double trackLength = DefaultTrackLength);

    // Distance in metres, in [0, trackLength).
    double evaluate(const VehicleDefinition& def) const;

    double bodyArea(const VehicleDefinition& def) const;
    double totalMass(const VehicleDefinition& def) const;

    double trackLength() const { return trackLength_; }

private:
    double trackLength_;
};

} // namespace GeneticCars
