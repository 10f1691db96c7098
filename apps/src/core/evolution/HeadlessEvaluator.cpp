#include "HeadlessEvaluator.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace GeneticCars {

namespace {
constexpr double Gravity = 9.8;         // m/s^2
constexpr double RunDistance = 20.0;    // m of acceleration before top speed matters.
constexpr double SpeedScale = 25.0;     // m/s giving ~63% of the track.
constexpr double TopplePenalty = 0.1;   // Drive share of a wheel above the body centre.
constexpr double ClimbFriction = 0.3;   // Fraction of weight resisting the drive force.
} // namespace

HeadlessEvaluator::HeadlessEvaluator(double trackLength) : trackLength_(trackLength)
{}

double HeadlessEvaluator::bodyArea(const VehicleDefinition& def) const
{
    const int count = def.bodyPointCount();
    if (count < 3) {
        return 0.0;
    }

    // Fan of triangles around the centre.
    const double wedge = std::sin(2.0 * std::numbers::pi / count);
    double area = 0.0;
    for (int i = 0; i < count; ++i) {
        const double r0 = def.bodyPointDistances[static_cast<size_t>(i)];
        const double r1 = def.bodyPointDistances[static_cast<size_t>((i + 1) % count)];
        area += 0.5 * r0 * r1 * wedge;
    }
    return area;
}

double HeadlessEvaluator::totalMass(const VehicleDefinition& def) const
{
    double mass = bodyArea(def) * def.bodyDensity;
    for (int i = 0; i < def.wheelCount(); ++i) {
        const double radius = def.wheelRadii[static_cast<size_t>(i)];
        mass += std::numbers::pi * radius * radius * def.wheelDensities[static_cast<size_t>(i)];
    }
    return mass;
}

double HeadlessEvaluator::evaluate(const VehicleDefinition& def) const
{
    const double mass = totalMass(def);
    if (mass <= 0.0 || def.wheelCount() == 0) {
        return 0.0;
    }

    const double wheelSpeedRad = def.wheelSpeed * std::numbers::pi / 180.0;
    double driveForce = 0.0;
    double topSpeed = 0.0;
    for (int i = 0; i < def.wheelCount(); ++i) {
        const double y = def.bodyPoint(def.wheelAttachments[static_cast<size_t>(i)]).second;
        const double radius = def.wheelRadii[static_cast<size_t>(i)];
        topSpeed = std::max(topSpeed, wheelSpeedRad * radius);
        // Wheels on the upper half only touch the ground once the car has rolled over.
        const double contact = y <= 0.0 ? 1.0 : TopplePenalty;
        driveForce += contact * def.wheelTorque / radius;
    }

    const double netForce = std::max(0.0, driveForce - ClimbFriction * mass * Gravity);
    const double accelSpeed = std::sqrt(2.0 * (netForce / mass) * RunDistance);
    const double speed = std::min(accelSpeed, topSpeed);

    return trackLength_ * (1.0 - std::exp(-speed / SpeedScale));
}

} // namespace GeneticCars
