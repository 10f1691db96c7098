#include "VehicleDefinition.h"

#include "core/ReflectSerializer.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace GeneticCars {

namespace {

bool inRange(double value, double minValue, double maxValue)
{
    return std::isfinite(value) && value >= minValue && value <= maxValue;
}

double clampFinite(double value, double minValue, double maxValue)
{
    if (std::isnan(value)) {
        return minValue;
    }
    return std::clamp(value, minValue, maxValue);
}

} // namespace

std::pair<double, double> VehicleDefinition::bodyPoint(int index) const
{
    const int count = bodyPointCount();
    const double angle = 2.0 * std::numbers::pi * static_cast<double>(index) / count;
    const double distance = bodyPointDistances.at(static_cast<size_t>(index));
    return { distance * std::cos(angle), distance * std::sin(angle) };
}

Result<std::monostate, std::string> VehicleDefinition::validate() const
{
    using R = Result<std::monostate, std::string>;
    using namespace VehicleLimits;

    if (bodyPointCount() < MinBodyPoints || bodyPointCount() > MaxBodyPoints) {
        return R::error("Body point count " + std::to_string(bodyPointCount()) + " out of range");
    }
    if (wheelCount() < MinWheels || wheelCount() > MaxWheels) {
        return R::error("Wheel count " + std::to_string(wheelCount()) + " out of range");
    }
    if (wheelRadii.size() != wheelAttachments.size()
        || wheelDensities.size() != wheelAttachments.size()) {
        return R::error("Per-wheel fields disagree on the wheel count");
    }

    for (size_t i = 0; i < bodyPointDistances.size(); ++i) {
        if (!inRange(bodyPointDistances[i], MinBodyPointDistance, MaxBodyPointDistance)) {
            return R::error("Body point " + std::to_string(i) + " distance out of range");
        }
    }
    for (size_t i = 0; i < wheelAttachments.size(); ++i) {
        if (wheelAttachments[i] < 0 || wheelAttachments[i] >= bodyPointCount()) {
            return R::error("Wheel " + std::to_string(i) + " attaches to a missing body point");
        }
        if (!inRange(wheelRadii[i], MinWheelRadius, MaxWheelRadius)) {
            return R::error("Wheel " + std::to_string(i) + " radius out of range");
        }
        if (!inRange(wheelDensities[i], MinWheelDensity, MaxWheelDensity)) {
            return R::error("Wheel " + std::to_string(i) + " density out of range");
        }
    }
    if (!inRange(bodyDensity, MinBodyDensity, MaxBodyDensity)) {
        return R::error("Body density out of range");
    }
    if (!inRange(wheelTorque, MinWheelTorque, MaxWheelTorque)) {
        return R::error("Wheel torque out of range");
    }
    if (!inRange(wheelSpeed, MinWheelSpeed, MaxWheelSpeed)) {
        return R::error("Wheel speed out of range");
    }

    return R::okay(std::monostate{});
}

VehicleDefinition VehicleDefinition::clamped() const
{
    using namespace VehicleLimits;

    VehicleDefinition def = *this;
    for (auto& distance : def.bodyPointDistances) {
        distance = clampFinite(distance, MinBodyPointDistance, MaxBodyPointDistance);
    }

    const int points = std::max(def.bodyPointCount(), 1);
    for (auto& attachment : def.wheelAttachments) {
        attachment = ((attachment % points) + points) % points;
    }
    for (auto& radius : def.wheelRadii) {
        radius = clampFinite(radius, MinWheelRadius, MaxWheelRadius);
    }
    for (auto& density : def.wheelDensities) {
        density = clampFinite(density, MinWheelDensity, MaxWheelDensity);
    }
    def.bodyDensity = clampFinite(def.bodyDensity, MinBodyDensity, MaxBodyDensity);
    def.wheelTorque = clampFinite(def.wheelTorque, MinWheelTorque, MaxWheelTorque);
    def.wheelSpeed = clampFinite(def.wheelSpeed, MinWheelSpeed, MaxWheelSpeed);
    return def;
}

void to_json(nlohmann::json& j, const VehicleDefinition& def)
{
    j = ReflectSerializer::to_json(def);
}

void from_json(const nlohmann::json& j, VehicleDefinition& def)
{
    def = ReflectSerializer::from_json<VehicleDefinition>(j);
}

} // namespace GeneticCars
