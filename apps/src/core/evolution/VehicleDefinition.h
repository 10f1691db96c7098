#pragma once

#include "core/Result.h"

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace GeneticCars {

// Declared ranges for every decoded vehicle parameter.
namespace VehicleLimits {
inline constexpr int MinBodyPoints = 3;
inline constexpr int MaxBodyPoints = 16;
inline constexpr int MinWheels = 1;
inline constexpr int MaxWheels = 8;

inline constexpr double MinBodyPointDistance = 0.5; // m
inline constexpr double MaxBodyPointDistance = 3.0;
inline constexpr double MinWheelRadius = 0.2; // m
inline constexpr double MaxWheelRadius = 1.5;
inline constexpr double MinWheelDensity = 10.0; // kg/m^2
inline constexpr double MaxWheelDensity = 100.0;
inline constexpr double MinBodyDensity = 10.0; // kg/m^2
inline constexpr double MaxBodyDensity = 100.0;
inline constexpr double MinWheelTorque = 10.0; // N m
inline constexpr double MaxWheelTorque = 600.0;
inline constexpr double MinWheelSpeed = 90.0; // deg/s
inline constexpr double MaxWheelSpeed = 1080.0;
} // namespace VehicleLimits

/**
 * Decoded vehicle parameters handed to the simulation harness.
 *
 * The body is a polygon whose vertices sit at bodyPointDistances[i] from the centre,
 * spaced evenly by angle starting at 0 degrees. Each wheel hangs off the body vertex named
 * by wheelAttachments[i]; several wheels may share a vertex.
 */
struct VehicleDefinition {
    std::vector<double> bodyPointDistances;
    std::vector<int> wheelAttachments;
    std::vector<double> wheelRadii;
    std::vector<double> wheelDensities;
    double bodyDensity = VehicleLimits::MinBodyDensity;
    double wheelTorque = VehicleLimits::MinWheelTorque;
    double wheelSpeed = VehicleLimits::MinWheelSpeed; // Degrees per second.

    int bodyPointCount() const { return static_cast<int>(bodyPointDistances.size()); }
    int wheelCount() const { return static_cast<int>(wheelAttachments.size()); }

    // Vertex position relative to the body centre.
    std::pair<double, double> bodyPoint(int index) const;

    // Checks counts and that every field lies inside VehicleLimits.
    Result<std::monostate, std::string> validate() const;

    // Copy with every numeric field forced back into range and attachments wrapped.
    VehicleDefinition clamped() const;

    bool operator==(const VehicleDefinition& other) const = default;
};

void to_json(nlohmann::json& j, const VehicleDefinition& def);
void from_json(const nlohmann::json& j, VehicleDefinition& def);

} // namespace GeneticCars
