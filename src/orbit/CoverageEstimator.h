#pragma once

// Satellite count sizing for single-layer coverage of a spherical body.
// Distances are kilometers, angles are degrees.
struct OrbitalParameters
{
    double bodyRadiusKm = 1737.4;      // Moon
    double altitudeKm = 2000.0;
    double fieldOfViewDeg = 90.0;      // full footprint width

    double orbitRadiusKm() const { return bodyRadiusKm + altitudeKm; }
};

enum class CoverageModel
{
    // Footprint area = (fov / 360) * pi * orbitRadius^2. A sizing heuristic,
    // not a coverage guarantee.
    Reference,
    // Footprint is a spherical cap on the body, horizon limited.
    SphericalCap,
};

namespace Coverage {

// Throws InvalidParameterError for fov outside (0, 360], a non-positive body or
// orbit radius, negative altitude or non-finite input. Result is always >= 1.
//
// Inclination does not enter either model: every inclination yields the same
// count for the same radius/altitude/fov.
int estimateSatelliteCount(double bodyRadiusKm, double altitudeKm, double fieldOfViewDeg);

int estimateSatelliteCount(const OrbitalParameters& params, CoverageModel model = CoverageModel::Reference);

// Earth-central half-angle (radians) of one footprint under the cap model.
double capHalfAngleRad(const OrbitalParameters& params);

const char* coverageModelName(CoverageModel model);

} // namespace Coverage
