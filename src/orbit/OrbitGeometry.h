#pragma once

#include <cstddef>
#include <vector>

// Position on the inclined circular orbit, kilometers.
// Frame: x along the ascending node, z toward the body's north pole.
struct SatellitePosition
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

namespace OrbitGeometry {

// Satellites share one orbital plane and are evenly spaced in true anomaly:
//   phi = 2 pi * index / total + phaseOffset
//   x = r cos(phi), y = r sin(phi) cos(i), z = r sin(phi) sin(i)
// As phaseOffsetRad grows the constellation rotates as a rigid ring.
//
// Throws InvalidParameterError when total == 0, index >= total,
// orbitRadiusKm <= 0, or any argument is not finite.
SatellitePosition satellitePosition(
    double inclinationDeg,
    double orbitRadiusKm,
    std::size_t satelliteIndex,
    std::size_t totalSatellites,
    double phaseOffsetRad);

// Same, shifted along z by a scene offset.
SatellitePosition satellitePosition(
    double inclinationDeg,
    double orbitRadiusKm,
    std::size_t satelliteIndex,
    std::size_t totalSatellites,
    double phaseOffsetRad,
    double verticalOffsetKm);

// Every satellite of the ring at one phase, index order, shifted along z by
// verticalOffsetKm.
std::vector<SatellitePosition> constellationPositions(
    double inclinationDeg,
    double orbitRadiusKm,
    std::size_t totalSatellites,
    double phaseOffsetRad,
    double verticalOffsetKm = 0.0);

// In-plane angle of a satellite, wrapped to [0, 2pi).
double orbitalAngle(std::size_t satelliteIndex, std::size_t totalSatellites, double phaseOffsetRad);

// Closed polyline of the orbit: segments + 1 points, first == last.
std::vector<SatellitePosition> sampleOrbitPath(double inclinationDeg, double orbitRadiusKm, int segments);

double wrapTwoPi(double rad);

} // namespace OrbitGeometry
