#include "OrbitGeometry.h"

#include "orbit/InvalidParameterError.h"

#include <cmath>
#include <string>

namespace {
constexpr double kPi = 3.141592653589793238462643383279502884;
constexpr double kTwoPi = 6.283185307179586476925286766559;

static double degToRad(double deg)
{
    return deg * (kPi / 180.0);
}

static void requireFinite(double v, const char* name)
{
    if (!std::isfinite(v)) {
        throw InvalidParameterError(std::string(name) + " must be finite");
    }
}

static void requireOrbitRadius(double orbitRadiusKm)
{
    requireFinite(orbitRadiusKm, "orbit radius");
    if (orbitRadiusKm <= 0.0) {
        throw InvalidParameterError("orbit radius must be positive (got " + std::to_string(orbitRadiusKm) + " km)");
    }
}

static void requireRing(std::size_t satelliteIndex, std::size_t totalSatellites)
{
    if (totalSatellites == 0) {
        throw InvalidParameterError("constellation needs at least one satellite");
    }
    if (satelliteIndex >= totalSatellites) {
        throw InvalidParameterError(
            "satellite index " + std::to_string(satelliteIndex) + " out of range for "
            + std::to_string(totalSatellites) + " satellites");
    }
}

// Point on the circle of radius r in the plane tilted by i about the x axis.
static SatellitePosition onInclinedCircle(double r, double phi, double cosi, double sini)
{
    const double sinPhi = std::sin(phi);

    SatellitePosition p;
    p.x = r * std::cos(phi);
    p.y = r * sinPhi * cosi;
    p.z = r * sinPhi * sini;
    return p;
}
} // namespace

namespace OrbitGeometry {

SatellitePosition satellitePosition(
    double inclinationDeg,
    double orbitRadiusKm,
    std::size_t satelliteIndex,
    std::size_t totalSatellites,
    double phaseOffsetRad)
{
    return satellitePosition(inclinationDeg, orbitRadiusKm, satelliteIndex, totalSatellites, phaseOffsetRad, 0.0);
}

SatellitePosition satellitePosition(
    double inclinationDeg,
    double orbitRadiusKm,
    std::size_t satelliteIndex,
    std::size_t totalSatellites,
    double phaseOffsetRad,
    double verticalOffsetKm)
{
    requireFinite(inclinationDeg, "inclination");
    requireFinite(phaseOffsetRad, "phase offset");
    requireFinite(verticalOffsetKm, "vertical offset");
    requireOrbitRadius(orbitRadiusKm);
    requireRing(satelliteIndex, totalSatellites);

    const double i = degToRad(inclinationDeg);
    const double phiBase = kTwoPi * static_cast<double>(satelliteIndex) / static_cast<double>(totalSatellites);
    const double phi = phiBase + phaseOffsetRad;

    SatellitePosition p = onInclinedCircle(orbitRadiusKm, phi, std::cos(i), std::sin(i));
    p.z += verticalOffsetKm;
    return p;
}

std::vector<SatellitePosition> constellationPositions(
    double inclinationDeg,
    double orbitRadiusKm,
    std::size_t totalSatellites,
    double phaseOffsetRad,
    double verticalOffsetKm)
{
    if (totalSatellites == 0) {
        throw InvalidParameterError("constellation needs at least one satellite");
    }

    std::vector<SatellitePosition> out;
    out.reserve(totalSatellites);
    for (std::size_t s = 0; s < totalSatellites; ++s) {
        out.push_back(
            satellitePosition(inclinationDeg, orbitRadiusKm, s, totalSatellites, phaseOffsetRad, verticalOffsetKm));
    }
    return out;
}

double orbitalAngle(std::size_t satelliteIndex, std::size_t totalSatellites, double phaseOffsetRad)
{
    requireFinite(phaseOffsetRad, "phase offset");
    requireRing(satelliteIndex, totalSatellites);

    const double phiBase = kTwoPi * static_cast<double>(satelliteIndex) / static_cast<double>(totalSatellites);
    return wrapTwoPi(phiBase + phaseOffsetRad);
}

std::vector<SatellitePosition> sampleOrbitPath(double inclinationDeg, double orbitRadiusKm, int segments)
{
    requireFinite(inclinationDeg, "inclination");
    requireOrbitRadius(orbitRadiusKm);

    if (segments < 8) {
        segments = 8;
    }

    const double i = degToRad(inclinationDeg);
    const double cosi = std::cos(i);
    const double sini = std::sin(i);

    std::vector<SatellitePosition> out;
    out.reserve(static_cast<std::size_t>(segments + 1));
    for (int s = 0; s <= segments; ++s) {
        // Last sample lands exactly on phi = 0 again so the strip closes.
        const double t = (s == segments) ? 0.0 : static_cast<double>(s) / static_cast<double>(segments);
        out.push_back(onInclinedCircle(orbitRadiusKm, t * kTwoPi, cosi, sini));
    }
    return out;
}

double wrapTwoPi(double x)
{
    x = std::fmod(x, kTwoPi);
    if (x < 0.0) {
        x += kTwoPi;
    }
    // -tiny + 2pi rounds to 2pi
    if (x >= kTwoPi) {
        x = 0.0;
    }
    return x;
}

} // namespace OrbitGeometry
