#include "CoverageEstimator.h"

#include "orbit/InvalidParameterError.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace {
constexpr double kPi = 3.141592653589793238462643383279502884;

static double degToRad(double deg)
{
    return deg * (kPi / 180.0);
}

static void validate(const OrbitalParameters& params)
{
    if (!std::isfinite(params.bodyRadiusKm) || !std::isfinite(params.altitudeKm)
        || !std::isfinite(params.fieldOfViewDeg)) {
        throw InvalidParameterError("coverage parameters must be finite");
    }
    if (params.bodyRadiusKm <= 0.0) {
        throw InvalidParameterError("body radius must be positive (got " + std::to_string(params.bodyRadiusKm) + " km)");
    }
    if (params.altitudeKm < 0.0) {
        throw InvalidParameterError("altitude must not be negative (got " + std::to_string(params.altitudeKm) + " km)");
    }
    if (params.orbitRadiusKm() <= 0.0) {
        throw InvalidParameterError("orbit radius must be positive");
    }
    if (params.fieldOfViewDeg <= 0.0 || params.fieldOfViewDeg > 360.0) {
        throw InvalidParameterError(
            "field of view must be in (0, 360] degrees (got " + std::to_string(params.fieldOfViewDeg) + ")");
    }
}

// ceil() of a ratio that must come out finite and positive.
static int ceilCount(double ratio)
{
    if (!std::isfinite(ratio) || ratio <= 0.0) {
        throw InvalidParameterError("coverage ratio is not a finite positive number");
    }
    const double n = std::ceil(ratio);
    if (n > static_cast<double>(std::numeric_limits<int>::max())) {
        throw InvalidParameterError("satellite count overflows");
    }
    return std::max(1, static_cast<int>(n));
}
} // namespace

namespace Coverage {

int estimateSatelliteCount(double bodyRadiusKm, double altitudeKm, double fieldOfViewDeg)
{
    OrbitalParameters params;
    params.bodyRadiusKm = bodyRadiusKm;
    params.altitudeKm = altitudeKm;
    params.fieldOfViewDeg = fieldOfViewDeg;
    return estimateSatelliteCount(params, CoverageModel::Reference);
}

int estimateSatelliteCount(const OrbitalParameters& params, CoverageModel model)
{
    validate(params);

    const double r = params.bodyRadiusKm;
    const double totalSurfaceArea = 4.0 * kPi * r * r;

    if (model == CoverageModel::SphericalCap) {
        // Cap area 2 pi R^2 (1 - cos lambda); the body area divides out.
        const double lambda = capHalfAngleRad(params);
        return ceilCount(2.0 / (1.0 - std::cos(lambda)));
    }

    const double orbitRadius = params.orbitRadiusKm();
    const double coverageArea = params.fieldOfViewDeg / 360.0 * kPi * orbitRadius * orbitRadius;
    return ceilCount(totalSurfaceArea / coverageArea);
}

double capHalfAngleRad(const OrbitalParameters& params)
{
    validate(params);

    const double orbitRadius = params.orbitRadiusKm();
    const double horizon = std::acos(params.bodyRadiusKm / orbitRadius);

    // Nadir half-angle; a full 360 deg sensor still only sees to the horizon.
    const double eta = degToRad(std::min(params.fieldOfViewDeg, 180.0) / 2.0);
    const double s = orbitRadius / params.bodyRadiusKm * std::sin(eta);
    if (s >= 1.0) {
        return horizon;
    }
    return std::min(std::asin(s) - eta, horizon);
}

const char* coverageModelName(CoverageModel model)
{
    switch (model) {
    case CoverageModel::Reference:
        return "reference";
    case CoverageModel::SphericalCap:
        return "cap";
    }
    return "reference";
}

} // namespace Coverage
