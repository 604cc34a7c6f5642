#include "ConstellationScene.h"

#include "orbit/InvalidParameterError.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kPi = 3.141592653589793238462643383279502884;
}

ConstellationScene::ConstellationScene(const SceneSettings& settings)
    : settings_(settings)
{
    if (!std::isfinite(settings_.inclinationDeg)) {
        throw InvalidParameterError("inclination must be finite");
    }

    satelliteCount_ = Coverage::estimateSatelliteCount(settings_.orbit, settings_.coverageModel);

    orbitPath_ = OrbitGeometry::sampleOrbitPath(settings_.inclinationDeg, orbitRadiusKm(), settings_.orbitPathSegments);
    for (auto& p : orbitPath_) {
        p.z += verticalOffsetKm();
    }

    buildEquator();
}

std::vector<SatellitePosition> ConstellationScene::satellitesAt(double phaseRad) const
{
    return OrbitGeometry::constellationPositions(
        settings_.inclinationDeg,
        orbitRadiusKm(),
        static_cast<size_t>(satelliteCount_),
        phaseRad,
        verticalOffsetKm());
}

void ConstellationScene::buildEquator()
{
    // Two half circles y = +/- sqrt(R^2 - x^2) swept along x.
    const int n = std::max(2, settings_.equatorSamples);
    const double r = bodyRadiusKm();

    equatorNorth_.clear();
    equatorSouth_.clear();
    equatorNorth_.reserve(static_cast<size_t>(n));
    equatorSouth_.reserve(static_cast<size_t>(n));
    for (int k = 0; k < n; ++k) {
        const double x = -r + 2.0 * r * static_cast<double>(k) / static_cast<double>(n - 1);
        const double y = std::sqrt(std::max(0.0, r * r - x * x));

        SatellitePosition a;
        a.x = x;
        a.y = y;
        a.z = verticalOffsetKm();
        equatorNorth_.push_back(a);

        SatellitePosition b = a;
        b.y = -y;
        equatorSouth_.push_back(b);
    }
}

BodyMesh ConstellationScene::buildBodyMesh(int stacks, int slices) const
{
    stacks = std::max(8, stacks);
    slices = std::max(8, slices);

    const double radius = bodyRadiusKm();
    const double zOffset = verticalOffsetKm();

    BodyMesh mesh;
    mesh.vertices.reserve(static_cast<size_t>((stacks + 1) * (slices + 1) * 3));
    for (int i = 0; i <= stacks; ++i) {
        const double v = static_cast<double>(i) / static_cast<double>(stacks);
        const double phi = v * kPi; // polar angle 0..pi

        const double sinPhi = std::sin(phi);
        const double cosPhi = std::cos(phi);

        for (int j = 0; j <= slices; ++j) {
            const double u = static_cast<double>(j) / static_cast<double>(slices);
            const double theta = u * (2.0 * kPi);

            mesh.vertices.push_back(static_cast<float>(radius * sinPhi * std::cos(theta)));
            mesh.vertices.push_back(static_cast<float>(radius * sinPhi * std::sin(theta)));
            mesh.vertices.push_back(static_cast<float>(radius * cosPhi + zOffset));
        }
    }

    mesh.indices.reserve(static_cast<size_t>(stacks * slices * 6));
    const int stride = slices + 1;
    for (int i = 0; i < stacks; ++i) {
        for (int j = 0; j < slices; ++j) {
            const unsigned int i0 = static_cast<unsigned int>(i * stride + j);
            const unsigned int i1 = static_cast<unsigned int>((i + 1) * stride + j);
            const unsigned int i2 = static_cast<unsigned int>((i + 1) * stride + (j + 1));
            const unsigned int i3 = static_cast<unsigned int>(i * stride + (j + 1));

            mesh.indices.push_back(i0);
            mesh.indices.push_back(i1);
            mesh.indices.push_back(i2);

            mesh.indices.push_back(i0);
            mesh.indices.push_back(i2);
            mesh.indices.push_back(i3);
        }
    }

    return mesh;
}
