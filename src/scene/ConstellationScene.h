#pragma once

#include "orbit/CoverageEstimator.h"
#include "orbit/OrbitGeometry.h"

#include <vector>

// Scene units are kilometers with z toward the body's north pole. The whole
// scene is lifted by kVerticalOffsetKm so it does not sit on the axis origin;
// the offset is presentation only and never enters the coverage model.
struct SceneSettings
{
    static constexpr double kVerticalOffsetKm = 500.0;

    OrbitalParameters orbit;
    double inclinationDeg = 0.0;
    CoverageModel coverageModel = CoverageModel::Reference;

    int orbitPathSegments = 200;
    int equatorSamples = 100;
};

struct BodyMesh
{
    std::vector<float> vertices; // xyz triplets, km
    std::vector<unsigned int> indices; // two triangles per quad
};

class ConstellationScene
{
public:
    // Sizes the constellation from the settings.
    // Throws InvalidParameterError if the settings cannot describe an orbit.
    explicit ConstellationScene(const SceneSettings& settings);

    const SceneSettings& settings() const { return settings_; }
    int satelliteCount() const { return satelliteCount_; }
    double orbitRadiusKm() const { return settings_.orbit.orbitRadiusKm(); }
    double inclinationDeg() const { return settings_.inclinationDeg; }
    double bodyRadiusKm() const { return settings_.orbit.bodyRadiusKm; }
    double verticalOffsetKm() const { return SceneSettings::kVerticalOffsetKm; }

    // Marker positions at one orbital phase, offset applied.
    std::vector<SatellitePosition> satellitesAt(double phaseRad) const;

    // Static geometry, offset applied.
    const std::vector<SatellitePosition>& orbitPath() const { return orbitPath_; }
    const std::vector<SatellitePosition>& equatorNorthHalf() const { return equatorNorth_; }
    const std::vector<SatellitePosition>& equatorSouthHalf() const { return equatorSouth_; }

    BodyMesh buildBodyMesh(int stacks, int slices) const;

private:
    void buildEquator();

    SceneSettings settings_;
    int satelliteCount_ = 0;
    std::vector<SatellitePosition> orbitPath_;
    std::vector<SatellitePosition> equatorNorth_;
    std::vector<SatellitePosition> equatorSouth_;
};
