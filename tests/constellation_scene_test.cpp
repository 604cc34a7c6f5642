#include <gtest/gtest.h>

#include "orbit/InvalidParameterError.h"
#include "orbit/OrbitGeometry.h"
#include "scene/ConstellationScene.h"
#include "scene/PhaseClock.h"

#include <cmath>
#include <limits>

namespace {

SceneSettings lunarSettings(double inclinationDeg)
{
    SceneSettings s;
    s.orbit.bodyRadiusKm = 1737.4;
    s.orbit.altitudeKm = 2000.0;
    s.orbit.fieldOfViewDeg = 90.0;
    s.inclinationDeg = inclinationDeg;
    return s;
}

class ConstellationSceneTest : public ::testing::Test
{
protected:
    ConstellationScene scene{lunarSettings(45.0)};
};

// Inclination 45, altitude 2000, Moon radius, 90 deg sensor: four satellites,
// the first at (r, 0, offset) on frame zero.
TEST_F(ConstellationSceneTest, LunarEndToEnd)
{
    ASSERT_EQ(scene.satelliteCount(), 4);
    EXPECT_DOUBLE_EQ(scene.orbitRadiusKm(), 3737.4);
    EXPECT_DOUBLE_EQ(scene.verticalOffsetKm(), 500.0);

    PhaseClock clock;
    const auto sats = scene.satellitesAt(clock.phaseRad());
    ASSERT_EQ(sats.size(), 4u);
    EXPECT_DOUBLE_EQ(sats[0].x, 3737.4);
    EXPECT_DOUBLE_EQ(sats[0].y, 0.0);
    EXPECT_DOUBLE_EQ(sats[0].z, 500.0);
}

TEST_F(ConstellationSceneTest, CountIgnoresInclination)
{
    for (double inclination : {0.0, 30.0, 90.0, 135.0, 180.0}) {
        ConstellationScene other(lunarSettings(inclination));
        EXPECT_EQ(other.satelliteCount(), scene.satelliteCount()) << inclination;
    }
}

TEST_F(ConstellationSceneTest, MarkersAdvanceWithPhase)
{
    PhaseClock clock(100);
    const auto before = scene.satellitesAt(clock.phaseRad());
    clock.advance();
    const auto after = scene.satellitesAt(clock.phaseRad());

    ASSERT_EQ(before.size(), after.size());
    EXPECT_NE(before[0].x, after[0].x);

    // Each marker stays on the offset orbit sphere.
    for (const auto& p : after) {
        const double dz = p.z - scene.verticalOffsetKm();
        EXPECT_NEAR(std::sqrt(p.x * p.x + p.y * p.y + dz * dz), scene.orbitRadiusKm(), 1e-6);
    }
}

TEST_F(ConstellationSceneTest, OrbitPathIsOffset)
{
    const auto& path = scene.orbitPath();
    ASSERT_EQ(path.size(), 201u);
    EXPECT_DOUBLE_EQ(path.front().x, scene.orbitRadiusKm());
    EXPECT_DOUBLE_EQ(path.front().z, scene.verticalOffsetKm());
}

TEST_F(ConstellationSceneTest, EquatorHalvesSpanTheBody)
{
    const auto& north = scene.equatorNorthHalf();
    const auto& south = scene.equatorSouthHalf();
    ASSERT_EQ(north.size(), 100u);
    ASSERT_EQ(south.size(), 100u);

    EXPECT_NEAR(north.front().x, -scene.bodyRadiusKm(), 1e-9);
    EXPECT_NEAR(north.back().x, scene.bodyRadiusKm(), 1e-9);
    for (std::size_t k = 0; k < north.size(); ++k) {
        EXPECT_GE(north[k].y, 0.0);
        EXPECT_DOUBLE_EQ(south[k].y, -north[k].y);
        EXPECT_DOUBLE_EQ(north[k].z, scene.verticalOffsetKm());
        EXPECT_NEAR(std::hypot(north[k].x, north[k].y), scene.bodyRadiusKm(), 1e-6);
    }
}

TEST_F(ConstellationSceneTest, BodyMeshIsOffsetSphere)
{
    const BodyMesh mesh = scene.buildBodyMesh(16, 32);
    ASSERT_EQ(mesh.vertices.size(), static_cast<size_t>(17 * 33 * 3));
    ASSERT_EQ(mesh.indices.size(), static_cast<size_t>(16 * 32 * 6));

    for (size_t k = 0; k < mesh.vertices.size(); k += 3) {
        const double x = mesh.vertices[k];
        const double y = mesh.vertices[k + 1];
        const double z = mesh.vertices[k + 2] - scene.verticalOffsetKm();
        EXPECT_NEAR(std::sqrt(x * x + y * y + z * z), scene.bodyRadiusKm(), 0.01);
    }

    const unsigned int vertexCount = static_cast<unsigned int>(mesh.vertices.size() / 3);
    for (unsigned int idx : mesh.indices) {
        EXPECT_LT(idx, vertexCount);
    }
}

TEST(ConstellationSceneErrors, RejectsZeroFieldOfView)
{
    SceneSettings s = lunarSettings(45.0);
    s.orbit.fieldOfViewDeg = 0.0;
    EXPECT_THROW(ConstellationScene{s}, InvalidParameterError);
}

TEST(ConstellationSceneErrors, RejectsNonFiniteInclination)
{
    EXPECT_THROW(ConstellationScene{lunarSettings(std::numeric_limits<double>::quiet_NaN())}, InvalidParameterError);
}

TEST(ConstellationSceneModels, CapModelSizesFromCap)
{
    SceneSettings s = lunarSettings(45.0);
    s.coverageModel = CoverageModel::SphericalCap;
    ConstellationScene scene(s);
    EXPECT_EQ(scene.satelliteCount(), 4);
}

TEST(ConstellationSceneLayout, SatellitesUseLiftedRing)
{
    ConstellationScene scene(lunarSettings(45.0));
    const auto markers = scene.satellitesAt(0.7);
    const auto expected = OrbitGeometry::constellationPositions(
        45.0, scene.orbitRadiusKm(), static_cast<std::size_t>(scene.satelliteCount()), 0.7,
        SceneSettings::kVerticalOffsetKm);
    ASSERT_EQ(markers.size(), expected.size());
    for (std::size_t s = 0; s < markers.size(); ++s) {
        EXPECT_DOUBLE_EQ(markers[s].x, expected[s].x);
        EXPECT_DOUBLE_EQ(markers[s].y, expected[s].y);
        EXPECT_DOUBLE_EQ(markers[s].z, expected[s].z);
    }
}

} // namespace
