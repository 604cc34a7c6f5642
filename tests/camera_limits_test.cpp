#include <gtest/gtest.h>

#include "scene/CameraLimits.h"

namespace {

// Scene extent in body radii for a ring at the given altitude above the Moon,
// including the 500 km lift.
double lunarExtent(double altitudeKm)
{
    return (1737.4 + altitudeKm + 500.0) / 1737.4;
}

TEST(CameraLimitsTest, DefaultLunarScene)
{
    const CameraLimits limits = cameraLimitsForScene(lunarExtent(2000.0));
    EXPECT_FLOAT_EQ(limits.minDistance, 1.5f);
    EXPECT_NEAR(limits.startDistance, 3.0 * lunarExtent(2000.0), 1e-4);
    EXPECT_NEAR(limits.maxDistance, 10.0 * lunarExtent(2000.0), 1e-4);
}

// 100000 km altitude: r/R ~ 58.8. The far side of the ring must stay inside
// the far plane and zooming must not snap the eye inside the ring.
TEST(CameraLimitsTest, HighOrbitStaysInsideClipRange)
{
    const double extent = lunarExtent(100000.0);
    const CameraLimits limits = cameraLimitsForScene(extent);

    EXPECT_GT(limits.startDistance, extent);
    EXPECT_GT(limits.farPlane(limits.startDistance), limits.startDistance + extent);
    EXPECT_GT(limits.farPlane(limits.maxDistance), limits.maxDistance + extent);
    EXPECT_LT(limits.nearPlane(limits.startDistance), limits.startDistance - extent);

    // One wheel step out from the start position keeps the zoom.
    const float zoomedOut = limits.clampDistance(limits.startDistance / 0.9f);
    EXPECT_GT(zoomedOut, limits.startDistance);
    EXPECT_GT(limits.clampDistance(60.0f), 50.0f);
}

TEST(CameraLimitsTest, ClampDistance)
{
    const CameraLimits limits = cameraLimitsForScene(2.0);
    EXPECT_FLOAT_EQ(limits.clampDistance(0.1f), limits.minDistance);
    EXPECT_FLOAT_EQ(limits.clampDistance(1000.0f), limits.maxDistance);
    EXPECT_FLOAT_EQ(limits.clampDistance(5.0f), 5.0f);
}

TEST(CameraLimitsTest, ExtentNeverBelowBody)
{
    const CameraLimits limits = cameraLimitsForScene(0.2);
    EXPECT_FLOAT_EQ(limits.sceneExtent, 1.0f);
    EXPECT_GE(limits.maxDistance, limits.minDistance);
    EXPECT_GE(limits.startDistance, limits.minDistance);
    EXPECT_LE(limits.startDistance, limits.maxDistance);
}

} // namespace
