#include "CameraLimits.h"

#include <algorithm>

namespace {
constexpr float kClosestApproach = 1.5f; // body radii from the origin
}

float CameraLimits::clampDistance(float distance) const
{
    return std::max(minDistance, std::min(maxDistance, distance));
}

float CameraLimits::nearPlane(float distance) const
{
    return std::max(0.01f, distance * 0.001f);
}

float CameraLimits::farPlane(float distance) const
{
    // Far side of the ring is at most distance + extent from the eye.
    return distance + 2.0f * sceneExtent;
}

CameraLimits cameraLimitsForScene(double sceneExtent)
{
    CameraLimits limits;
    limits.sceneExtent = std::max(1.0f, static_cast<float>(sceneExtent));
    limits.minDistance = kClosestApproach;
    limits.maxDistance = std::max(kClosestApproach, 10.0f * limits.sceneExtent);
    limits.startDistance = limits.clampDistance(3.0f * limits.sceneExtent);
    return limits;
}
