#pragma once

// Orbit-camera bounds scaled to the scene. sceneExtent is the distance from the
// origin to the farthest drawn point (orbit radius plus vertical offset), in
// render units; the body itself has radius 1.
struct CameraLimits
{
    float minDistance = 1.5f;
    float maxDistance = 50.0f;
    float startDistance = 8.0f;
    float sceneExtent = 1.0f;

    float clampDistance(float distance) const;
    float nearPlane(float distance) const;
    float farPlane(float distance) const;
};

CameraLimits cameraLimitsForScene(double sceneExtent);
