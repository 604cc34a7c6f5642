#pragma once

#include <QString>

// Text drawn in the 3D view: axis titles and the legend entries.
namespace SceneLabels {

enum class Axis
{
    X,
    Y,
    Z,
};

QString axisTitle(Axis axis); // "X (km)"
QString bodyName();
QString equatorName();
QString orbitName(double inclinationDeg); // "Inclination 45.0° Orbit"
QString satelliteName(int index); // 1-based, "Satellite 3"
QString satellitesName(int count); // "Satellites 1-4", or the single name

} // namespace SceneLabels
