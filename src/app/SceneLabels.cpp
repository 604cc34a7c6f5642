#include "SceneLabels.h"

#include "app/ReportPrinter.h"

namespace SceneLabels {

QString axisTitle(Axis axis)
{
    switch (axis) {
    case Axis::X:
        return QStringLiteral("X (km)");
    case Axis::Y:
        return QStringLiteral("Y (km)");
    case Axis::Z:
        return QStringLiteral("Z (km)");
    }
    return QString();
}

QString bodyName()
{
    return QStringLiteral("Moon");
}

QString equatorName()
{
    return QStringLiteral("Equator");
}

QString orbitName(double inclinationDeg)
{
    return QStringLiteral("Inclination %1° Orbit").arg(ReportPrinter::formatDegrees(inclinationDeg));
}

QString satelliteName(int index)
{
    return QStringLiteral("Satellite %1").arg(index);
}

QString satellitesName(int count)
{
    if (count <= 1) {
        return satelliteName(1);
    }
    return QStringLiteral("Satellites 1-%1").arg(count);
}

} // namespace SceneLabels
