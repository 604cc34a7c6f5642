#include "ReportPrinter.h"

#include "orbit/OrbitGeometry.h"
#include "scene/ConstellationScene.h"
#include "scene/PhaseClock.h"

#include <QLocale>
#include <QTextStream>

namespace ReportPrinter {

QString formatDegrees(double deg)
{
    // Shortest round-trip digits, always with a fractional part: 45 -> "45.0".
    QString text = QString::number(deg, 'g', QLocale::FloatingPointShortest);
    if (!text.contains('.') && !text.contains('e') && !text.contains("inf") && !text.contains("nan")) {
        text += QStringLiteral(".0");
    }
    return text;
}

QString countLine(const ConstellationScene& scene)
{
    return QStringLiteral("Number of Satellites Needed for Inclination %1°: %2")
        .arg(formatDegrees(scene.inclinationDeg()))
        .arg(scene.satelliteCount());
}

void writeReport(QTextStream& out, const ConstellationScene& scene, int frameCount)
{
    PhaseClock clock(frameCount);
    const auto total = static_cast<size_t>(scene.satelliteCount());

    out << countLine(scene) << '\n';
    out << "frame,satellite,angle_rad,x,y,z\n";
    for (int f = 0; f < clock.frameCount(); ++f) {
        const double phase = clock.phaseRad();
        const auto positions = scene.satellitesAt(phase);
        for (size_t s = 0; s < positions.size(); ++s) {
            const auto& p = positions[s];
            out << f << ',' << static_cast<int>(s + 1) << ','
                << QString::number(OrbitGeometry::orbitalAngle(s, total, phase), 'f', 6) << ','
                << QString::number(p.x, 'f', 6) << ','
                << QString::number(p.y, 'f', 6) << ','
                << QString::number(p.z, 'f', 6) << '\n';
        }
        clock.advance();
    }
    out.flush();
}

} // namespace ReportPrinter
