#pragma once

#include <QString>

class ConstellationScene;
class QTextStream;

namespace ReportPrinter {

// 45 -> "45.0", 28.25 -> "28.25"
QString formatDegrees(double deg);

// "Number of Satellites Needed for Inclination 45.0°: 4"
QString countLine(const ConstellationScene& scene);

// Count line, then a CSV table frame,satellite,angle_rad,x,y,z covering one
// revolution in frameCount steps. angle_rad is the in-plane orbital angle in
// [0, 2pi); coordinates are scene km (vertical offset included).
void writeReport(QTextStream& out, const ConstellationScene& scene, int frameCount);

} // namespace ReportPrinter
