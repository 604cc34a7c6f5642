#include <gtest/gtest.h>

#include "app/ReportPrinter.h"
#include "scene/ConstellationScene.h"

#include <QString>
#include <QStringList>
#include <QTextStream>

namespace {

ConstellationScene lunarScene(double inclinationDeg)
{
    SceneSettings s;
    s.inclinationDeg = inclinationDeg;
    return ConstellationScene(s);
}

TEST(ReportPrinterTest, CountLine)
{
    EXPECT_EQ(ReportPrinter::countLine(lunarScene(45.0)),
              QString::fromUtf8("Number of Satellites Needed for Inclination 45.0°: 4"));
    EXPECT_EQ(ReportPrinter::countLine(lunarScene(28.5)),
              QString::fromUtf8("Number of Satellites Needed for Inclination 28.5°: 4"));
}

TEST(ReportPrinterTest, TableCoversEveryFrameAndSatellite)
{
    QString buffer;
    QTextStream out(&buffer);
    ReportPrinter::writeReport(out, lunarScene(45.0), 10);

    const QStringList lines = buffer.split('\n', Qt::SkipEmptyParts);
    ASSERT_EQ(lines.size(), 2 + 10 * 4);
    EXPECT_TRUE(lines[0].startsWith("Number of Satellites Needed"));
    EXPECT_EQ(lines[1], QStringLiteral("frame,satellite,angle_rad,x,y,z"));
    EXPECT_EQ(lines[2], QStringLiteral("0,1,0.000000,3737.400000,0.000000,500.000000"));
    EXPECT_TRUE(lines[3].startsWith("0,2,1.570796,"));
    EXPECT_TRUE(lines.last().startsWith("9,4,"));
}

// Frame 5 of 10 is half a turn: satellite 4 (base 3pi/2) wraps to pi/2.
TEST(ReportPrinterTest, AngleColumnWraps)
{
    QString buffer;
    QTextStream out(&buffer);
    ReportPrinter::writeReport(out, lunarScene(45.0), 10);

    const QStringList lines = buffer.split('\n', Qt::SkipEmptyParts);
    const QString row = lines[2 + 5 * 4 + 3];
    EXPECT_TRUE(row.startsWith("5,4,1.570796,")) << row.toStdString();
}

TEST(ReportPrinterTest, DegreesKeepOneDecimal)
{
    EXPECT_EQ(ReportPrinter::formatDegrees(45.0), QStringLiteral("45.0"));
    EXPECT_EQ(ReportPrinter::formatDegrees(0.0), QStringLiteral("0.0"));
    EXPECT_EQ(ReportPrinter::formatDegrees(180.0), QStringLiteral("180.0"));
    EXPECT_EQ(ReportPrinter::formatDegrees(28.25), QStringLiteral("28.25"));
    EXPECT_EQ(ReportPrinter::formatDegrees(97.123), QStringLiteral("97.123"));
}

} // namespace
