#include <gtest/gtest.h>

#include "app/SimulationConfig.h"

#include <QString>
#include <QStringList>

namespace {

bool parse(QStringList args, SimulationConfig& cfg, QString& error)
{
    args.prepend(QStringLiteral("constellation-mapper"));
    return parseSimulationConfig(args, cfg, error);
}

TEST(SimulationConfigTest, DefaultsAreTheLunarCase)
{
    SimulationConfig cfg;
    QString error;
    ASSERT_TRUE(parse({}, cfg, error)) << error.toStdString();

    EXPECT_FALSE(cfg.hasInclination);
    EXPECT_DOUBLE_EQ(cfg.orbit.bodyRadiusKm, 1737.4);
    EXPECT_DOUBLE_EQ(cfg.orbit.altitudeKm, 2000.0);
    EXPECT_DOUBLE_EQ(cfg.orbit.fieldOfViewDeg, 90.0);
    EXPECT_EQ(cfg.coverageModel, CoverageModel::Reference);
    EXPECT_EQ(cfg.frameCount, 100);
    EXPECT_EQ(cfg.frameIntervalMs, 100);
    EXPECT_FALSE(cfg.headless);
    EXPECT_FALSE(cfg.verbose);
}

TEST(SimulationConfigTest, ReadsEveryOption)
{
    SimulationConfig cfg;
    QString error;
    ASSERT_TRUE(parse({"--inclination", "97.5", "--altitude", "550", "--body-radius", "6371",
                       "--fov", "40", "--frames", "360", "--frame-interval", "16",
                       "--coverage-model", "cap", "--headless", "--verbose"},
                      cfg, error))
        << error.toStdString();

    EXPECT_TRUE(cfg.hasInclination);
    EXPECT_DOUBLE_EQ(cfg.inclinationDeg, 97.5);
    EXPECT_DOUBLE_EQ(cfg.orbit.altitudeKm, 550.0);
    EXPECT_DOUBLE_EQ(cfg.orbit.bodyRadiusKm, 6371.0);
    EXPECT_DOUBLE_EQ(cfg.orbit.fieldOfViewDeg, 40.0);
    EXPECT_EQ(cfg.frameCount, 360);
    EXPECT_EQ(cfg.frameIntervalMs, 16);
    EXPECT_EQ(cfg.coverageModel, CoverageModel::SphericalCap);
    EXPECT_TRUE(cfg.headless);
    EXPECT_TRUE(cfg.verbose);
}

TEST(SimulationConfigTest, RejectsInclinationOutOfRange)
{
    SimulationConfig cfg;
    QString error;
    EXPECT_FALSE(parse({"--inclination", "181"}, cfg, error));
    EXPECT_TRUE(error.contains("inclination"));
    EXPECT_FALSE(parse({"--inclination", "-0.5"}, cfg, error));
}

TEST(SimulationConfigTest, RejectsNonNumbers)
{
    SimulationConfig cfg;
    QString error;
    EXPECT_FALSE(parse({"--inclination", "steep"}, cfg, error));
    EXPECT_TRUE(error.contains("--inclination"));
    EXPECT_FALSE(parse({"--altitude", "nan"}, cfg, error));
    EXPECT_FALSE(parse({"--frames", "1.5"}, cfg, error));
}

TEST(SimulationConfigTest, RejectsDegenerateOrbit)
{
    SimulationConfig cfg;
    QString error;
    EXPECT_FALSE(parse({"--fov", "0"}, cfg, error));
    EXPECT_TRUE(error.contains("--fov"));
    EXPECT_FALSE(parse({"--fov", "400"}, cfg, error));
    EXPECT_FALSE(parse({"--body-radius", "0"}, cfg, error));
    EXPECT_FALSE(parse({"--altitude", "-10"}, cfg, error));
    EXPECT_FALSE(parse({"--frames", "0"}, cfg, error));
    EXPECT_FALSE(parse({"--frame-interval", "-5"}, cfg, error));
}

TEST(SimulationConfigTest, RejectsUnknownModelAndOption)
{
    SimulationConfig cfg;
    QString error;
    EXPECT_FALSE(parse({"--coverage-model", "walker"}, cfg, error));
    EXPECT_TRUE(error.contains("walker"));
    EXPECT_FALSE(parse({"--no-such-option"}, cfg, error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(SimulationConfigTest, HeadlessNeedsInclination)
{
    SimulationConfig cfg;
    QString error;
    EXPECT_FALSE(parse({"--headless"}, cfg, error));
    EXPECT_TRUE(error.contains("--inclination"));
}

TEST(SimulationConfigTest, ValidateInclinationBounds)
{
    QString error;
    EXPECT_TRUE(validateInclination(0.0, error));
    EXPECT_TRUE(validateInclination(180.0, error));
    EXPECT_FALSE(validateInclination(180.01, error));
}

} // namespace
