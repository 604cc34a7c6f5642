#include "SimulationConfig.h"

#include <QCommandLineOption>
#include <QCommandLineParser>

#include <cmath>

namespace {

const QString kInclination = QStringLiteral("inclination");
const QString kAltitude = QStringLiteral("altitude");
const QString kBodyRadius = QStringLiteral("body-radius");
const QString kFov = QStringLiteral("fov");
const QString kFrames = QStringLiteral("frames");
const QString kFrameInterval = QStringLiteral("frame-interval");
const QString kCoverageModel = QStringLiteral("coverage-model");
const QString kHeadless = QStringLiteral("headless");
const QString kVerbose = QStringLiteral("verbose");

static bool readDouble(const QCommandLineParser& parser, const QString& name, double& inOut, QString& outError)
{
    if (!parser.isSet(name)) {
        return true;
    }
    const QString text = parser.value(name).trimmed();
    bool ok = false;
    const double v = text.toDouble(&ok);
    if (!ok || !std::isfinite(v)) {
        outError = QStringLiteral("--%1: '%2' is not a number").arg(name, text);
        return false;
    }
    inOut = v;
    return true;
}

static bool readPositiveInt(const QCommandLineParser& parser, const QString& name, int& inOut, QString& outError)
{
    if (!parser.isSet(name)) {
        return true;
    }
    const QString text = parser.value(name).trimmed();
    bool ok = false;
    const int v = text.toInt(&ok);
    if (!ok || v < 1) {
        outError = QStringLiteral("--%1: expected a positive integer (got '%2')").arg(name, text);
        return false;
    }
    inOut = v;
    return true;
}

} // namespace

void addSimulationOptions(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption(kInclination, QStringLiteral("Orbit inclination in degrees, 0..180."), QStringLiteral("deg")));
    parser.addOption(QCommandLineOption(kAltitude, QStringLiteral("Orbit altitude in km (default 2000)."), QStringLiteral("km")));
    parser.addOption(QCommandLineOption(kBodyRadius, QStringLiteral("Body radius in km (default 1737.4, the Moon)."), QStringLiteral("km")));
    parser.addOption(QCommandLineOption(kFov, QStringLiteral("Per-satellite field of view in degrees (default 90)."), QStringLiteral("deg")));
    parser.addOption(QCommandLineOption(kFrames, QStringLiteral("Animation frames per revolution (default 100)."), QStringLiteral("n")));
    parser.addOption(QCommandLineOption(kFrameInterval, QStringLiteral("Milliseconds between frames (default 100)."), QStringLiteral("ms")));
    parser.addOption(QCommandLineOption(kCoverageModel, QStringLiteral("Coverage model: reference or cap."), QStringLiteral("model")));
    parser.addOption(QCommandLineOption(kHeadless, QStringLiteral("Print count and positions instead of opening a window.")));
    parser.addOption(QCommandLineOption(kVerbose, QStringLiteral("Enable debug logging.")));
}

bool readSimulationConfig(const QCommandLineParser& parser, SimulationConfig& outConfig, QString& outError)
{
    SimulationConfig cfg;

    if (parser.isSet(kInclination)) {
        if (!readDouble(parser, kInclination, cfg.inclinationDeg, outError)) {
            return false;
        }
        if (!validateInclination(cfg.inclinationDeg, outError)) {
            return false;
        }
        cfg.hasInclination = true;
    }

    if (!readDouble(parser, kAltitude, cfg.orbit.altitudeKm, outError)
        || !readDouble(parser, kBodyRadius, cfg.orbit.bodyRadiusKm, outError)
        || !readDouble(parser, kFov, cfg.orbit.fieldOfViewDeg, outError)) {
        return false;
    }

    if (cfg.orbit.bodyRadiusKm <= 0.0) {
        outError = QStringLiteral("--%1: must be positive").arg(kBodyRadius);
        return false;
    }
    if (cfg.orbit.altitudeKm < 0.0) {
        outError = QStringLiteral("--%1: must not be negative").arg(kAltitude);
        return false;
    }
    if (cfg.orbit.fieldOfViewDeg <= 0.0 || cfg.orbit.fieldOfViewDeg > 360.0) {
        outError = QStringLiteral("--%1: must be in (0, 360]").arg(kFov);
        return false;
    }

    if (!readPositiveInt(parser, kFrames, cfg.frameCount, outError)
        || !readPositiveInt(parser, kFrameInterval, cfg.frameIntervalMs, outError)) {
        return false;
    }

    if (parser.isSet(kCoverageModel)) {
        const QString model = parser.value(kCoverageModel).trimmed().toLower();
        if (model == QLatin1String(Coverage::coverageModelName(CoverageModel::Reference))) {
            cfg.coverageModel = CoverageModel::Reference;
        } else if (model == QLatin1String(Coverage::coverageModelName(CoverageModel::SphericalCap))) {
            cfg.coverageModel = CoverageModel::SphericalCap;
        } else {
            outError = QStringLiteral("--%1: unknown model '%2' (expected reference or cap)").arg(kCoverageModel, model);
            return false;
        }
    }

    cfg.headless = parser.isSet(kHeadless);
    cfg.verbose = parser.isSet(kVerbose);

    if (cfg.headless && !cfg.hasInclination) {
        outError = QStringLiteral("--%1 requires --%2").arg(kHeadless, kInclination);
        return false;
    }

    outConfig = cfg;
    return true;
}

bool parseSimulationConfig(const QStringList& arguments, SimulationConfig& outConfig, QString& outError)
{
    QCommandLineParser parser;
    addSimulationOptions(parser);
    if (!parser.parse(arguments)) {
        outError = parser.errorText();
        return false;
    }
    return readSimulationConfig(parser, outConfig, outError);
}

bool validateInclination(double inclinationDeg, QString& outError)
{
    if (!std::isfinite(inclinationDeg) || inclinationDeg < 0.0 || inclinationDeg > 180.0) {
        outError = QStringLiteral("inclination must be between 0 and 180 degrees (got %1)").arg(inclinationDeg);
        return false;
    }
    return true;
}
