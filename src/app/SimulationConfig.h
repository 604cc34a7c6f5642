#pragma once

#include "orbit/CoverageEstimator.h"

#include <QString>
#include <QStringList>

class QCommandLineParser;

struct SimulationConfig
{
    OrbitalParameters orbit;
    CoverageModel coverageModel = CoverageModel::Reference;

    // Captured once per run. When absent the GUI asks for it.
    bool hasInclination = false;
    double inclinationDeg = 0.0;

    int frameCount = 100;
    int frameIntervalMs = 100;

    bool headless = false;
    bool verbose = false;
};

// Registers --inclination, --altitude, --body-radius, --fov, --frames,
// --frame-interval, --coverage-model, --headless and --verbose.
void addSimulationOptions(QCommandLineParser& parser);

// Reads the options from an already-parsed parser. On failure outError names
// the offending option and outConfig is left unspecified.
bool readSimulationConfig(const QCommandLineParser& parser, SimulationConfig& outConfig, QString& outError);

// Parse + read in one step; arguments[0] is the program name.
bool parseSimulationConfig(const QStringList& arguments, SimulationConfig& outConfig, QString& outError);

bool validateInclination(double inclinationDeg, QString& outError);
