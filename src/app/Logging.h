#pragma once

#include <QLoggingCategory>

class ConstellationScene;
struct SimulationConfig;

Q_DECLARE_LOGGING_CATEGORY(lcApp)
Q_DECLARE_LOGGING_CATEGORY(lcRender)

// --verbose: turn on debug output for every constellation.* category.
void enableVerboseLogging();

// Info: orbit inputs, then count, model and orbit radius. Debug: animation timing.
void logRunSummary(const SimulationConfig& config, const ConstellationScene& scene);
