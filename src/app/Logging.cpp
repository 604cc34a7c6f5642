#include "Logging.h"

#include "app/SimulationConfig.h"
#include "scene/ConstellationScene.h"

Q_LOGGING_CATEGORY(lcApp, "constellation.app", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRender, "constellation.render", QtInfoMsg)

void enableVerboseLogging()
{
    QLoggingCategory::setFilterRules(QStringLiteral("constellation.*.debug=true"));
}

void logRunSummary(const SimulationConfig& config, const ConstellationScene& scene)
{
    qCInfo(lcApp).nospace() << "body radius " << config.orbit.bodyRadiusKm << " km, altitude "
                            << config.orbit.altitudeKm << " km, fov " << config.orbit.fieldOfViewDeg
                            << " deg, inclination " << config.inclinationDeg << " deg";
    qCInfo(lcApp).nospace() << scene.satelliteCount() << " satellites ("
                            << Coverage::coverageModelName(config.coverageModel) << " model), orbit radius "
                            << scene.orbitRadiusKm() << " km";
    qCDebug(lcApp).nospace() << config.frameCount << " frames every " << config.frameIntervalMs << " ms";
}
