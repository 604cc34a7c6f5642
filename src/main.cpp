#include <QApplication>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QInputDialog>
#include <QMessageBox>
#include <QTextStream>

#include <cstring>
#include <memory>

#include "app/Logging.h"
#include "app/MainWindow.h"
#include "app/ReportPrinter.h"
#include "app/SimulationConfig.h"
#include "orbit/InvalidParameterError.h"
#include "scene/ConstellationScene.h"
#include "scene/PhaseClock.h"

namespace {

// --headless must not need a display, so pick the application class before
// Qt sees the arguments.
static std::unique_ptr<QCoreApplication> createApplication(int& argc, char** argv)
{
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--headless") == 0) {
            return std::make_unique<QCoreApplication>(argc, argv);
        }
    }
    return std::make_unique<QApplication>(argc, argv);
}

static int fail(bool gui, const QString& message)
{
    qCCritical(lcApp).noquote() << message;
    if (gui) {
        QMessageBox::critical(nullptr, "Constellation Mapper", message);
    }
    return 1;
}

} // namespace

int main(int argc, char** argv)
{
    std::unique_ptr<QCoreApplication> app = createApplication(argc, argv);
    QCoreApplication::setApplicationName("constellation-mapper");
    QCoreApplication::setApplicationVersion(CONSTELLATION_MAPPER_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Sizes a single-plane satellite constellation for continuous coverage of a "
        "spherical body and animates it.");
    parser.addHelpOption();
    parser.addVersionOption();
    addSimulationOptions(parser);
    parser.process(*app);

    SimulationConfig config;
    QString error;
    const bool gui = qobject_cast<QApplication*>(app.get()) != nullptr;
    if (!readSimulationConfig(parser, config, error)) {
        return fail(gui, error);
    }
    if (config.verbose) {
        enableVerboseLogging();
    }

    if (!config.hasInclination) {
        bool ok = false;
        const double inclination = QInputDialog::getDouble(
            nullptr,
            "Inclination",
            "Enter the inclination angle (in degrees):",
            0.0,
            0.0,
            180.0,
            2,
            &ok);
        if (!ok) {
            qCInfo(lcApp) << "no inclination entered, exiting";
            return 0;
        }
        config.inclinationDeg = inclination;
        config.hasInclination = true;
    }

    SceneSettings settings;
    settings.orbit = config.orbit;
    settings.inclinationDeg = config.inclinationDeg;
    settings.coverageModel = config.coverageModel;

    std::unique_ptr<ConstellationScene> scene;
    std::unique_ptr<PhaseClock> clock;
    try {
        scene = std::make_unique<ConstellationScene>(settings);
        clock = std::make_unique<PhaseClock>(config.frameCount);
    } catch (const InvalidParameterError& e) {
        return fail(gui, QString::fromStdString(e.what()));
    }

    logRunSummary(config, *scene);

    QTextStream out(stdout);
    if (config.headless) {
        ReportPrinter::writeReport(out, *scene, config.frameCount);
        return 0;
    }

    out << ReportPrinter::countLine(*scene) << Qt::endl;

    MainWindow window(*scene, *clock, config.frameIntervalMs);
    window.resize(1100, 700);
    window.show();

    return app->exec();
}
