#include "MainWindow.h"

#include "app/ReportPrinter.h"
#include "gl/ConstellationGlWidget.h"

#include <QDockWidget>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSlider>
#include <QVBoxLayout>
#include <QWidget>

#include <utility>

namespace {

static QLabel* makeValueLabel(const QString& text, QWidget* parent)
{
    auto* label = new QLabel(text, parent);
    label->setTextInteractionFlags(Qt::TextSelectableByMouse);
    return label;
}

static QString km(double v)
{
    return QStringLiteral("%1 km").arg(QString::number(v, 'f', 1));
}

} // namespace

MainWindow::MainWindow(ConstellationScene scene, PhaseClock clock, int frameIntervalMs, QWidget* parent)
    : QMainWindow(parent)
{
    setWindowTitle(QStringLiteral("3D Lunar Satellite Orbit at %1° Inclination")
                       .arg(ReportPrinter::formatDegrees(scene.inclinationDeg())));

    auto* central = new QWidget(this);
    auto* centralLayout = new QVBoxLayout(central);
    centralLayout->setContentsMargins(0, 0, 0, 0);
    centralLayout->setSpacing(0);

    const int frameCount = clock.frameCount();
    glWidget_ = new ConstellationGlWidget(std::move(scene), clock, frameIntervalMs, central);
    centralLayout->addWidget(glWidget_, 1);

    // Bottom animation controls
    auto* bottomBar = new QWidget(central);
    auto* bottomLayout = new QHBoxLayout(bottomBar);
    bottomLayout->setContentsMargins(8, 6, 8, 6);
    bottomLayout->setSpacing(8);

    auto* playBtn = new QPushButton("Play", bottomBar);
    auto* pauseBtn = new QPushButton("Pause", bottomBar);
    bottomLayout->addWidget(playBtn);
    bottomLayout->addWidget(pauseBtn);

    auto* frameSlider = new QSlider(Qt::Horizontal, bottomBar);
    frameSlider->setRange(0, frameCount - 1);
    frameSlider->setValue(0);
    bottomLayout->addWidget(frameSlider, 1);

    auto* frameLabel = new QLabel(bottomBar);
    frameLabel->setMinimumWidth(110);
    bottomLayout->addWidget(frameLabel);

    auto showFrame = [frameLabel, frameSlider, frameCount](int frameIndex) {
        frameLabel->setText(QStringLiteral("Frame %1 / %2").arg(frameIndex + 1).arg(frameCount));
        const QSignalBlocker blocker(frameSlider);
        frameSlider->setValue(frameIndex);
    };
    showFrame(0);

    connect(playBtn, &QPushButton::clicked, glWidget_, &ConstellationGlWidget::play);
    connect(pauseBtn, &QPushButton::clicked, glWidget_, &ConstellationGlWidget::pause);
    connect(frameSlider, &QSlider::valueChanged, glWidget_, &ConstellationGlWidget::setFrameIndex);
    connect(glWidget_, &ConstellationGlWidget::frameChanged, this, showFrame);
    connect(glWidget_, &ConstellationGlWidget::playingChanged, this, [playBtn, pauseBtn](bool playing) {
        playBtn->setEnabled(!playing);
        pauseBtn->setEnabled(playing);
    });
    pauseBtn->setEnabled(false);

    centralLayout->addWidget(bottomBar, 0);
    setCentralWidget(central);

    // Side panel: inputs and the sizing result
    auto* dock = new QDockWidget("Constellation", this);
    dock->setAllowedAreas(Qt::LeftDockWidgetArea | Qt::RightDockWidgetArea);
    dock->setFeatures(QDockWidget::DockWidgetMovable | QDockWidget::DockWidgetFloatable);

    auto* panel = new QWidget(dock);
    auto* panelLayout = new QVBoxLayout(panel);
    panelLayout->setContentsMargins(8, 8, 8, 8);
    panelLayout->setSpacing(8);

    const ConstellationScene& s = glWidget_->scene();
    const SceneSettings& settings = s.settings();

    auto* orbitGroup = new QGroupBox("Orbit", panel);
    auto* orbitForm = new QFormLayout(orbitGroup);
    orbitForm->addRow("Body radius", makeValueLabel(km(settings.orbit.bodyRadiusKm), orbitGroup));
    orbitForm->addRow("Altitude", makeValueLabel(km(settings.orbit.altitudeKm), orbitGroup));
    orbitForm->addRow("Orbit radius", makeValueLabel(km(s.orbitRadiusKm()), orbitGroup));
    orbitForm->addRow(
        "i (deg)",
        makeValueLabel(ReportPrinter::formatDegrees(s.inclinationDeg()), orbitGroup));
    panelLayout->addWidget(orbitGroup);

    auto* coverageGroup = new QGroupBox("Coverage", panel);
    auto* coverageForm = new QFormLayout(coverageGroup);
    coverageForm->addRow(
        "Field of view",
        makeValueLabel(QStringLiteral("%1°").arg(ReportPrinter::formatDegrees(settings.orbit.fieldOfViewDeg)), coverageGroup));
    coverageForm->addRow(
        "Model",
        makeValueLabel(QString::fromLatin1(Coverage::coverageModelName(settings.coverageModel)), coverageGroup));
    coverageForm->addRow("Satellites", makeValueLabel(QString::number(s.satelliteCount()), coverageGroup));
    panelLayout->addWidget(coverageGroup);

    auto* note = new QLabel("The satellite count does not depend on inclination; "
                            "only the orbit path changes.",
                            panel);
    note->setWordWrap(true);
    panelLayout->addWidget(note);
    panelLayout->addStretch(1);

    dock->setWidget(panel);
    addDockWidget(Qt::LeftDockWidgetArea, dock);
}
