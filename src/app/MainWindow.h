#pragma once

#include <QMainWindow>

#include "scene/ConstellationScene.h"
#include "scene/PhaseClock.h"

class ConstellationGlWidget;

class MainWindow final : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(ConstellationScene scene, PhaseClock clock, int frameIntervalMs, QWidget* parent = nullptr);

private:
    ConstellationGlWidget* glWidget_ = nullptr;
};
