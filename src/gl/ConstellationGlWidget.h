#pragma once

#include <QMatrix4x4>
#include <QOpenGLFunctions_3_3_Core>
#include <QOpenGLShaderProgram>
#include <QOpenGLWidget>
#include <QPoint>
#include <QVector3D>

#include <array>
#include <vector>

#include "scene/CameraLimits.h"
#include "scene/ConstellationScene.h"
#include "scene/PhaseClock.h"

class QMouseEvent;
class QPainter;
class QWheelEvent;
class QTimer;

// Draws one ConstellationScene: body sphere, equator, orbit path and the
// satellite markers at the clock's current phase. Scene km are scaled to body
// radii and remapped z-up -> y-up for GL.
class ConstellationGlWidget final : public QOpenGLWidget, protected QOpenGLFunctions_3_3_Core
{
    Q_OBJECT

public:
    ConstellationGlWidget(ConstellationScene scene, PhaseClock clock, int frameIntervalMs, QWidget* parent = nullptr);
    ~ConstellationGlWidget() override;

    const ConstellationScene& scene() const { return scene_; }
    const PhaseClock& clock() const { return clock_; }

    bool isPlaying() const;

public slots:
    void play();
    void pause();
    void setFrameIndex(int frameIndex);

signals:
    void frameChanged(int frameIndex);
    void playingChanged(bool playing);

protected:
    void initializeGL() override;
    void resizeGL(int w, int h) override;
    void paintGL() override;

    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;

private:
    struct LineStrip
    {
        unsigned int vao = 0;
        unsigned int vbo = 0;
        std::vector<float> vertices; // xyz triplets, render units
        QVector3D color;
        float alpha = 1.0f;
    };

    void uploadBodyMesh();
    void uploadLineStrip(LineStrip& strip);
    void uploadMarkers();
    void releaseLineStrip(LineStrip& strip);
    void rebuildAxisGeometry();
    void drawLineStrip(const LineStrip& strip, unsigned int mode);
    void paintAxisTitles(QPainter& painter, const QMatrix4x4& mvp);
    void paintLegend(QPainter& painter);

    QMatrix4x4 buildViewProjection() const;

    ConstellationScene scene_;
    PhaseClock clock_;
    double renderScale_ = 1.0; // render units per km

    QOpenGLShaderProgram program_;

    unsigned int bodyVao_ = 0;
    unsigned int bodyVbo_ = 0;
    unsigned int bodyEbo_ = 0;
    int bodyIndexCount_ = 0;

    unsigned int markerVao_ = 0;
    unsigned int markerVbo_ = 0;
    std::vector<float> markerVertices_;

    LineStrip orbitPath_;
    LineStrip equatorNorth_;
    LineStrip equatorSouth_;
    LineStrip axes_;
    std::array<QVector3D, 3> axisTitleAnchors_{}; // render units, +X/+Y/+Z ends

    QPoint lastMousePos_;
    float yawDeg_ = -30.0f;
    float pitchDeg_ = -20.0f;
    CameraLimits cameraLimits_;
    float distance_ = 8.0f;

    bool glInitialized_ = false;
    QTimer* frameTimer_ = nullptr;
};
