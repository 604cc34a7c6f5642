#include "ConstellationGlWidget.h"

#include "app/Logging.h"
#include "app/SceneLabels.h"

#include <QColor>
#include <QFontMetrics>
#include <QMouseEvent>
#include <QPainter>
#include <QTimer>
#include <QVector4D>
#include <QWheelEvent>

#include <algorithm>
#include <cmath>
#include <utility>

namespace {
constexpr const char* kVertexShader = R"(
#version 330 core
layout (location = 0) in vec3 aPos;

uniform mat4 uMvp;

void main() {
  gl_Position = uMvp * vec4(aPos, 1.0);
}
)";

constexpr const char* kFragmentShader = R"(
#version 330 core
out vec4 FragColor;

uniform vec3 uColor;
uniform float uAlpha;

void main() {
  FragColor = vec4(uColor, uAlpha);
}
)";

const QVector3D kBodyGrey(0.62f, 0.62f, 0.62f);
const QVector3D kEquatorYellow(1.0f, 0.9f, 0.1f);
const QVector3D kOrbitRed(0.95f, 0.25f, 0.2f);
const QVector3D kSatelliteBlue(0.2f, 0.4f, 1.0f);
const QVector3D kAxisGrey(0.65f, 0.65f, 0.65f);

static QColor toQColor(const QVector3D& c)
{
    return QColor::fromRgbF(c.x(), c.y(), c.z());
}

static float clampf(float v, float lo, float hi)
{
    return std::fmax(lo, std::fmin(hi, v));
}

// Scene km, z up -> render units, y up: (x,y,z) -> (x,z,-y)
static void appendRenderVertex(std::vector<float>& out, double x, double y, double z, double scale)
{
    out.push_back(static_cast<float>(x * scale));
    out.push_back(static_cast<float>(z * scale));
    out.push_back(static_cast<float>(-y * scale));
}

static std::vector<float> toRenderVertices(const std::vector<SatellitePosition>& points, double scale)
{
    std::vector<float> out;
    out.reserve(points.size() * 3);
    for (const auto& p : points) {
        appendRenderVertex(out, p.x, p.y, p.z, scale);
    }
    return out;
}
} // namespace

ConstellationGlWidget::ConstellationGlWidget(ConstellationScene scene, PhaseClock clock, int frameIntervalMs, QWidget* parent)
    : QOpenGLWidget(parent)
    , scene_(std::move(scene))
    , clock_(clock)
{
    setFocusPolicy(Qt::StrongFocus);

    renderScale_ = 1.0 / scene_.bodyRadiusKm();

    // Zoom range and clip planes follow the ring size, in body radii.
    cameraLimits_ = cameraLimitsForScene((scene_.orbitRadiusKm() + scene_.verticalOffsetKm()) * renderScale_);
    distance_ = cameraLimits_.startDistance;

    orbitPath_.vertices = toRenderVertices(scene_.orbitPath(), renderScale_);
    orbitPath_.color = kOrbitRed;

    equatorNorth_.vertices = toRenderVertices(scene_.equatorNorthHalf(), renderScale_);
    equatorNorth_.color = kEquatorYellow;
    equatorNorth_.alpha = 0.3f;

    equatorSouth_.vertices = toRenderVertices(scene_.equatorSouthHalf(), renderScale_);
    equatorSouth_.color = kEquatorYellow;
    equatorSouth_.alpha = 0.3f;

    axes_.color = kAxisGrey;

    frameTimer_ = new QTimer(this);
    frameTimer_->setInterval(std::max(1, frameIntervalMs));
    connect(frameTimer_, &QTimer::timeout, this, [this]() {
        clock_.advance();
        emit frameChanged(clock_.frameIndex());
        update();
    });
}

ConstellationGlWidget::~ConstellationGlWidget()
{
    if (!glInitialized_) {
        return;
    }

    makeCurrent();
    releaseLineStrip(orbitPath_);
    releaseLineStrip(equatorNorth_);
    releaseLineStrip(equatorSouth_);
    releaseLineStrip(axes_);

    if (bodyEbo_ != 0) {
        glDeleteBuffers(1, &bodyEbo_);
        bodyEbo_ = 0;
    }
    if (bodyVbo_ != 0) {
        glDeleteBuffers(1, &bodyVbo_);
        bodyVbo_ = 0;
    }
    if (bodyVao_ != 0) {
        glDeleteVertexArrays(1, &bodyVao_);
        bodyVao_ = 0;
    }
    if (markerVbo_ != 0) {
        glDeleteBuffers(1, &markerVbo_);
        markerVbo_ = 0;
    }
    if (markerVao_ != 0) {
        glDeleteVertexArrays(1, &markerVao_);
        markerVao_ = 0;
    }
    doneCurrent();
}

bool ConstellationGlWidget::isPlaying() const
{
    return frameTimer_->isActive();
}

void ConstellationGlWidget::play()
{
    if (frameTimer_->isActive()) {
        return;
    }
    frameTimer_->start();
    emit playingChanged(true);
}

void ConstellationGlWidget::pause()
{
    if (!frameTimer_->isActive()) {
        return;
    }
    frameTimer_->stop();
    emit playingChanged(false);
}

void ConstellationGlWidget::setFrameIndex(int frameIndex)
{
    clock_.setFrameIndex(frameIndex);
    emit frameChanged(clock_.frameIndex());
    update();
}

void ConstellationGlWidget::initializeGL()
{
    initializeOpenGLFunctions();

    glEnable(GL_DEPTH_TEST);
    glEnable(GL_LINE_SMOOTH);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    program_.addShaderFromSourceCode(QOpenGLShader::Vertex, kVertexShader);
    program_.addShaderFromSourceCode(QOpenGLShader::Fragment, kFragmentShader);
    if (!program_.link()) {
        qCWarning(lcRender) << "shader link failed:" << program_.log();
    }

    glGenVertexArrays(1, &bodyVao_);
    glGenBuffers(1, &bodyVbo_);
    glGenBuffers(1, &bodyEbo_);
    uploadBodyMesh();

    for (LineStrip* strip : {&orbitPath_, &equatorNorth_, &equatorSouth_, &axes_}) {
        glGenVertexArrays(1, &strip->vao);
        glGenBuffers(1, &strip->vbo);
    }
    uploadLineStrip(orbitPath_);
    uploadLineStrip(equatorNorth_);
    uploadLineStrip(equatorSouth_);
    rebuildAxisGeometry();

    // Markers: one vec3 per satellite, refreshed every frame.
    glGenVertexArrays(1, &markerVao_);
    glGenBuffers(1, &markerVbo_);
    glBindVertexArray(markerVao_);
    glBindBuffer(GL_ARRAY_BUFFER, markerVbo_);
    glBufferData(
        GL_ARRAY_BUFFER,
        static_cast<long long>(static_cast<size_t>(scene_.satelliteCount()) * 3 * sizeof(float)),
        nullptr,
        GL_DYNAMIC_DRAW);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, 3 * sizeof(float), reinterpret_cast<void*>(0));
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);

    glInitialized_ = true;
    qCDebug(lcRender) << "GL initialized," << scene_.satelliteCount() << "satellite markers";
}

void ConstellationGlWidget::resizeGL(int w, int h)
{
    glViewport(0, 0, w, h);
}

void ConstellationGlWidget::paintGL()
{
    // The QPainter overlay of the previous frame may have changed these.
    glEnable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    glClearColor(0.05f, 0.06f, 0.08f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    if (!program_.isLinked()) {
        return;
    }

    const QMatrix4x4 mvp = buildViewProjection();

    program_.bind();
    program_.setUniformValue("uMvp", mvp);

    // Opaque geometry first, the translucent body last.
    drawLineStrip(orbitPath_, GL_LINE_STRIP);
    drawLineStrip(axes_, GL_LINES);

    if (markerVao_ != 0 && scene_.satelliteCount() > 0) {
        uploadMarkers();
        program_.setUniformValue("uColor", kSatelliteBlue);
        program_.setUniformValue("uAlpha", 1.0f);
        glPointSize(10.0f);
        glBindVertexArray(markerVao_);
        glDrawArrays(GL_POINTS, 0, scene_.satelliteCount());
        glBindVertexArray(0);
    }

    glDepthMask(GL_FALSE);
    drawLineStrip(equatorNorth_, GL_LINE_STRIP);
    drawLineStrip(equatorSouth_, GL_LINE_STRIP);

    if (bodyVao_ != 0 && bodyIndexCount_ > 0) {
        program_.setUniformValue("uColor", kBodyGrey);
        program_.setUniformValue("uAlpha", 0.6f);
        glBindVertexArray(bodyVao_);
        glDrawElements(GL_TRIANGLES, bodyIndexCount_, GL_UNSIGNED_INT, reinterpret_cast<void*>(0));
        glBindVertexArray(0);
    }
    glDepthMask(GL_TRUE);

    program_.release();

    // Text overlay after the GL pass.
    QPainter painter(this);
    painter.setRenderHint(QPainter::TextAntialiasing);
    paintAxisTitles(painter, mvp);
    paintLegend(painter);
}

void ConstellationGlWidget::mousePressEvent(QMouseEvent* event)
{
    lastMousePos_ = event->pos();
}

void ConstellationGlWidget::mouseMoveEvent(QMouseEvent* event)
{
    const QPoint delta = event->pos() - lastMousePos_;
    lastMousePos_ = event->pos();

    if (event->buttons() & Qt::LeftButton) {
        yawDeg_ += delta.x() * 0.3f;
        pitchDeg_ += delta.y() * 0.3f;
        pitchDeg_ = clampf(pitchDeg_, -89.0f, 89.0f);
        update();
    }
}

void ConstellationGlWidget::wheelEvent(QWheelEvent* event)
{
    // Qt provides angleDelta in 1/8 degrees
    const float steps = static_cast<float>(event->angleDelta().y()) / 120.0f;
    distance_ *= std::pow(0.9f, steps);
    distance_ = cameraLimits_.clampDistance(distance_);
    update();
}

void ConstellationGlWidget::uploadBodyMesh()
{
    const BodyMesh mesh = scene_.buildBodyMesh(/*stacks=*/100, /*slices=*/200);

    std::vector<float> vertices;
    vertices.reserve(mesh.vertices.size());
    for (size_t k = 0; k + 2 < mesh.vertices.size(); k += 3) {
        appendRenderVertex(vertices, mesh.vertices[k], mesh.vertices[k + 1], mesh.vertices[k + 2], renderScale_);
    }
    bodyIndexCount_ = static_cast<int>(mesh.indices.size());

    glBindVertexArray(bodyVao_);

    glBindBuffer(GL_ARRAY_BUFFER, bodyVbo_);
    glBufferData(
        GL_ARRAY_BUFFER,
        static_cast<long long>(vertices.size() * sizeof(float)),
        vertices.data(),
        GL_STATIC_DRAW);

    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, bodyEbo_);
    glBufferData(
        GL_ELEMENT_ARRAY_BUFFER,
        static_cast<long long>(mesh.indices.size() * sizeof(unsigned int)),
        mesh.indices.data(),
        GL_STATIC_DRAW);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, 3 * sizeof(float), reinterpret_cast<void*>(0));

    glBindVertexArray(0);
}

void ConstellationGlWidget::uploadLineStrip(LineStrip& strip)
{
    glBindVertexArray(strip.vao);
    glBindBuffer(GL_ARRAY_BUFFER, strip.vbo);

    glBufferData(
        GL_ARRAY_BUFFER,
        static_cast<long long>(strip.vertices.size() * sizeof(float)),
        strip.vertices.data(),
        GL_STATIC_DRAW);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, 3 * sizeof(float), reinterpret_cast<void*>(0));

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);
}

void ConstellationGlWidget::uploadMarkers()
{
    markerVertices_.clear();
    for (const auto& p : scene_.satellitesAt(clock_.phaseRad())) {
        appendRenderVertex(markerVertices_, p.x, p.y, p.z, renderScale_);
    }

    glBindBuffer(GL_ARRAY_BUFFER, markerVbo_);
    glBufferSubData(
        GL_ARRAY_BUFFER,
        0,
        static_cast<long long>(markerVertices_.size() * sizeof(float)),
        markerVertices_.data());
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void ConstellationGlWidget::releaseLineStrip(LineStrip& strip)
{
    if (strip.vbo != 0) {
        glDeleteBuffers(1, &strip.vbo);
        strip.vbo = 0;
    }
    if (strip.vao != 0) {
        glDeleteVertexArrays(1, &strip.vao);
        strip.vao = 0;
    }
}

void ConstellationGlWidget::rebuildAxisGeometry()
{
    // X, Y, Z scene axes spanning the orbit, remapped like everything else.
    const double extent = 1.2 * scene_.orbitRadiusKm();
    axes_.vertices.clear();
    appendRenderVertex(axes_.vertices, -extent, 0.0, 0.0, renderScale_);
    appendRenderVertex(axes_.vertices, extent, 0.0, 0.0, renderScale_);
    appendRenderVertex(axes_.vertices, 0.0, -extent, 0.0, renderScale_);
    appendRenderVertex(axes_.vertices, 0.0, extent, 0.0, renderScale_);
    appendRenderVertex(axes_.vertices, 0.0, 0.0, -extent, renderScale_);
    appendRenderVertex(axes_.vertices, 0.0, 0.0, extent, renderScale_);

    // Positive ends: vertices 1, 3 and 5.
    for (size_t a = 0; a < axisTitleAnchors_.size(); ++a) {
        const size_t k = (2 * a + 1) * 3;
        axisTitleAnchors_[a] = QVector3D(axes_.vertices[k], axes_.vertices[k + 1], axes_.vertices[k + 2]);
    }

    // Caller must have a current GL context.
    uploadLineStrip(axes_);
}

void ConstellationGlWidget::drawLineStrip(const LineStrip& strip, unsigned int mode)
{
    if (strip.vao == 0 || strip.vertices.empty()) {
        return;
    }
    program_.setUniformValue("uColor", strip.color);
    program_.setUniformValue("uAlpha", strip.alpha);
    glBindVertexArray(strip.vao);
    glDrawArrays(mode, 0, static_cast<int>(strip.vertices.size() / 3));
    glBindVertexArray(0);
}

QMatrix4x4 ConstellationGlWidget::buildViewProjection() const
{
    QMatrix4x4 projection;
    projection.perspective(
        45.0f,
        float(width()) / float(std::max(1, height())),
        cameraLimits_.nearPlane(distance_),
        cameraLimits_.farPlane(distance_));

    QMatrix4x4 view;
    view.translate(0.0f, 0.0f, -distance_);
    view.rotate(pitchDeg_, 1.0f, 0.0f, 0.0f);
    view.rotate(yawDeg_, 0.0f, 1.0f, 0.0f);

    return projection * view;
}

void ConstellationGlWidget::paintAxisTitles(QPainter& painter, const QMatrix4x4& mvp)
{
    static const SceneLabels::Axis kAxes[] = {SceneLabels::Axis::X, SceneLabels::Axis::Y, SceneLabels::Axis::Z};

    painter.setPen(toQColor(kAxisGrey));
    for (size_t a = 0; a < axisTitleAnchors_.size(); ++a) {
        const QVector4D clip = mvp * QVector4D(axisTitleAnchors_[a], 1.0f);
        if (clip.w() <= 0.0f) {
            continue; // behind the camera
        }
        const QVector3D ndc = clip.toVector3DAffine();
        const float sx = (ndc.x() * 0.5f + 0.5f) * static_cast<float>(width());
        const float sy = (0.5f - ndc.y() * 0.5f) * static_cast<float>(height());
        painter.drawText(QPointF(sx + 4.0f, sy - 4.0f), SceneLabels::axisTitle(kAxes[a]));
    }
}

void ConstellationGlWidget::paintLegend(QPainter& painter)
{
    struct Entry
    {
        QString name;
        QVector3D color;
    };
    const Entry entries[] = {
        {SceneLabels::bodyName(), kBodyGrey},
        {SceneLabels::equatorName(), kEquatorYellow},
        {SceneLabels::orbitName(scene_.inclinationDeg()), kOrbitRed},
        {SceneLabels::satellitesName(scene_.satelliteCount()), kSatelliteBlue},
    };

    const QFontMetrics metrics(painter.font());
    const int row = metrics.height() + 4;
    const int swatch = metrics.height() - 4;
    int y = 10;
    for (const auto& entry : entries) {
        painter.fillRect(10, y + 2, swatch, swatch, toQColor(entry.color));
        painter.setPen(Qt::white);
        painter.drawText(10 + swatch + 6, y + metrics.ascent(), entry.name);
        y += row;
    }
}
