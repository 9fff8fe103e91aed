#include "annotations/DrawingEngine.h"
#include "annotations/GlowStrokePainter.h"
#include "annotations/StrokeSmoothing.h"

#include <QDebug>
#include <QPainter>

DrawingEngine::DrawingEngine(QObject *parent)
    : QObject(parent)
{
}

DrawingEngine::~DrawingEngine() = default;

bool DrawingEngine::beginGesture(const QPointF &point, ToolId tool, const QColor &color, int thickness)
{
    if (m_gesture) {
        return false;
    }
    if (tool == ToolId::Count) {
        qWarning() << "DrawingEngine: Invalid tool for gesture";
        return false;
    }

    Gesture gesture;
    gesture.tool = tool;
    gesture.color = color;
    gesture.thickness = qBound(kMinThickness, thickness, kMaxThickness);
    gesture.startAnchor = point;
    gesture.currentAnchor = point;
    if (tool == ToolId::Freehand) {
        gesture.points.append(point);
    }
    m_gesture = gesture;

    emit changed();
    return true;
}

bool DrawingEngine::extendGesture(const QPointF &point)
{
    if (!m_gesture) {
        return false;
    }

    m_gesture->currentAnchor = point;
    if (m_gesture->tool == ToolId::Freehand) {
        m_gesture->points.append(point);
    }

    emit changed();
    return true;
}

std::optional<quint64> DrawingEngine::commitGesture()
{
    if (!m_gesture) {
        return std::nullopt;
    }

    Gesture gesture = *m_gesture;
    m_gesture.reset();

    if (!hasMovement(gesture)) {
        qDebug() << "DrawingEngine: Discarding gesture without movement";
        emit changed();
        return std::nullopt;
    }

    Stroke stroke;
    stroke.sequenceId = m_nextSequenceId++;
    stroke.color = gesture.color;
    stroke.thickness = gesture.thickness;
    stroke.geometry = buildGeometry(gesture);

    m_strokes.push_back(stroke);
    m_redoStack.clear();

    emit changed();
    return stroke.sequenceId;
}

void DrawingEngine::cancelGesture()
{
    if (!m_gesture) {
        return;
    }
    m_gesture.reset();
    emit changed();
}

bool DrawingEngine::chainFromLastPoint(const QPointF &point, const QColor &color, int thickness)
{
    if (m_gesture || m_strokes.empty()) {
        return false;
    }

    const Stroke &last = m_strokes.back();
    const QColor chainColor = color.isValid() ? color : last.color;
    const int chainThickness = thickness > 0 ? thickness : last.thickness;

    beginGesture(last.endAnchor(), ToolId::Line, chainColor, chainThickness);
    return extendGesture(point);
}

bool DrawingEngine::undo()
{
    if (m_strokes.empty()) {
        qDebug() << "DrawingEngine: Nothing to undo";
        return false;
    }

    m_redoStack.push_back(m_strokes.back());
    m_strokes.pop_back();

    emit changed();
    return true;
}

bool DrawingEngine::redo()
{
    if (m_redoStack.empty()) {
        qDebug() << "DrawingEngine: Nothing to redo";
        return false;
    }

    m_strokes.push_back(m_redoStack.back());
    m_redoStack.pop_back();

    emit changed();
    return true;
}

void DrawingEngine::clearAll()
{
    if (m_strokes.empty() && m_redoStack.empty() && !m_gesture) {
        return;
    }

    m_strokes.clear();
    m_redoStack.clear();
    m_gesture.reset();

    emit changed();
}

void DrawingEngine::render(QPainter &painter) const
{
    for (const Stroke &stroke : m_strokes) {
        GlowStrokePainter::drawStroke(painter, stroke);
    }

    if (m_gesture && hasMovement(*m_gesture)) {
        Stroke preview;
        preview.color = m_gesture->color;
        preview.thickness = m_gesture->thickness;
        preview.geometry = buildGeometry(*m_gesture);
        GlowStrokePainter::drawStroke(painter, preview);
    }
}

std::optional<ToolId> DrawingEngine::activeGestureTool() const
{
    if (!m_gesture) {
        return std::nullopt;
    }
    return m_gesture->tool;
}

std::optional<QPointF> DrawingEngine::lastCommittedPoint() const
{
    if (m_strokes.empty()) {
        return std::nullopt;
    }
    return m_strokes.back().endAnchor();
}

QVector<QPointF> DrawingEngine::gesturePoints() const
{
    return m_gesture ? m_gesture->points : QVector<QPointF>();
}

bool DrawingEngine::hasMovement(const Gesture &gesture) const
{
    if (gesture.tool == ToolId::Freehand) {
        for (const QPointF &p : gesture.points) {
            if (p != gesture.startAnchor) {
                return true;
            }
        }
        return false;
    }
    return gesture.currentAnchor != gesture.startAnchor;
}

StrokeGeometry DrawingEngine::buildGeometry(const Gesture &gesture) const
{
    switch (gesture.tool) {
    case ToolId::Freehand:
        return FreehandGeometry{ gesture.points, StrokeSmoothing::catmullRom(gesture.points) };
    case ToolId::Line:
        return LineGeometry{ gesture.startAnchor, gesture.currentAnchor };
    case ToolId::Rectangle:
        return RectangleGeometry{ gesture.startAnchor, gesture.currentAnchor };
    case ToolId::Arrow:
        return StrokeGeometryBuilder::makeArrow(gesture.startAnchor, gesture.currentAnchor,
                                                gesture.thickness);
    case ToolId::Circle:
    case ToolId::Count:
        break;
    }
    return StrokeGeometryBuilder::makeCircle(gesture.startAnchor, gesture.currentAnchor);
}
