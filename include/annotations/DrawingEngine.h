#ifndef DRAWINGENGINE_H
#define DRAWINGENGINE_H

#include <QColor>
#include <QObject>
#include <QPointF>
#include <QVector>
#include <optional>
#include <vector>

#include "annotations/Stroke.h"
#include "tools/ToolId.h"

class QPainter;

/**
 * @brief Owns committed strokes, the gesture in progress and the
 * undo/redo history.
 *
 * The committed list doubles as the undo stack: undo moves the newest
 * stroke to the redo buffer, redo moves it back. Any new commit clears
 * the redo buffer. History is bounded only by memory.
 *
 * All methods run on the control thread.
 */
class DrawingEngine : public QObject
{
    Q_OBJECT

public:
    static constexpr int kMinThickness = 1;
    static constexpr int kMaxThickness = 20;

    explicit DrawingEngine(QObject *parent = nullptr);
    ~DrawingEngine() override;

    /**
     * @brief Start a gesture at point.
     * @return false when a gesture is already in progress (no-op).
     */
    bool beginGesture(const QPointF &point, ToolId tool, const QColor &color, int thickness);

    /**
     * @brief Feed a pointer move into the active gesture.
     *
     * Freehand appends a control point; shape tools move the current anchor.
     * @return false when no gesture is active.
     */
    bool extendGesture(const QPointF &point);

    /**
     * @brief Finalize the active gesture into a committed stroke.
     *
     * Gestures without movement are discarded.
     * @return the committed stroke's sequence id, or std::nullopt when
     *         nothing was committed.
     */
    std::optional<quint64> commitGesture();

    void cancelGesture();

    /**
     * @brief Start a straight segment from the last committed point.
     *
     * The current anchor is placed at point. An invalid color or a
     * non-positive thickness inherits the newest stroke's value.
     * @return false when there is no committed stroke or a gesture is active.
     */
    bool chainFromLastPoint(const QPointF &point, const QColor &color = QColor(), int thickness = 0);

    bool undo();
    bool redo();

    /**
     * @brief Drop every stroke, both history stacks and the gesture.
     *
     * Irreversible. Calling it on an empty engine is a no-op.
     */
    void clearAll();

    void render(QPainter &painter) const;

    bool hasActiveGesture() const { return m_gesture.has_value(); }
    std::optional<ToolId> activeGestureTool() const;
    std::optional<QPointF> lastCommittedPoint() const;

    const std::vector<Stroke> &committedStrokes() const { return m_strokes; }
    size_t strokeCount() const { return m_strokes.size(); }
    size_t redoCount() const { return m_redoStack.size(); }
    bool canUndo() const { return !m_strokes.empty(); }
    bool canRedo() const { return !m_redoStack.empty(); }
    bool isEmpty() const { return m_strokes.empty() && !m_gesture; }

    /**
     * @brief Points recorded so far by the active freehand gesture.
     */
    QVector<QPointF> gesturePoints() const;

signals:
    /**
     * @brief Emitted whenever the rendered output changes.
     */
    void changed();

private:
    struct Gesture {
        ToolId tool = ToolId::Freehand;
        QColor color;
        int thickness = kMinThickness;
        QPointF startAnchor;
        QPointF currentAnchor;
        QVector<QPointF> points;  // freehand only
    };

    bool hasMovement(const Gesture &gesture) const;
    StrokeGeometry buildGeometry(const Gesture &gesture) const;

    std::vector<Stroke> m_strokes;
    std::vector<Stroke> m_redoStack;
    std::optional<Gesture> m_gesture;
    quint64 m_nextSequenceId = 1;
};

#endif // DRAWINGENGINE_H
