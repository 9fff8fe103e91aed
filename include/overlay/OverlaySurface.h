#ifndef OVERLAYSURFACE_H
#define OVERLAYSURFACE_H

#include <QPointF>
#include <QWidget>
#include <functional>

#include "overlay/MonitorLayout.h"

/**
 * @brief Transparent, borderless, always-on-top window spanning every monitor.
 *
 * In ClickThrough mode pointer input reaches the applications underneath.
 * In Capture mode the surface takes pointer and keyboard input and
 * reports it in global coordinates. Painting is delegated; the painter
 * handed to the delegate is already translated to global coordinates.
 */
class OverlaySurface : public QWidget
{
    Q_OBJECT

public:
    enum class InputMode {
        ClickThrough,
        Capture
    };

    using PaintDelegate = std::function<void(QPainter&)>;

    explicit OverlaySurface(QWidget *parent = nullptr);
    ~OverlaySurface() override;

    // Geometry becomes the layout's bounding rectangle; areas outside the
    // covered region (taskbars, gaps between mismatched displays) are masked out.
    void setMonitorLayout(const MonitorLayout &layout);
    const MonitorLayout &monitorLayout() const { return m_layout; }

    void setInputMode(InputMode mode);
    InputMode inputMode() const { return m_inputMode; }

    void setPaintDelegate(PaintDelegate delegate);

    /**
     * @brief Schedule a repaint of a rectangle given in global coordinates.
     */
    void updateGlobalRect(const QRectF &globalRect);

signals:
    void pointerPressed(const QPointF &globalPos, Qt::MouseButton button, Qt::KeyboardModifiers modifiers);
    void pointerMoved(const QPointF &globalPos);
    void pointerReleased(const QPointF &globalPos, Qt::MouseButton button);
    void wheelScrolled(int steps);
    void keyPressed(int key, Qt::KeyboardModifiers modifiers, const QString &text);

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;

private:
    QPointF toGlobal(const QPointF &localPos) const;
    void applyCoveredMask();

    MonitorLayout m_layout;
    InputMode m_inputMode = InputMode::ClickThrough;
    PaintDelegate m_paintDelegate;
    int m_wheelRemainder = 0;
};

#endif // OVERLAYSURFACE_H
