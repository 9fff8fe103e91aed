#ifndef SPOTLIGHTRENDERER_H
#define SPOTLIGHTRENDERER_H

#include <QBrush>
#include <QObject>
#include <QPen>
#include <QPointF>
#include <QRadialGradient>

#include "settings/OverlayConfig.h"

class QPainter;

/**
 * @brief Cursor spotlight: a radial glow out to the configured radius
 * plus a bright ring at the ring radius.
 *
 * The gradient, brush and ring pen are rebuilt only when the
 * configuration changes. They are centered on the origin, so drawing a
 * frame only translates the painter to the cursor.
 */
class SpotlightRenderer : public QObject
{
    Q_OBJECT

public:
    struct Geometry {
        QPointF center;
        qreal ringRadius = 0.0;
        qreal outerRadius = 0.0;
        bool visible = false;
    };

    explicit SpotlightRenderer(QObject *parent = nullptr);
    ~SpotlightRenderer() override;

    void applyConfig(const Glowpoint::SpotlightConfig &config);
    const Glowpoint::SpotlightConfig &config() const { return m_config; }

    /**
     * @brief Move the spotlight to a new cursor position.
     *
     * Emits needsRepaint only when the position actually changes.
     */
    void update(const QPointF &cursorPosition);

    void render(QPainter &painter) const;

    Geometry geometry() const;
    bool hasPosition() const { return m_hasPosition; }

    /**
     * @brief Area touched by the last and current frame, for partial repaints.
     */
    QRectF dirtyRect(const QPointF &previousPosition) const;

signals:
    void needsRepaint();

private:
    void rebuildPaintResources();

    Glowpoint::SpotlightConfig m_config;
    QPointF m_cursorPos;
    bool m_hasPosition = false;

    QRadialGradient m_glowGradient;
    QBrush m_glowBrush;
    QPen m_ringPen;

    static constexpr qreal kRingPenWidth = 3.0;
};

#endif // SPOTLIGHTRENDERER_H
