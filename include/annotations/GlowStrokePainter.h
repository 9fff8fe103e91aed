#ifndef GLOWSTROKEPAINTER_H
#define GLOWSTROKEPAINTER_H

#include <QColor>
#include <QtGlobal>

class QPainter;
class QPainterPath;
struct Stroke;

/**
 * @brief Renders strokes with a feathered glow.
 *
 * Each stroke is drawn as a few widening translucent passes around a
 * solid core pass of the stroke's own thickness. Arrowheads are filled
 * with the same layering.
 */
class GlowStrokePainter
{
public:
    struct GlowLayer {
        int extraWidth;   // added to the stroke thickness
        qreal alpha;      // alpha multiplier for the stroke color
    };

    // Outermost first; the core pass follows the last layer.
    static constexpr int kGlowLayerCount = 3;
    static constexpr GlowLayer kGlowLayers[kGlowLayerCount] = {
        { 14, 0.12 },
        { 9, 0.2 },
        { 4, 0.35 },
    };

    static void drawStroke(QPainter& painter, const Stroke& stroke);

    static void drawGlowPath(QPainter& painter, const QPainterPath& path,
                             const QColor& color, int thickness);
    static void drawGlowFill(QPainter& painter, const QPainterPath& path,
                             const QColor& color, int thickness);
};

#endif // GLOWSTROKEPAINTER_H
