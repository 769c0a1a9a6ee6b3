#ifndef REGIONACCUMULATOR_H
#define REGIONACCUMULATOR_H

#include <QPointF>
#include <QRect>
#include <QSize>

#include <optional>

/**
 * RegionAccumulator - grows an axis-aligned box over brush dabs
 *
 * The box starts undefined; the first point establishes it. toRegion()
 * turns it into an integer rectangle inside the document that still covers
 * every accumulated point lying in the document.
 */
class RegionAccumulator
{
public:
    struct Bounds {
        qreal minX = 0.0;
        qreal minY = 0.0;
        qreal maxX = 0.0;
        qreal maxY = 0.0;

        qreal width() const { return maxX - minX; }
        qreal height() const { return maxY - minY; }
    };

    static constexpr qreal kMarginFactor = 0.2;
    static constexpr qreal kMaxMargin = 32.0;

    static Bounds expandBounds(const std::optional<Bounds>& bounds, const QPointF& point,
                               qreal radius);
    static QRect toRegion(const Bounds& bounds, const QSize& documentSize);
    static QRect toRegionWithMargin(const Bounds& bounds, qreal brushSize,
                                    const QSize& documentSize);
    static QPointF clampToDocument(const QPointF& point, const QSize& documentSize);

    void addPoint(const QPointF& point, qreal radius);
    void reset() { m_bounds.reset(); }
    bool isEmpty() const { return !m_bounds.has_value(); }
    std::optional<Bounds> bounds() const { return m_bounds; }

private:
    std::optional<Bounds> m_bounds;
};

#endif // REGIONACCUMULATOR_H
