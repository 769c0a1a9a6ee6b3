#include "canvas/RegionAccumulator.h"

#include <QtGlobal>

#include <cmath>

RegionAccumulator::Bounds RegionAccumulator::expandBounds(const std::optional<Bounds>& bounds,
                                                          const QPointF& point, qreal radius)
{
    const qreal r = qMax<qreal>(0.0, radius);
    const Bounds dab{point.x() - r, point.y() - r, point.x() + r, point.y() + r};
    if (!bounds) {
        return dab;
    }
    return Bounds{qMin(bounds->minX, dab.minX), qMin(bounds->minY, dab.minY),
                  qMax(bounds->maxX, dab.maxX), qMax(bounds->maxY, dab.maxY)};
}

QRect RegionAccumulator::toRegion(const Bounds& bounds, const QSize& documentSize)
{
    const int w = documentSize.width();
    const int h = documentSize.height();
    if (w <= 0 || h <= 0) {
        return QRect();
    }
    if (!std::isfinite(bounds.minX) || !std::isfinite(bounds.minY)
        || !std::isfinite(bounds.maxX) || !std::isfinite(bounds.maxY)) {
        return QRect();
    }

    // Floor the min corner, ceil the max corner; keep at least one pixel.
    // Corners are bounded before the cast so far-off points cannot overflow.
    const int x0 = static_cast<int>(qBound<qreal>(0.0, std::floor(bounds.minX), w - 1));
    const int y0 = static_cast<int>(qBound<qreal>(0.0, std::floor(bounds.minY), h - 1));
    const int x1 = static_cast<int>(qBound<qreal>(x0 + 1, std::ceil(bounds.maxX), w));
    const int y1 = static_cast<int>(qBound<qreal>(y0 + 1, std::ceil(bounds.maxY), h));
    return QRect(x0, y0, x1 - x0, y1 - y0);
}

QRect RegionAccumulator::toRegionWithMargin(const Bounds& bounds, qreal brushSize,
                                            const QSize& documentSize)
{
    const qreal extent = qMax(bounds.width(), bounds.height());
    const qreal margin = qMin(qMax(brushSize, extent) * kMarginFactor, kMaxMargin);
    const Bounds padded{bounds.minX - margin, bounds.minY - margin,
                        bounds.maxX + margin, bounds.maxY + margin};
    return toRegion(padded, documentSize);
}

QPointF RegionAccumulator::clampToDocument(const QPointF& point, const QSize& documentSize)
{
    return QPointF(qBound<qreal>(0.0, point.x(), documentSize.width()),
                   qBound<qreal>(0.0, point.y(), documentSize.height()));
}

void RegionAccumulator::addPoint(const QPointF& point, qreal radius)
{
    m_bounds = expandBounds(m_bounds, point, radius);
}
