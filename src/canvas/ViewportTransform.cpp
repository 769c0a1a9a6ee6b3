#include "canvas/ViewportTransform.h"

#include <QtMath>

#include <cmath>

namespace {
constexpr qreal kFitEpsilon = 1e-6;
}

ViewportTransform::ViewportTransform(QObject* parent)
    : QObject(parent)
{
}

int ViewportTransform::clampScale(qreal value)
{
    if (!std::isfinite(value)) {
        return kDefaultScale;
    }
    return qRound(qBound<qreal>(kMinScale, value, kMaxScale));
}

int ViewportTransform::fitToViewport(const QSizeF& viewportSize, const QSize& documentSize)
{
    if (documentSize.width() <= 0 || documentSize.height() <= 0) {
        return m_scale;
    }
    if (!(viewportSize.width() > 0.0) || !(viewportSize.height() > 0.0)) {
        return m_scale;
    }

    const qreal ratio = qMin(viewportSize.width() / documentSize.width(),
                             viewportSize.height() / documentSize.height());
    // Bound as a real number first; huge ratios do not fit in an int.
    const qreal percent = qBound<qreal>(kMinScale, std::floor(ratio * 100.0 + kFitEpsilon),
                                        kMaxScale);
    applyScale(static_cast<int>(percent));
    setAutoFitEnabled(true);
    return m_scale;
}

void ViewportTransform::resetScale()
{
    applyScale(kDefaultScale);
    setAutoFitEnabled(false);
}

void ViewportTransform::setScale(qreal value)
{
    applyScale(clampScale(value));
    setAutoFitEnabled(false);
}

void ViewportTransform::setAutoFitEnabled(bool enabled)
{
    if (m_autoFit == enabled) {
        return;
    }
    m_autoFit = enabled;
    emit autoFitChanged(m_autoFit);
}

void ViewportTransform::setCurrentPageIndex(int index)
{
    if (m_currentPageIndex == index) {
        return;
    }
    m_currentPageIndex = index;
    emit currentPageIndexChanged(index);
}

void ViewportTransform::applyScale(int scale)
{
    if (m_scale == scale) {
        return;
    }
    m_scale = scale;
    emit scaleChanged(m_scale);
}

std::optional<QPointF> ViewportTransform::pointerToDocument(const QPointF& pointerPos,
                                                            const QRectF& containerRect,
                                                            int scale)
{
    if (containerRect.isNull() || scale <= 0) {
        return std::nullopt;
    }
    const qreal ratio = scale / 100.0;
    const qreal x = (pointerPos.x() - containerRect.left()) / ratio;
    const qreal y = (pointerPos.y() - containerRect.top()) / ratio;
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return std::nullopt;
    }
    return QPointF(x, y);
}

QPointF ViewportTransform::documentToPointer(const QPointF& documentPos,
                                             const QRectF& containerRect,
                                             int scale)
{
    const qreal ratio = scale / 100.0;
    return QPointF(containerRect.left() + documentPos.x() * ratio,
                   containerRect.top() + documentPos.y() * ratio);
}
