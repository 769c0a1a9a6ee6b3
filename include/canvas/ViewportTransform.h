#ifndef VIEWPORTTRANSFORM_H
#define VIEWPORTTRANSFORM_H

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QSizeF>

#include <optional>

/**
 * ViewportTransform - zoom state and pointer <-> document mapping
 *
 * Scale is an integer percentage in [kMinScale, kMaxScale]. Auto-fit uses a
 * continuous ratio floored to a whole percent so a fitted page never
 * overflows its viewport.
 */
class ViewportTransform : public QObject
{
    Q_OBJECT

public:
    static constexpr int kMinScale = 10;
    static constexpr int kMaxScale = 100;
    static constexpr int kDefaultScale = 100;

    explicit ViewportTransform(QObject* parent = nullptr);

    int scale() const { return m_scale; }
    qreal scaleRatio() const { return m_scale / 100.0; }
    bool autoFitEnabled() const { return m_autoFit; }
    int currentPageIndex() const { return m_currentPageIndex; }

    /**
     * @brief Fit the document inside the viewport and enable auto-fit.
     * @return The new scale, or the unchanged scale when either size is empty.
     */
    int fitToViewport(const QSizeF& viewportSize, const QSize& documentSize);

    void resetScale();
    void setScale(qreal value);
    void setAutoFitEnabled(bool enabled);
    void setCurrentPageIndex(int index);

    static int clampScale(qreal value);

    // Empty when the surface is gone (null container) or the mapping
    // cannot produce finite coordinates.
    static std::optional<QPointF> pointerToDocument(const QPointF& pointerPos,
                                                    const QRectF& containerRect,
                                                    int scale);
    static QPointF documentToPointer(const QPointF& documentPos,
                                     const QRectF& containerRect,
                                     int scale);

    std::optional<QPointF> pointerToDocument(const QPointF& pointerPos,
                                             const QRectF& containerRect) const
    {
        return pointerToDocument(pointerPos, containerRect, m_scale);
    }

signals:
    void scaleChanged(int scale);
    void autoFitChanged(bool enabled);
    void currentPageIndexChanged(int index);

private:
    void applyScale(int scale);

    int m_scale = kDefaultScale;
    bool m_autoFit = false;
    int m_currentPageIndex = -1;
};

#endif // VIEWPORTTRANSFORM_H
