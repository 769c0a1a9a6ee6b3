#ifndef DOCUMENTTYPES_H
#define DOCUMENTTYPES_H

#include <QColor>
#include <QImage>
#include <QMetaType>
#include <QRectF>
#include <QSize>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

/**
 * @brief Typesetting style for a translated text block.
 */
struct TextStyle {
    QStringList fontFamilies;
    qreal fontSize = 0.0;
    QColor color = Qt::black;

    bool operator==(const TextStyle& other) const
    {
        return fontFamilies == other.fontFamilies
            && qFuzzyCompare(fontSize + 1.0, other.fontSize + 1.0)
            && color == other.color;
    }
};

/**
 * @brief Detected text region in document pixel coordinates.
 */
struct TextBlock {
    qreal x = 0.0;
    qreal y = 0.0;
    qreal width = 0.0;
    qreal height = 0.0;
    float confidence = 0.0f;                ///< Detector confidence in [0,1]
    std::optional<QString> text;            ///< Recognized source text
    std::optional<QString> translation;     ///< Translated text
    std::optional<TextStyle> style;
    QImage rendered;                        ///< Typeset overlay, null until rendered

    QRectF rect() const { return QRectF(x, y, width, height); }

    // Inclusive on all four edges.
    bool contains(const QPointF& point) const
    {
        return point.x() >= x && point.x() <= x + width
            && point.y() >= y && point.y() <= y + height;
    }

    bool hasText() const { return text.has_value() && !text->trimmed().isEmpty(); }
    bool hasTranslation() const { return translation.has_value() && !translation->isEmpty(); }
};

/**
 * @brief One page of the working set plus everything derived from it.
 *
 * The source image is implicitly shared and never modified. Width and
 * height are fixed at construction; derived buffers stay null until the
 * stage that produces them has run on this page.
 */
class Document
{
public:
    Document() = default;
    Document(const QString& sourcePath, const QImage& image, const QString& name = QString());

    static Document fromFile(const QString& path, QString* errorMessage = nullptr);

    QString id() const { return m_id; }
    QString sourcePath() const { return m_sourcePath; }
    QString name() const { return m_name; }
    QImage image() const { return m_image; }
    int width() const { return m_width; }
    int height() const { return m_height; }
    QSize size() const { return QSize(m_width, m_height); }
    bool isNull() const { return m_image.isNull(); }

    const QVector<TextBlock>& textBlocks() const { return m_textBlocks; }
    QVector<TextBlock>& textBlocks() { return m_textBlocks; }
    void setTextBlocks(const QVector<TextBlock>& blocks);
    TextBlock clampedBlock(TextBlock block) const;

    QImage segmentationMask() const { return m_segmentationMask; }
    void setSegmentationMask(const QImage& mask);

    QImage inpainted() const { return m_inpainted; }
    void setInpainted(const QImage& image);

    QImage rendered() const { return m_rendered; }
    void setRendered(const QImage& image) { m_rendered = image; }

private:
    QString m_id;
    QString m_sourcePath;
    QString m_name;
    QImage m_image;
    int m_width = 0;
    int m_height = 0;
    QVector<TextBlock> m_textBlocks;
    QImage m_segmentationMask;
    QImage m_inpainted;
    QImage m_rendered;
};

Q_DECLARE_METATYPE(TextBlock)

#endif // DOCUMENTTYPES_H
