#include "document/DocumentTypes.h"

#include <QDebug>
#include <QFileInfo>
#include <QImageReader>
#include <QUuid>
#include <QtGlobal>

Document::Document(const QString& sourcePath, const QImage& image, const QString& name)
    : m_id(QUuid::createUuid().toString(QUuid::WithoutBraces))
    , m_sourcePath(sourcePath)
    , m_name(name.isEmpty() ? QFileInfo(sourcePath).completeBaseName() : name)
    , m_image(image)
    , m_width(image.width())
    , m_height(image.height())
{
}

Document Document::fromFile(const QString& path, QString* errorMessage)
{
    QImageReader reader(path);
    reader.setAutoTransform(true);
    const QImage image = reader.read();
    if (image.isNull()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to read %1: %2").arg(path, reader.errorString());
        }
        return Document();
    }
    return Document(path, image);
}

TextBlock Document::clampedBlock(TextBlock block) const
{
    const qreal w = m_width;
    const qreal h = m_height;
    const qreal x0 = qBound(0.0, block.x, w);
    const qreal y0 = qBound(0.0, block.y, h);
    const qreal x1 = qBound(x0, block.x + qMax(0.0, block.width), w);
    const qreal y1 = qBound(y0, block.y + qMax(0.0, block.height), h);
    block.x = x0;
    block.y = y0;
    block.width = x1 - x0;
    block.height = y1 - y0;
    block.confidence = qBound(0.0f, block.confidence, 1.0f);
    return block;
}

void Document::setTextBlocks(const QVector<TextBlock>& blocks)
{
    m_textBlocks.clear();
    m_textBlocks.reserve(blocks.size());
    for (const TextBlock& block : blocks) {
        m_textBlocks.append(clampedBlock(block));
    }
}

void Document::setSegmentationMask(const QImage& mask)
{
    if (!mask.isNull() && mask.size() != size()) {
        qWarning() << "Document: Mask size" << mask.size() << "does not match page" << size()
                   << ", scaling";
        m_segmentationMask = mask.scaled(size(), Qt::IgnoreAspectRatio, Qt::FastTransformation)
                                 .convertToFormat(QImage::Format_Grayscale8);
        return;
    }
    m_segmentationMask = mask.isNull() ? QImage() : mask.convertToFormat(QImage::Format_Grayscale8);
}

void Document::setInpainted(const QImage& image)
{
    if (!image.isNull() && image.size() != size()) {
        qWarning() << "Document: Inpainted size" << image.size() << "does not match page" << size();
        return;
    }
    m_inpainted = image;
}
