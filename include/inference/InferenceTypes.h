#ifndef INFERENCETYPES_H
#define INFERENCETYPES_H

#include "document/DocumentTypes.h"

#include <QImage>
#include <QMetaType>
#include <QRect>
#include <QString>
#include <QVector>

#include <functional>
#include <optional>

struct DetectRequest {
    QImage image;
    float confThreshold = 0.5f;
    float nmsThreshold = 0.4f;
};

/**
 * @brief Detected blocks (text fields empty) plus a page-sized mask.
 */
struct DetectResult {
    bool success = false;
    QString error;
    QVector<TextBlock> blocks;
    QImage segmentationMask;    ///< Grayscale8, non-zero where text strokes are
};

struct OcrRequest {
    QImage image;               ///< Block crop
};

struct OcrResult {
    bool success = false;
    QString error;
    QString text;
};

struct InpaintRequest {
    QImage image;
    QImage mask;
    std::optional<QRect> region;    ///< Unset for the whole page
    int dilateKernelSize = 5;
    int erodeDistance = 3;
};

/**
 * @brief Filled image; region-sized when the request carried a region.
 */
struct InpaintResult {
    bool success = false;
    QString error;
    QImage image;
};

struct TranslateRequest {
    QString sourceText;
    QString systemPrompt;
};

struct TranslateResult {
    bool success = false;
    QString error;
    QString text;
    int statusCode = 0;         ///< HTTP status, 0 when no response was received
};

using DetectCallback = std::function<void(const DetectResult& result)>;
using OcrCallback = std::function<void(const OcrResult& result)>;
using InpaintCallback = std::function<void(const InpaintResult& result)>;
using TranslateCallback = std::function<void(const TranslateResult& result)>;

Q_DECLARE_METATYPE(DetectResult)
Q_DECLARE_METATYPE(OcrResult)
Q_DECLARE_METATYPE(InpaintResult)
Q_DECLARE_METATYPE(TranslateResult)

#endif // INFERENCETYPES_H
