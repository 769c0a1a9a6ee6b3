#include "inference/OpenCvInpaintAdapter.h"

#include "utils/MatConverter.h"

#include <QCoreApplication>
#include <QDebug>
#include <QtConcurrent>

#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

namespace {

cv::Mat ellipseKernel(int size)
{
    const int k = qMax(1, size);
    return cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(k, k));
}

} // anonymous namespace

OpenCvInpaintAdapter::OpenCvInpaintAdapter(QObject* parent)
    : QObject(parent)
    , m_cancelFlag(std::make_shared<QAtomicInt>(0))
{
}

OpenCvInpaintAdapter::~OpenCvInpaintAdapter() = default;

InpaintResult OpenCvInpaintAdapter::inpaintSync(const InpaintRequest& request)
{
    InpaintResult result;
    if (request.image.isNull()) {
        result.error = QStringLiteral("Invalid image");
        return result;
    }
    if (request.mask.isNull()) {
        result.error = QStringLiteral("Missing mask");
        return result;
    }
    if (request.mask.size() != request.image.size()) {
        result.error = QStringLiteral("Mask size %1x%2 does not match image size %3x%4")
                           .arg(request.mask.width()).arg(request.mask.height())
                           .arg(request.image.width()).arg(request.image.height());
        return result;
    }

    QRect area = request.image.rect();
    if (request.region) {
        area = request.region->intersected(request.image.rect());
        if (area.isEmpty()) {
            result.error = QStringLiteral("Region lies outside the image");
            return result;
        }
    }

    const QImage imageCrop = request.region ? request.image.copy(area) : request.image;
    const QImage maskCrop = request.region ? request.mask.copy(area) : request.mask;

    const cv::Mat bgr = MatConverter::toBgr(imageCrop);
    cv::Mat mask = MatConverter::toBinaryMask(maskCrop);

    if (request.dilateKernelSize > 0) {
        cv::dilate(mask, mask, ellipseKernel(request.dilateKernelSize));
    }
    if (request.erodeDistance > 0) {
        cv::erode(mask, mask, ellipseKernel(request.erodeDistance));
    }

    cv::Mat filled;
    if (cv::countNonZero(mask) == 0) {
        filled = bgr;
    } else {
        cv::inpaint(bgr, mask, filled, kInpaintRadius, cv::INPAINT_TELEA);
    }

    result.image = MatConverter::toQImage(filled);
    result.success = !result.image.isNull();
    if (!result.success) {
        result.error = QStringLiteral("Failed to convert inpainted image");
    }
    return result;
}

void OpenCvInpaintAdapter::inpaint(const InpaintRequest& request, const InpaintCallback& callback)
{
    // Fresh flag per call; a cancel for this call stays set until its worker starts.
    m_cancelFlag = std::make_shared<QAtomicInt>(0);
    auto cancelFlag = m_cancelFlag;

    (void)QtConcurrent::run([request, callback, cancelFlag]() {
        InpaintResult result;
        if (cancelFlag->loadAcquire() != 0) {
            qDebug() << "OpenCvInpaintAdapter: Cancelled before start, skipping";
            result.error = QStringLiteral("Cancelled");
            QMetaObject::invokeMethod(qApp, [callback, result]() {
                if (callback) {
                    callback(result);
                }
            }, Qt::QueuedConnection);
            return;
        }
        try {
            result = inpaintSync(request);
        } catch (const cv::Exception& e) {
            result = InpaintResult();
            result.error = QString::fromStdString(e.what());
            qWarning() << "OpenCvInpaintAdapter: OpenCV error:" << result.error;
        }
        if (cancelFlag->loadAcquire() != 0) {
            qDebug() << "OpenCvInpaintAdapter: Discarding result after cancel request";
            result = InpaintResult();
            result.error = QStringLiteral("Cancelled");
        }

        QMetaObject::invokeMethod(qApp, [callback, result]() {
            if (callback) {
                callback(result);
            }
        }, Qt::QueuedConnection);
    });
}

void OpenCvInpaintAdapter::requestCancel()
{
    m_cancelFlag->storeRelease(1);
}
