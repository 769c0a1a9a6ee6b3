#include "utils/MatConverter.h"

#include <QDebug>

#include <opencv2/imgproc.hpp>

namespace MatConverter {

namespace {

// Wraps without copying; the QImage must outlive the Mat.
cv::Mat wrapRgb32(const QImage& rgb)
{
    return cv::Mat(rgb.height(), rgb.width(), CV_8UC4,
                   const_cast<uchar*>(rgb.constBits()),
                   static_cast<size_t>(rgb.bytesPerLine()));
}

} // anonymous namespace

cv::Mat toBgr(const QImage& image)
{
    if (image.isNull()) {
        qWarning() << "MatConverter::toBgr: received null QImage";
        return {};
    }
    const QImage rgb = image.convertToFormat(QImage::Format_RGB32);
    cv::Mat bgr;
    cv::cvtColor(wrapRgb32(rgb), bgr, cv::COLOR_BGRA2BGR);
    return bgr;
}

cv::Mat toGray(const QImage& image)
{
    if (image.isNull()) {
        qWarning() << "MatConverter::toGray: received null QImage";
        return {};
    }
    const QImage rgb = image.convertToFormat(QImage::Format_RGB32);
    cv::Mat gray;
    cv::cvtColor(wrapRgb32(rgb), gray, cv::COLOR_BGRA2GRAY);
    return gray;
}

cv::Mat toBinaryMask(const QImage& mask)
{
    if (mask.isNull()) {
        return {};
    }
    const QImage gray = mask.convertToFormat(QImage::Format_Grayscale8);
    const cv::Mat view(gray.height(), gray.width(), CV_8UC1,
                       const_cast<uchar*>(gray.constBits()),
                       static_cast<size_t>(gray.bytesPerLine()));
    cv::Mat binary;
    cv::threshold(view, binary, 0, 255, cv::THRESH_BINARY);
    return binary;
}

QImage toQImage(const cv::Mat& mat)
{
    if (mat.empty()) {
        return {};
    }
    if (mat.type() == CV_8UC4) {
        return QImage(mat.data, mat.cols, mat.rows,
                      static_cast<int>(mat.step),
                      QImage::Format_RGB32).copy();
    }
    if (mat.type() == CV_8UC3) {
        cv::Mat bgra;
        cv::cvtColor(mat, bgra, cv::COLOR_BGR2BGRA);
        return toQImage(bgra);
    }
    if (mat.type() == CV_8UC1) {
        return QImage(mat.data, mat.cols, mat.rows,
                      static_cast<int>(mat.step),
                      QImage::Format_Grayscale8).copy();
    }
    qWarning() << "MatConverter::toQImage: unsupported Mat type" << mat.type();
    return {};
}

} // namespace MatConverter
