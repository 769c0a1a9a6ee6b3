#ifndef INKWELL_MATCONVERTER_H
#define INKWELL_MATCONVERTER_H

#include <QImage>

#include <opencv2/core.hpp>

// QImage <-> cv::Mat conversion for the image stages.
//
// Qt's Format_RGB32 is 0xAARRGGBB, i.e. B-G-R-A bytes on little-endian
// machines, which is OpenCV's 4-channel order. Masks travel as
// Format_Grayscale8 <-> CV_8UC1 with non-zero meaning "masked".

namespace MatConverter {

// Deep-copy CV_8UC3 (BGR), the layout cv::inpaint accepts.
cv::Mat toBgr(const QImage& image);

// Single-channel luminance of any QImage.
cv::Mat toGray(const QImage& image);

// Binary CV_8UC1 mask: 255 where the source mask is non-zero.
cv::Mat toBinaryMask(const QImage& mask);

// CV_8UC4 -> Format_RGB32, CV_8UC3 -> Format_RGB32, CV_8UC1 ->
// Format_Grayscale8. Always a deep copy; null for other types.
QImage toQImage(const cv::Mat& mat);

} // namespace MatConverter

#endif // INKWELL_MATCONVERTER_H
