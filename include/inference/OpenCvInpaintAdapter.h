#ifndef OPENCVINPAINTADAPTER_H
#define OPENCVINPAINTADAPTER_H

#include "inference/IInferenceAdapters.h"

#include <QAtomicInt>
#include <QObject>

#include <memory>

/**
 * @brief Fills masked text with OpenCV's Telea inpainting.
 *
 * The mask is dilated by the kernel size, then eroded by the erode
 * distance, before filling. With a region, only that rectangle of image
 * and mask is processed and the result has the region's size.
 */
class OpenCvInpaintAdapter : public QObject, public IInpaintAdapter
{
    Q_OBJECT

public:
    static constexpr double kInpaintRadius = 3.0;

    explicit OpenCvInpaintAdapter(QObject* parent = nullptr);
    ~OpenCvInpaintAdapter() override;

    QString name() const override { return QStringLiteral("opencv-telea"); }
    void inpaint(const InpaintRequest& request, const InpaintCallback& callback) override;
    void requestCancel() override;

    static InpaintResult inpaintSync(const InpaintRequest& request);

private:
    std::shared_ptr<QAtomicInt> m_cancelFlag;
};

#endif // OPENCVINPAINTADAPTER_H
