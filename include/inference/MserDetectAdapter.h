#ifndef MSERDETECTADAPTER_H
#define MSERDETECTADAPTER_H

#include "inference/IInferenceAdapters.h"

#include <QAtomicInt>
#include <QObject>
#include <QRect>

#include <memory>

/**
 * @brief Text-region detector built on OpenCV MSER.
 *
 * Stable extremal regions that look like glyphs are clustered into blocks.
 * A block's confidence grows with the number of glyph regions it holds;
 * blocks below the confidence threshold are dropped and overlapping blocks
 * are suppressed by IoU. The mask marks the pixels of the kept glyphs.
 */
class MserDetectAdapter : public QObject, public IDetectAdapter
{
    Q_OBJECT

public:
    struct Config {
        int delta = 5;                  ///< MSER stability delta
        int minArea = 30;               ///< Minimum glyph area
        int maxArea = 14400;            ///< Maximum glyph area
        double maxVariation = 0.25;
        int mergePadding = 6;           ///< Gap bridged when clustering glyphs
        double membersForHalfConfidence = 2.0;
    };

    explicit MserDetectAdapter(QObject* parent = nullptr);
    ~MserDetectAdapter() override;

    QString name() const override { return QStringLiteral("mser"); }
    void detect(const DetectRequest& request, const DetectCallback& callback) override;
    void requestCancel() override;

    static DetectResult detectSync(const DetectRequest& request, const Config& config);

    void setConfig(const Config& config) { m_config = config; }
    Config config() const { return m_config; }

    static float confidenceForMembers(int members, double membersForHalfConfidence);
    static double intersectionOverUnion(const QRectF& a, const QRectF& b);

private:
    Config m_config;
    std::shared_ptr<QAtomicInt> m_cancelFlag;
};

#endif // MSERDETECTADAPTER_H
