#include "inference/MserDetectAdapter.h"

#include "utils/MatConverter.h"

#include <QCoreApplication>
#include <QDebug>
#include <QPointer>
#include <QtConcurrent>

#include <algorithm>
#include <cmath>

#include <opencv2/features2d.hpp>
#include <opencv2/imgproc.hpp>

namespace {

struct Cluster {
    QRect rect;
    int members = 1;
    QVector<int> regionIndices;
};

bool isGlyphLike(const QRect& rect)
{
    if (rect.width() < 3 || rect.height() < 5) {
        return false;
    }
    const double aspectRatio = static_cast<double>(rect.width()) / rect.height();
    if (aspectRatio < 0.1 || aspectRatio > 10.0) {
        return false;
    }
    return !(rect.width() > 500 && rect.height() > 500);
}

void absorb(Cluster& into, const Cluster& other)
{
    into.rect = into.rect.united(other.rect);
    into.members += other.members;
    into.regionIndices += other.regionIndices;
}

// One sweep along an axis: sort, then fold each cluster into the running one
// while their padded rectangles touch.
QVector<Cluster> sweepMerge(QVector<Cluster> clusters, int padding, bool horizontal)
{
    if (clusters.size() < 2) {
        return clusters;
    }
    std::sort(clusters.begin(), clusters.end(), [horizontal](const Cluster& a, const Cluster& b) {
        return horizontal ? a.rect.x() < b.rect.x() : a.rect.y() < b.rect.y();
    });

    QVector<Cluster> merged;
    Cluster current = clusters.first();
    for (int i = 1; i < clusters.size(); ++i) {
        const QRect padded = current.rect.adjusted(-padding, -padding, padding, padding);
        if (padded.intersects(clusters.at(i).rect)) {
            absorb(current, clusters.at(i));
        } else {
            merged.append(current);
            current = clusters.at(i);
        }
    }
    merged.append(current);
    return merged;
}

} // anonymous namespace

MserDetectAdapter::MserDetectAdapter(QObject* parent)
    : QObject(parent)
    , m_cancelFlag(std::make_shared<QAtomicInt>(0))
{
}

MserDetectAdapter::~MserDetectAdapter() = default;

float MserDetectAdapter::confidenceForMembers(int members, double membersForHalfConfidence)
{
    if (members <= 0 || membersForHalfConfidence <= 0.0) {
        return 0.0f;
    }
    // 1 - 2^(-members / half): reaches 0.5 at `half` glyphs.
    const double confidence = 1.0 - std::pow(2.0, -members / membersForHalfConfidence);
    return static_cast<float>(qBound(0.0, confidence, 1.0));
}

double MserDetectAdapter::intersectionOverUnion(const QRectF& a, const QRectF& b)
{
    const QRectF overlap = a.intersected(b);
    if (overlap.isEmpty()) {
        return 0.0;
    }
    const double inter = overlap.width() * overlap.height();
    const double uni = a.width() * a.height() + b.width() * b.height() - inter;
    return uni > 0.0 ? inter / uni : 0.0;
}

DetectResult MserDetectAdapter::detectSync(const DetectRequest& request, const Config& config)
{
    DetectResult result;
    if (request.image.isNull()) {
        result.error = QStringLiteral("Invalid image");
        return result;
    }

    const cv::Mat gray = MatConverter::toGray(request.image);
    cv::Ptr<cv::MSER> mser = cv::MSER::create(config.delta, config.minArea, config.maxArea,
                                              config.maxVariation);

    std::vector<std::vector<cv::Point>> regions;
    std::vector<cv::Rect> boxes;
    mser->detectRegions(gray, regions, boxes);

    QVector<Cluster> clusters;
    for (size_t i = 0; i < boxes.size(); ++i) {
        const QRect rect(boxes[i].x, boxes[i].y, boxes[i].width, boxes[i].height);
        if (isGlyphLike(rect)) {
            Cluster cluster;
            cluster.rect = rect;
            cluster.regionIndices.append(static_cast<int>(i));
            clusters.append(cluster);
        }
    }

    clusters = sweepMerge(clusters, config.mergePadding, true);
    clusters = sweepMerge(clusters, config.mergePadding, false);

    struct Candidate {
        TextBlock block;
        QVector<int> regionIndices;
    };
    QVector<Candidate> candidates;
    for (const Cluster& cluster : clusters) {
        Candidate candidate;
        candidate.block.x = cluster.rect.x();
        candidate.block.y = cluster.rect.y();
        candidate.block.width = cluster.rect.width();
        candidate.block.height = cluster.rect.height();
        candidate.block.confidence = confidenceForMembers(cluster.members,
                                                          config.membersForHalfConfidence);
        candidate.regionIndices = cluster.regionIndices;
        if (candidate.block.confidence >= request.confThreshold) {
            candidates.append(candidate);
        }
    }

    // Non-maximum suppression, highest confidence first.
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        return a.block.confidence > b.block.confidence;
    });
    QVector<Candidate> kept;
    for (const Candidate& candidate : candidates) {
        bool suppressed = false;
        for (const Candidate& other : kept) {
            if (intersectionOverUnion(candidate.block.rect(), other.block.rect())
                > request.nmsThreshold) {
                suppressed = true;
                break;
            }
        }
        if (!suppressed) {
            kept.append(candidate);
        }
    }

    std::sort(kept.begin(), kept.end(), [](const Candidate& a, const Candidate& b) {
        return a.block.y + a.block.height / 2.0 < b.block.y + b.block.height / 2.0;
    });

    cv::Mat mask = cv::Mat::zeros(gray.rows, gray.cols, CV_8UC1);
    for (const Candidate& candidate : kept) {
        result.blocks.append(candidate.block);
        for (int index : candidate.regionIndices) {
            for (const cv::Point& point : regions[static_cast<size_t>(index)]) {
                mask.at<uchar>(point) = 255;
            }
        }
    }

    result.segmentationMask = MatConverter::toQImage(mask);
    result.success = true;
    qDebug() << "MserDetectAdapter: Detected" << result.blocks.size() << "blocks"
             << "(from" << boxes.size() << "MSER regions)";
    return result;
}

void MserDetectAdapter::detect(const DetectRequest& request, const DetectCallback& callback)
{
    if (request.image.isNull()) {
        DetectResult result;
        result.error = QStringLiteral("Invalid image");
        if (callback) {
            callback(result);
        }
        return;
    }

    // Fresh flag per call; a cancel for this call stays set until its worker starts.
    m_cancelFlag = std::make_shared<QAtomicInt>(0);
    auto cancelFlag = m_cancelFlag;
    const Config config = m_config;

    (void)QtConcurrent::run([request, config, callback, cancelFlag]() {
        DetectResult result;
        if (cancelFlag->loadAcquire() != 0) {
            qDebug() << "MserDetectAdapter: Cancelled before start, skipping";
            result.error = QStringLiteral("Cancelled");
            QMetaObject::invokeMethod(qApp, [callback, result]() {
                if (callback) {
                    callback(result);
                }
            }, Qt::QueuedConnection);
            return;
        }
        try {
            result = detectSync(request, config);
        } catch (const cv::Exception& e) {
            result = DetectResult();
            result.error = QString::fromStdString(e.what());
            qWarning() << "MserDetectAdapter: OpenCV error:" << result.error;
        }
        if (cancelFlag->loadAcquire() != 0) {
            qDebug() << "MserDetectAdapter: Discarding result after cancel request";
            result = DetectResult();
            result.error = QStringLiteral("Cancelled");
        }

        QMetaObject::invokeMethod(qApp, [callback, result]() {
            if (callback) {
                callback(result);
            }
        }, Qt::QueuedConnection);
    });
}

void MserDetectAdapter::requestCancel()
{
    m_cancelFlag->storeRelease(1);
}
