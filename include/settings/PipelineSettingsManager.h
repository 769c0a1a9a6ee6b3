#ifndef PIPELINESETTINGSMANAGER_H
#define PIPELINESETTINGSMANAGER_H

#include <QString>

/**
 * @brief Thresholds passed to the text-region detector.
 */
struct DetectConfig {
    float confThreshold = 0.5f;   ///< Minimum detector confidence, [0,1]
    float nmsThreshold = 0.4f;    ///< IoU above which overlapping boxes are suppressed, [0,1]
};

/**
 * @brief Mask morphology applied before inpainting.
 */
struct InpaintConfig {
    int dilateKernelSize = 5;     ///< Dilation kernel size in pixels, [1,20]
    int erodeDistance = 3;        ///< Erosion distance in pixels, [1,10]
};

/**
 * @brief Recognition engine language and model location.
 */
struct OcrConfig {
    QString language = QStringLiteral("eng");  ///< Tesseract language list, e.g. "jpn+eng"
    QString dataPath;                          ///< tessdata directory, empty for the engine default
};

struct BrushConfig {
    int size = 36;                ///< Brush diameter in document pixels, [8,128]
};

/**
 * @brief Singleton class for the persisted pipeline configuration.
 *
 * Values read from or written to QSettings are clamped to their valid
 * ranges, so callers always get a usable configuration.
 */
class PipelineSettingsManager
{
public:
    static PipelineSettingsManager& instance();

    DetectConfig loadDetectConfig() const;
    void saveDetectConfig(const DetectConfig& config);

    InpaintConfig loadInpaintConfig() const;
    void saveInpaintConfig(const InpaintConfig& config);

    OcrConfig loadOcrConfig() const;
    void saveOcrConfig(const OcrConfig& config);

    BrushConfig loadBrushConfig() const;
    void saveBrushConfig(const BrushConfig& config);

    void resetToDefaults();

    static DetectConfig sanitized(DetectConfig config);
    static InpaintConfig sanitized(InpaintConfig config);
    static BrushConfig sanitized(BrushConfig config);

    static constexpr int kMinDilateKernelSize = 1;
    static constexpr int kMaxDilateKernelSize = 20;
    static constexpr int kMinErodeDistance = 1;
    static constexpr int kMaxErodeDistance = 10;
    static constexpr int kMinBrushSize = 8;
    static constexpr int kMaxBrushSize = 128;

private:
    PipelineSettingsManager() = default;
    PipelineSettingsManager(const PipelineSettingsManager&) = delete;
    PipelineSettingsManager& operator=(const PipelineSettingsManager&) = delete;
};

#endif // PIPELINESETTINGSMANAGER_H
