#ifndef IINFERENCEADAPTERS_H
#define IINFERENCEADAPTERS_H

#include "inference/InferenceTypes.h"

/**
 * @brief Contracts for the detection, recognition, inpainting and
 * translation services.
 *
 * Every call completes exactly once through its callback, on the thread
 * that issued it. requestCancel() is best effort: a call already running
 * may still complete normally.
 */
class IDetectAdapter
{
public:
    virtual ~IDetectAdapter() = default;

    virtual QString name() const = 0;
    virtual void detect(const DetectRequest& request, const DetectCallback& callback) = 0;
    virtual void requestCancel() {}
};

class IOcrAdapter
{
public:
    virtual ~IOcrAdapter() = default;

    virtual QString name() const = 0;
    virtual void recognize(const OcrRequest& request, const OcrCallback& callback) = 0;
    virtual void requestCancel() {}
};

class IInpaintAdapter
{
public:
    virtual ~IInpaintAdapter() = default;

    virtual QString name() const = 0;
    virtual void inpaint(const InpaintRequest& request, const InpaintCallback& callback) = 0;
    virtual void requestCancel() {}
};

class ITranslateAdapter
{
public:
    virtual ~ITranslateAdapter() = default;

    virtual QString name() const = 0;
    virtual void translate(const TranslateRequest& request, const TranslateCallback& callback) = 0;
    virtual void requestCancel() {}
};

#endif // IINFERENCEADAPTERS_H
