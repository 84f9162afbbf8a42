#pragma once

#include <docsift/core/types.h>
#include <docsift/extraction/document_extractors.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace docsift::recognition {

struct RecognitionResult {
    std::string text;
    std::optional<double> confidence; // 0-100 when the engine reports one
};

/**
 * @brief Image-to-text inference (OCR). Implementations need not be thread-safe.
 */
class IImageRecognizer {
public:
    virtual ~IImageRecognizer() = default;
    virtual Result<RecognitionResult> recognize(const extraction::Image& image) = 0;
};

/**
 * @brief Owns one lazily constructed recognizer and serializes inference on it.
 *
 * The factory runs at most once, on the first recognize() call; a construction
 * failure is remembered and reported to every later caller. Only the inference
 * call itself holds the inference lock.
 */
class GuardedRecognizer : public IImageRecognizer {
public:
    using Factory = std::function<Result<std::unique_ptr<IImageRecognizer>>()>;

    explicit GuardedRecognizer(Factory factory);

    GuardedRecognizer(const GuardedRecognizer&) = delete;
    GuardedRecognizer& operator=(const GuardedRecognizer&) = delete;

    Result<RecognitionResult> recognize(const extraction::Image& image) override;

    bool initialized() const;

private:
    Result<IImageRecognizer*> acquire();

    Factory factory_;
    mutable std::mutex initMutex_;
    bool attempted_ = false;
    std::unique_ptr<IImageRecognizer> instance_;
    std::optional<Error> initError_;
    std::mutex inferenceMutex_;
};

/**
 * @brief Recognize each image and keep text only above the confidence floor.
 *
 * Images whose text is blank, whose confidence is absent or <= floor, or whose
 * recognition fails are skipped. Kept texts are joined with newlines; the
 * confidence is the mean over kept images, absent when none were kept.
 */
RecognitionResult recognizeImages(IImageRecognizer& recognizer,
                                  const std::vector<const extraction::Image*>& images,
                                  double confidenceFloor);

} // namespace docsift::recognition
