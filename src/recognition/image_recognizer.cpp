#include <docsift/recognition/image_recognizer.h>

#include <spdlog/spdlog.h>

#include <cctype>

namespace docsift::recognition {

GuardedRecognizer::GuardedRecognizer(Factory factory) : factory_(std::move(factory)) {}

bool GuardedRecognizer::initialized() const {
    std::lock_guard<std::mutex> lock(initMutex_);
    return instance_ != nullptr;
}

Result<IImageRecognizer*> GuardedRecognizer::acquire() {
    std::lock_guard<std::mutex> lock(initMutex_);
    if (!attempted_) {
        attempted_ = true;
        if (!factory_) {
            initError_ = Error{ErrorCode::InvalidArgument, "No recognizer factory configured"};
        } else {
            spdlog::info("Initializing image recognizer");
            auto created = factory_();
            if (!created) {
                initError_ = created.error();
            } else if (!created.value()) {
                initError_ = Error{ErrorCode::InternalError, "Recognizer factory returned null"};
            } else {
                instance_ = std::move(created).value();
            }
        }
        if (initError_) {
            spdlog::error("Image recognizer unavailable: {}", initError_->message);
        }
    }
    if (initError_) {
        return *initError_;
    }
    return instance_.get();
}

Result<RecognitionResult> GuardedRecognizer::recognize(const extraction::Image& image) {
    auto engine = acquire();
    if (!engine) {
        return engine.error();
    }
    std::lock_guard<std::mutex> lock(inferenceMutex_);
    return engine.value()->recognize(image);
}

RecognitionResult recognizeImages(IImageRecognizer& recognizer,
                                  const std::vector<const extraction::Image*>& images,
                                  double confidenceFloor) {
    std::string joined;
    double confidenceSum = 0.0;
    size_t kept = 0;

    for (const auto* image : images) {
        if (!image) {
            continue;
        }
        auto result = recognizer.recognize(*image);
        if (!result) {
            spdlog::warn("Image recognition failed ({}x{}): {}", image->width, image->height,
                         result.error().message);
            continue;
        }
        const auto& r = result.value();
        bool blank = true;
        for (char c : r.text) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                blank = false;
                break;
            }
        }
        if (blank || !r.confidence || *r.confidence <= confidenceFloor) {
            continue;
        }
        if (!joined.empty()) {
            joined.push_back('\n');
        }
        joined += r.text;
        confidenceSum += *r.confidence;
        ++kept;
    }

    RecognitionResult out;
    auto b = joined.find_first_not_of(" \t\r\n");
    if (b != std::string::npos) {
        auto e = joined.find_last_not_of(" \t\r\n");
        out.text = joined.substr(b, e - b + 1);
    }
    if (kept > 0) {
        out.confidence = confidenceSum / static_cast<double>(kept);
    }
    spdlog::debug("Recognized {} of {} images (confidence={})", kept, images.size(),
                  out.confidence ? *out.confidence : 0.0);
    return out;
}

} // namespace docsift::recognition
