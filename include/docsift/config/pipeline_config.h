#pragma once

#include <docsift/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>

namespace docsift::config {

/**
 * @brief Ingestion thresholds. Defaults match the tuned production values.
 */
struct IngestConfig {
    size_t maxTokens = 512;
    size_t overlapTokens = 120;
    size_t tokenHeadroom = 64; // Reserved for downstream prompt scaffolding

    double pdfBoilerplateFraction = 0.6;
    double slideBoilerplateFraction = 0.7;
    size_t boilerplateMaxLine = 120;

    size_t ocrFallbackMinWords = 10; // Native text below this triggers page OCR
    double ocrConfidenceFloor = 95.0;
    size_t minProseWords = 8;
    size_t minSlideWords = 4;
    size_t minTableWords = 4;
    size_t minRecognizedWords = 8;
    int64_t largeImageArea = 150'000; // Pixels; smaller images are not recognized

    size_t docxWarmupBlocks = 3;

    uint64_t videoSegmentLimitBytes = 100ull * 1024 * 1024;
    double videoFallbackSegmentSecs = 300.0;
};

struct TranscriptConfig {
    double maxBlockSecs = 60.0;
    size_t maxBlockChars = 1200;
    double gapBreakSecs = 1.5;
};

struct RetrievalConfig {
    double rrfK = 60.0;
    size_t candidates = 20;
    size_t topK = 6;
    double minScore = 0.03;
    size_t perDocumentCap = 2;
    size_t highlightFragmentSize = 180;
};

struct ServiceConfig {
    std::string searchUrl = "http://localhost:9200";
    std::string indexName = "docsift";
    std::string searchUsername;
    std::string searchPassword;
    std::string embeddingUrl;
    std::string embeddingModel;
    std::string generationUrl;
    std::string generationModel;
    std::string apiToken;
    std::string projectId;
    std::chrono::milliseconds timeout{60'000};
    size_t embedBatchSize = 16;
    size_t indexBatchSize = 32;
};

struct PipelineConfig {
    IngestConfig ingest;
    TranscriptConfig transcript;
    RetrievalConfig retrieval;
    ServiceConfig services;
    std::string logLevel = "info";
};

using EnvLookup = std::function<const char*(const char*)>;

/**
 * @brief Apply "section.key" values onto a config. Unknown keys are ignored with a warning.
 */
Result<void> applyConfigValues(PipelineConfig& config,
                               const std::map<std::string, std::string>& values);

/**
 * @brief Apply DOCSIFT_<SECTION>_<KEY> environment overrides.
 */
Result<void> applyEnvironmentOverrides(PipelineConfig& config, const EnvLookup& lookup = {});

/**
 * @brief Load defaults, then the TOML file (when present), then environment overrides.
 */
Result<PipelineConfig> loadPipelineConfig(const std::filesystem::path& path = {});

/**
 * @brief Map a textual level (trace|debug|info|warn|error|off) onto spdlog.
 */
Result<void> configureLogging(const std::string& level);

} // namespace docsift::config
