#include <docsift/config/config_helpers.h>
#include <docsift/config/pipeline_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace docsift::config {

namespace {

using Setter = std::function<Result<void>(PipelineConfig&, const std::string&)>;

Result<size_t> parseSize(const std::string& key, const std::string& raw) {
    try {
        size_t pos = 0;
        long long v = std::stoll(raw, &pos);
        if (pos != raw.size() || v < 0) {
            return Error{ErrorCode::InvalidArgument, key + ": expected a non-negative integer"};
        }
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument, key + ": expected a non-negative integer"};
    }
}

Result<double> parseDouble(const std::string& key, const std::string& raw) {
    try {
        size_t pos = 0;
        double v = std::stod(raw, &pos);
        if (pos != raw.size()) {
            return Error{ErrorCode::InvalidArgument, key + ": expected a number"};
        }
        return v;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument, key + ": expected a number"};
    }
}

template <typename T> Setter sizeField(T PipelineConfig::*section, size_t T::*field) {
    return [section, field](PipelineConfig& cfg, const std::string& raw) -> Result<void> {
        auto v = parseSize("value", raw);
        if (!v) {
            return v.error();
        }
        (cfg.*section).*field = v.value();
        return {};
    };
}

template <typename T> Setter doubleField(T PipelineConfig::*section, double T::*field) {
    return [section, field](PipelineConfig& cfg, const std::string& raw) -> Result<void> {
        auto v = parseDouble("value", raw);
        if (!v) {
            return v.error();
        }
        (cfg.*section).*field = v.value();
        return {};
    };
}

template <typename T> Setter stringField(T PipelineConfig::*section, std::string T::*field) {
    return [section, field](PipelineConfig& cfg, const std::string& raw) -> Result<void> {
        (cfg.*section).*field = raw;
        return {};
    };
}

const std::map<std::string, Setter>& setters() {
    static const std::map<std::string, Setter> table = [] {
        std::map<std::string, Setter> t;
        using P = PipelineConfig;
        t["ingest.max_tokens"] = sizeField(&P::ingest, &IngestConfig::maxTokens);
        t["ingest.overlap_tokens"] = sizeField(&P::ingest, &IngestConfig::overlapTokens);
        t["ingest.token_headroom"] = sizeField(&P::ingest, &IngestConfig::tokenHeadroom);
        t["ingest.pdf_boilerplate_fraction"] =
            doubleField(&P::ingest, &IngestConfig::pdfBoilerplateFraction);
        t["ingest.slide_boilerplate_fraction"] =
            doubleField(&P::ingest, &IngestConfig::slideBoilerplateFraction);
        t["ingest.boilerplate_max_line"] =
            sizeField(&P::ingest, &IngestConfig::boilerplateMaxLine);
        t["ingest.ocr_fallback_min_words"] =
            sizeField(&P::ingest, &IngestConfig::ocrFallbackMinWords);
        t["ingest.ocr_confidence_floor"] =
            doubleField(&P::ingest, &IngestConfig::ocrConfidenceFloor);
        t["ingest.min_prose_words"] = sizeField(&P::ingest, &IngestConfig::minProseWords);
        t["ingest.min_slide_words"] = sizeField(&P::ingest, &IngestConfig::minSlideWords);
        t["ingest.min_table_words"] = sizeField(&P::ingest, &IngestConfig::minTableWords);
        t["ingest.min_recognized_words"] =
            sizeField(&P::ingest, &IngestConfig::minRecognizedWords);
        t["ingest.large_image_area"] = [](PipelineConfig& cfg, const std::string& raw) {
            auto v = parseSize("ingest.large_image_area", raw);
            if (!v) {
                return Result<void>(v.error());
            }
            cfg.ingest.largeImageArea = static_cast<int64_t>(v.value());
            return Result<void>();
        };
        t["ingest.docx_warmup_blocks"] = sizeField(&P::ingest, &IngestConfig::docxWarmupBlocks);
        t["ingest.video_segment_limit_bytes"] = [](PipelineConfig& cfg, const std::string& raw) {
            auto v = parseSize("ingest.video_segment_limit_bytes", raw);
            if (!v) {
                return Result<void>(v.error());
            }
            cfg.ingest.videoSegmentLimitBytes = v.value();
            return Result<void>();
        };
        t["ingest.video_fallback_segment_secs"] =
            doubleField(&P::ingest, &IngestConfig::videoFallbackSegmentSecs);

        t["transcript.max_block_secs"] =
            doubleField(&P::transcript, &TranscriptConfig::maxBlockSecs);
        t["transcript.max_block_chars"] =
            sizeField(&P::transcript, &TranscriptConfig::maxBlockChars);
        t["transcript.gap_break_secs"] =
            doubleField(&P::transcript, &TranscriptConfig::gapBreakSecs);

        t["retrieval.rrf_k"] = doubleField(&P::retrieval, &RetrievalConfig::rrfK);
        t["retrieval.candidates"] = sizeField(&P::retrieval, &RetrievalConfig::candidates);
        t["retrieval.top_k"] = sizeField(&P::retrieval, &RetrievalConfig::topK);
        t["retrieval.min_score"] = doubleField(&P::retrieval, &RetrievalConfig::minScore);
        t["retrieval.per_document_cap"] =
            sizeField(&P::retrieval, &RetrievalConfig::perDocumentCap);
        t["retrieval.highlight_fragment_size"] =
            sizeField(&P::retrieval, &RetrievalConfig::highlightFragmentSize);

        t["services.search_url"] = stringField(&P::services, &ServiceConfig::searchUrl);
        t["services.index_name"] = stringField(&P::services, &ServiceConfig::indexName);
        t["services.search_username"] = stringField(&P::services, &ServiceConfig::searchUsername);
        t["services.search_password"] = stringField(&P::services, &ServiceConfig::searchPassword);
        t["services.embedding_url"] = stringField(&P::services, &ServiceConfig::embeddingUrl);
        t["services.embedding_model"] = stringField(&P::services, &ServiceConfig::embeddingModel);
        t["services.generation_url"] = stringField(&P::services, &ServiceConfig::generationUrl);
        t["services.generation_model"] =
            stringField(&P::services, &ServiceConfig::generationModel);
        t["services.api_token"] = stringField(&P::services, &ServiceConfig::apiToken);
        t["services.project_id"] = stringField(&P::services, &ServiceConfig::projectId);
        t["services.timeout_ms"] = [](PipelineConfig& cfg, const std::string& raw) {
            auto v = parseSize("services.timeout_ms", raw);
            if (!v) {
                return Result<void>(v.error());
            }
            cfg.services.timeout = std::chrono::milliseconds(v.value());
            return Result<void>();
        };
        t["services.embed_batch_size"] = sizeField(&P::services, &ServiceConfig::embedBatchSize);
        t["services.index_batch_size"] = sizeField(&P::services, &ServiceConfig::indexBatchSize);

        t["logging.level"] = [](PipelineConfig& cfg, const std::string& raw) {
            cfg.logLevel = raw;
            return Result<void>();
        };
        return t;
    }();
    return table;
}

std::string envNameFor(const std::string& key) {
    std::string name = "DOCSIFT_";
    for (char c : key) {
        name.push_back(c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return name;
}

} // namespace

Result<void> applyConfigValues(PipelineConfig& config,
                               const std::map<std::string, std::string>& values) {
    const auto& table = setters();
    for (const auto& [key, raw] : values) {
        auto it = table.find(key);
        if (it == table.end()) {
            spdlog::warn("Ignoring unknown config key '{}'", key);
            continue;
        }
        if (auto r = it->second(config, raw); !r) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Invalid value '{}' for {}: {}", raw, key, r.error().message)};
        }
    }
    if (config.ingest.overlapTokens >= config.ingest.maxTokens) {
        spdlog::warn("overlap_tokens ({}) >= max_tokens ({}); consecutive chunks will repeat",
                     config.ingest.overlapTokens, config.ingest.maxTokens);
    }
    return {};
}

Result<void> applyEnvironmentOverrides(PipelineConfig& config, const EnvLookup& lookup) {
    auto get = lookup ? lookup : EnvLookup([](const char* name) { return std::getenv(name); });

    std::map<std::string, std::string> overrides;
    for (const auto& [key, setter] : setters()) {
        (void)setter;
        if (const char* v = get(envNameFor(key).c_str()); v && *v) {
            overrides[key] = v;
        }
    }
    if (const char* v = get("DOCSIFT_LOG_LEVEL"); v && *v) {
        overrides["logging.level"] = v;
    }
    return applyConfigValues(config, overrides);
}

Result<PipelineConfig> loadPipelineConfig(const std::filesystem::path& path) {
    PipelineConfig config;
    auto configPath = get_config_path(path.string());

    std::error_code ec;
    if (std::filesystem::exists(configPath, ec)) {
        spdlog::debug("Loading config from {}", configPath.string());
        if (auto r = applyConfigValues(config, parse_config_file(configPath)); !r) {
            return r.error();
        }
    } else if (!path.empty()) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + configPath.string()};
    }

    if (auto r = applyEnvironmentOverrides(config); !r) {
        return r.error();
    }
    return config;
}

Result<void> configureLogging(const std::string& level) {
    std::string lv = level;
    std::transform(lv.begin(), lv.end(), lv.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lv == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (lv == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (lv == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (lv == "warn" || lv == "warning") {
        spdlog::set_level(spdlog::level::warn);
    } else if (lv == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (lv == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        return Error{ErrorCode::InvalidArgument, "Unknown log level: " + level};
    }
    return {};
}

} // namespace docsift::config
