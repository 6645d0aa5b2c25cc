#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "diarclip/clip_extractor.hpp"
#include "diarclip/clip_store.hpp"
#include "diarclip/config.hpp"
#include "diarclip/engine.hpp"
#include "diarclip/normalizer.hpp"
#include "diarclip/request_log.hpp"
#include "diarclip/segment_merge.hpp"
#include "diarclip/telemetry.hpp"

namespace diarclip {

// ─── Request / Response ──────────────────────────────────────────────────────

struct Upload {
    std::string file_name;
    std::string content_type; // as declared by the client, may be empty
    std::vector<uint8_t> bytes;
};

struct FileMetadata {
    std::string file_name;
    size_t file_size_bytes = 0;
    std::string content_type;
};

// Seconds per pipeline stage
struct StepTimings {
    double audio_validation = 0.0;
    double audio_conversion = 0.0;
    double diarization_processing = 0.0;
    double segment_merging = 0.0;
    double clip_extraction = 0.0;
};

struct SystemMetrics {
    MetricsSnapshot before_processing;
    std::vector<MetricsSnapshot> during_processing; // sampled during diarize
    MetricsSnapshot after_processing;
};

struct DiarizationResponse {
    std::string request_id;
    FileMetadata file_metadata;
    double processing_time_seconds = 0.0;
    StepTimings step_timings;
    std::vector<SpeakerSegment> segments;
    ClipMap speakers;
    std::optional<SystemMetrics> system_metrics; // only with request logging
    std::optional<std::filesystem::path> log_file;
};

nlohmann::ordered_json to_json(const FileMetadata &meta);
nlohmann::ordered_json to_json(const StepTimings &timings);
nlohmann::ordered_json to_json(const SystemMetrics &metrics);
nlohmann::ordered_json to_json(const std::vector<SpeakerSegment> &segments);

// Client-facing document. Inline clips carry their base64 payload.
nlohmann::ordered_json to_json(const DiarizationResponse &response);

// Persisted request record: status, segments and metrics included, inline
// payloads replaced by their size.
nlohmann::ordered_json to_log_record(const DiarizationResponse &response);

// ─── Service ─────────────────────────────────────────────────────────────────

// Optional replacements for the collaborators ServiceConfig would build.
struct ServiceOverrides {
    std::unique_ptr<Transcoder> transcoder;
    std::shared_ptr<ClipStore> clip_store;
    std::unique_ptr<AcceleratorProbe> accelerator_probe;
};

class DiarizationService {
  public:
    /// Throws ModelUnavailableError for a null engine.
    DiarizationService(ServiceConfig config,
                       std::unique_ptr<DiarizationEngine> engine,
                       ServiceOverrides overrides = {});

    /// Validate → normalize → diarize → merge → extract.
    ///
    /// Throws InvalidFormatError for unreadable uploads (nothing stored, no
    /// request log) and ProcessingError for any later failure, after
    /// writing a failure record when request logging is on. Other
    /// exceptions surface as a generic ProcessingError.
    DiarizationResponse process(const Upload &upload);

    // {"status": "ok", "model": "loaded", "engine": ...}
    nlohmann::ordered_json health() const;

    // Wait for queued request logs to reach disk.
    void flush_logs() { logger_.flush(); }

    const ServiceConfig &config() const { return config_; }
    const TelemetryCollector &telemetry() const { return telemetry_; }

  private:
    ServiceConfig config_;
    std::unique_ptr<DiarizationEngine> engine_;
    std::shared_ptr<ClipStore> clip_store_;
    FormatNormalizer normalizer_;
    ClipExtractor extractor_;
    TelemetryCollector telemetry_;
    RequestLogger logger_;
    std::mutex engine_mutex_;

    void record_failure(const DiarizationResponse &partial,
                        const std::optional<MetricsSnapshot> &before,
                        const std::string &stage, const std::string &type,
                        const std::string &message);
};

} // namespace diarclip
