#include "diarclip/service.hpp"

#include "diarclip/encoding.hpp"
#include "diarclip/errors.hpp"
#include "diarclip/log.hpp"

#include <chrono>
#include <sstream>

namespace diarclip {

namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point t) {
    return std::chrono::duration<double>(Clock::now() - t).count();
}

std::shared_ptr<ClipStore> make_clip_store(const ClipConfig &config) {
    if (config.delivery == ClipDelivery::Inline)
        return nullptr;
    return std::make_shared<FileClipStore>(config.storage_dir, config.url_base);
}

TargetFormat target_for(const NormalizerConfig &config) {
    TargetFormat t;
    t.sample_rate = config.target_sample_rate;
    return t;
}

} // namespace

// ─── JSON ────────────────────────────────────────────────────────────────────

nlohmann::ordered_json to_json(const FileMetadata &meta) {
    nlohmann::ordered_json j;
    j["file_name"] = meta.file_name;
    j["file_size_bytes"] = meta.file_size_bytes;
    j["content_type"] = meta.content_type;
    return j;
}

nlohmann::ordered_json to_json(const StepTimings &timings) {
    nlohmann::ordered_json j;
    j["audio_validation"] = timings.audio_validation;
    j["audio_conversion"] = timings.audio_conversion;
    j["diarization_processing"] = timings.diarization_processing;
    j["segment_merging"] = timings.segment_merging;
    j["clip_extraction"] = timings.clip_extraction;
    return j;
}

nlohmann::ordered_json to_json(const SystemMetrics &metrics) {
    nlohmann::ordered_json j;
    j["before_processing"] = to_json(metrics.before_processing);
    j["during_processing"] = to_json(metrics.during_processing);
    j["after_processing"] = to_json(metrics.after_processing);
    return j;
}

nlohmann::ordered_json to_json(const std::vector<SpeakerSegment> &segments) {
    auto arr = nlohmann::ordered_json::array();
    for (const auto &s : segments) {
        nlohmann::ordered_json j;
        j["speaker"] = s.speaker;
        j["start"] = s.start;
        j["end"] = s.end;
        arr.push_back(std::move(j));
    }
    return arr;
}

nlohmann::ordered_json to_json(const DiarizationResponse &response) {
    nlohmann::ordered_json j;
    j["request_id"] = response.request_id;
    j["file_metadata"] = to_json(response.file_metadata);
    j["processing_time_seconds"] = response.processing_time_seconds;
    j["step_timings"] = to_json(response.step_timings);
    j["speakers"] = clips_to_json(response.speakers, /*with_payload=*/true);
    if (response.system_metrics)
        j["system_metrics"] = to_json(*response.system_metrics);
    if (response.log_file)
        j["log_file"] = response.log_file->string();
    return j;
}

nlohmann::ordered_json to_log_record(const DiarizationResponse &response) {
    nlohmann::ordered_json j;
    j["request_id"] = response.request_id;
    j["status"] = "success";
    j["file_metadata"] = to_json(response.file_metadata);
    j["processing_time_seconds"] = response.processing_time_seconds;
    j["step_timings"] = to_json(response.step_timings);
    j["speakers"] = clips_to_json(response.speakers, /*with_payload=*/false);
    j["segments"] = to_json(response.segments);
    if (response.system_metrics)
        j["system_metrics"] = to_json(*response.system_metrics);
    return j;
}

// ─── DiarizationService ──────────────────────────────────────────────────────

DiarizationService::DiarizationService(ServiceConfig config,
                                       std::unique_ptr<DiarizationEngine> engine,
                                       ServiceOverrides overrides)
    : config_(std::move(config)), engine_(std::move(engine)),
      clip_store_(overrides.clip_store ? std::move(overrides.clip_store)
                                       : make_clip_store(config_.clips)),
      normalizer_(overrides.transcoder ? std::move(overrides.transcoder)
                                       : make_transcoder(config_.normalizer),
                  target_for(config_.normalizer)),
      extractor_(config_.clips.delivery, clip_store_),
      telemetry_(config_.telemetry, std::move(overrides.accelerator_probe)),
      logger_(config_.logging) {
    if (!engine_) {
        throw ModelUnavailableError();
    }
    log_info("Diarization service ready (engine: " + engine_->name() +
             ", transcoder: " + normalizer_.transcoder().name() +
             ", request logs: " + (logger_.enabled() ? "on" : "off") + ")");
}

nlohmann::ordered_json DiarizationService::health() const {
    nlohmann::ordered_json j;
    j["status"] = "ok";
    j["model"] = "loaded";
    j["engine"] = engine_->name();
    return j;
}

DiarizationResponse DiarizationService::process(const Upload &upload) {
    const auto t_request = Clock::now();

    DiarizationResponse response;
    response.request_id = make_uuid();
    response.file_metadata = {upload.file_name, upload.bytes.size(),
                              upload.content_type};
    log_info("Received file: " + upload.file_name + ", Content-Type: " +
             upload.content_type);

    // Telemetry is only worth its cost when it ends up in a request log
    const bool logging = logger_.enabled();
    std::optional<MetricsSnapshot> before;
    if (logging)
        before = telemetry_.snapshot();

    std::string stage = "audio_validation";
    try {
        auto t = Clock::now();
        bool canonical = normalizer_.validate(upload.bytes);
        response.step_timings.audio_validation = seconds_since(t);

        stage = "audio_conversion";
        t = Clock::now();
        std::vector<uint8_t> converted;
        if (!canonical)
            converted = normalizer_.normalize(upload.bytes);
        const std::vector<uint8_t> &wav = canonical ? upload.bytes : converted;
        response.step_timings.audio_conversion = seconds_since(t);

        stage = "diarization_processing";
        t = Clock::now();
        std::vector<SpeakerEvent> events;
        std::vector<MetricsSnapshot> during;
        {
            std::lock_guard<std::mutex> lock(engine_mutex_);
            std::optional<TelemetrySampler> sampler;
            if (logging)
                sampler.emplace(telemetry_);
            events = engine_->diarize(wav);
            if (sampler)
                during = sampler->stop();
        }
        response.step_timings.diarization_processing = seconds_since(t);

        stage = "segment_merging";
        t = Clock::now();
        response.segments = merge_segments(events, config_.merge);
        response.step_timings.segment_merging = seconds_since(t);

        stage = "clip_extraction";
        t = Clock::now();
        response.speakers = extractor_.extract(wav, response.segments);
        response.step_timings.clip_extraction = seconds_since(t);

        if (logging) {
            response.system_metrics =
                SystemMetrics{*before, std::move(during), telemetry_.snapshot()};
        }
    } catch (const InvalidFormatError &e) {
        log_error(std::string("Invalid audio format: ") + e.what());
        throw;
    } catch (const ProcessingError &e) {
        log_error(std::string("Processing error: ") + e.what());
        response.processing_time_seconds = seconds_since(t_request);
        record_failure(response, before, stage, "ProcessingError", e.what());
        throw;
    } catch (const Error &e) {
        log_error(std::string("Processing error: ") + e.what());
        response.processing_time_seconds = seconds_since(t_request);
        record_failure(response, before, stage, "Error", e.what());
        throw ProcessingError(e.what());
    } catch (const std::exception &e) {
        log_error(std::string("Unexpected error in ") + stage + ": " +
                  e.what());
        response.processing_time_seconds = seconds_since(t_request);
        record_failure(response, before, stage, "std::exception", e.what());
        throw ProcessingError("Unexpected error occurred during processing.");
    }

    response.processing_time_seconds = seconds_since(t_request);
    if (logging)
        response.log_file = logger_.record(to_log_record(response));

    std::ostringstream summary;
    summary << "Processed " << upload.file_name << ": "
            << response.speakers.size() << " speakers, "
            << response.segments.size() << " segments in "
            << response.processing_time_seconds << " s";
    log_info(summary.str());
    return response;
}

void DiarizationService::record_failure(
    const DiarizationResponse &partial,
    const std::optional<MetricsSnapshot> &before, const std::string &stage,
    const std::string &type, const std::string &message) {
    if (!logger_.enabled())
        return;

    try {
        nlohmann::ordered_json j;
        j["request_id"] = partial.request_id;
        j["status"] = "error";
        j["file_metadata"] = to_json(partial.file_metadata);
        j["processing_time_seconds"] = partial.processing_time_seconds;
        j["step_timings"] = to_json(partial.step_timings);
        j["error"] = {{"stage", stage}, {"type", type}, {"message", message}};

        nlohmann::ordered_json metrics;
        if (before)
            metrics["before_processing"] = to_json(*before);
        metrics["at_failure"] = to_json(telemetry_.snapshot());
        j["system_metrics"] = std::move(metrics);

        logger_.record(j);
    } catch (const std::exception &e) {
        log_error(std::string("Failed to record failure log: ") + e.what());
    }
}

} // namespace diarclip
