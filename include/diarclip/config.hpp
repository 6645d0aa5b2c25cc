#pragma once

#include <string>
#include <vector>

namespace diarclip {

// ─── Format Normalizer Config ───────────────────────────────────────────────

enum class TranscoderKind { FFmpeg, Native };

struct NormalizerConfig {
    TranscoderKind transcoder = TranscoderKind::FFmpeg;
    std::string ffmpeg_path = "ffmpeg";
    int target_sample_rate = 16000;
};

// ─── Segment Merge Config ───────────────────────────────────────────────────

struct MergeConfig {
    double gap_threshold = 0.5; // seconds, same-speaker gap still merged
    double min_duration = 0.0;  // seconds, 0 = keep everything
};

// ─── Clip Extraction Config ─────────────────────────────────────────────────

enum class ClipDelivery { Inline, Persisted };

struct ClipConfig {
    ClipDelivery delivery = ClipDelivery::Persisted;
    std::string storage_dir = "saved_audio";
    std::string url_base = "http://localhost:7000/audio"; // "" = file paths
};

// ─── Telemetry Config ───────────────────────────────────────────────────────

struct TelemetryConfig {
    int sample_interval_ms = 1000; // cadence of the during-processing sampler
    int cpu_window_ms = 100;       // /proc/stat delta window per snapshot
    bool probe_accelerator = true;
    std::string disk_path = "/";
    std::string proc_root = "/proc";
    std::string drm_root = "/sys/class/drm";
};

// ─── Request Log Config ─────────────────────────────────────────────────────

struct RequestLogConfig {
    bool enabled = true;
    std::string logs_dir = "logs";
};

// ─── Diarization Engine Config ──────────────────────────────────────────────

struct EngineConfig {
    // argv of an external diarizer that reads WAV on stdin, prints RTTM
    std::vector<std::string> command;
};

// ─── Service Config ─────────────────────────────────────────────────────────

struct ServiceConfig {
    NormalizerConfig normalizer;
    MergeConfig merge;
    ClipConfig clips;
    TelemetryConfig telemetry;
    RequestLogConfig logging;
    EngineConfig engine;
};

// ─── Presets ────────────────────────────────────────────────────────────────

inline ServiceConfig make_default_config() { return ServiceConfig{}; }

// Inline delivery, native transcoder, no request logs. Nothing touches the
// filesystem or spawns processes except the engine itself.
inline ServiceConfig make_inline_config() {
    ServiceConfig cfg;
    cfg.normalizer.transcoder = TranscoderKind::Native;
    cfg.clips.delivery = ClipDelivery::Inline;
    cfg.logging.enabled = false;
    return cfg;
}

// Load a JSON config file on top of make_default_config(). Missing keys keep
// their defaults; a key with the wrong type throws std::runtime_error.
ServiceConfig load_config(const std::string &path);

} // namespace diarclip
