#include "diarclip/config.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace diarclip {

using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json &section, const std::string &section_name,
              const char *key, T &out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null())
        return;
    try {
        out = it->get<T>();
    } catch (const json::exception &e) {
        throw std::runtime_error("Config key '" + section_name + "." + key +
                                 "' has the wrong type: " + e.what());
    }
}

const json *find_section(const json &root, const char *name) {
    auto it = root.find(name);
    if (it == root.end())
        return nullptr;
    if (!it->is_object()) {
        throw std::runtime_error(std::string("Config section '") + name +
                                 "' must be an object");
    }
    return &*it;
}

TranscoderKind parse_transcoder(const std::string &name) {
    if (name == "ffmpeg")
        return TranscoderKind::FFmpeg;
    if (name == "native")
        return TranscoderKind::Native;
    throw std::runtime_error("Unknown transcoder: " + name +
                             " (expected ffmpeg or native)");
}

ClipDelivery parse_delivery(const std::string &name) {
    if (name == "inline")
        return ClipDelivery::Inline;
    if (name == "persisted")
        return ClipDelivery::Persisted;
    throw std::runtime_error("Unknown clip delivery: " + name +
                             " (expected inline or persisted)");
}

} // namespace

ServiceConfig load_config(const std::string &path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error &e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " +
                                 e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Config file must hold a JSON object: " +
                                 path);
    }

    ServiceConfig cfg = make_default_config();

    if (auto *s = find_section(root, "normalizer")) {
        std::string transcoder;
        read_key(*s, "normalizer", "transcoder", transcoder);
        if (!transcoder.empty())
            cfg.normalizer.transcoder = parse_transcoder(transcoder);
        read_key(*s, "normalizer", "ffmpeg_path", cfg.normalizer.ffmpeg_path);
        read_key(*s, "normalizer", "target_sample_rate",
                 cfg.normalizer.target_sample_rate);
    }

    if (auto *s = find_section(root, "merge")) {
        read_key(*s, "merge", "gap_threshold", cfg.merge.gap_threshold);
        read_key(*s, "merge", "min_duration", cfg.merge.min_duration);
    }

    if (auto *s = find_section(root, "clips")) {
        std::string delivery;
        read_key(*s, "clips", "delivery", delivery);
        if (!delivery.empty())
            cfg.clips.delivery = parse_delivery(delivery);
        read_key(*s, "clips", "storage_dir", cfg.clips.storage_dir);
        read_key(*s, "clips", "url_base", cfg.clips.url_base);
    }

    if (auto *s = find_section(root, "telemetry")) {
        read_key(*s, "telemetry", "sample_interval_ms",
                 cfg.telemetry.sample_interval_ms);
        read_key(*s, "telemetry", "cpu_window_ms", cfg.telemetry.cpu_window_ms);
        read_key(*s, "telemetry", "probe_accelerator",
                 cfg.telemetry.probe_accelerator);
        read_key(*s, "telemetry", "disk_path", cfg.telemetry.disk_path);
        read_key(*s, "telemetry", "proc_root", cfg.telemetry.proc_root);
        read_key(*s, "telemetry", "drm_root", cfg.telemetry.drm_root);
    }

    if (auto *s = find_section(root, "logging")) {
        read_key(*s, "logging", "enabled", cfg.logging.enabled);
        read_key(*s, "logging", "logs_dir", cfg.logging.logs_dir);
    }

    if (auto *s = find_section(root, "engine")) {
        read_key(*s, "engine", "command", cfg.engine.command);
    }

    if (cfg.merge.gap_threshold < 0.0 || cfg.merge.min_duration < 0.0) {
        throw std::runtime_error(
            "merge.gap_threshold and merge.min_duration must be >= 0");
    }
    if (cfg.telemetry.sample_interval_ms <= 0) {
        throw std::runtime_error("telemetry.sample_interval_ms must be > 0");
    }

    return cfg;
}

} // namespace diarclip
