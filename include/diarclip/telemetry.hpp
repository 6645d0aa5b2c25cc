#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "diarclip/config.hpp"

namespace diarclip {

// ─── Snapshot Types ──────────────────────────────────────────────────────────

struct AcceleratorMetrics {
    std::string backend; // "drm", "metal"
    std::optional<double> utilization_percent;
    std::optional<double> memory_used_mb;
    std::optional<double> memory_total_mb;
};

struct MetricsSnapshot {
    double cpu_usage_percent = 0.0;
    double ram_usage_percent = 0.0;
    double disk_usage_percent = 0.0;
    std::optional<AcceleratorMetrics> accelerator;
};

nlohmann::ordered_json to_json(const MetricsSnapshot &snapshot);
nlohmann::ordered_json to_json(const std::vector<MetricsSnapshot> &samples);

// ─── Accelerator Probes ──────────────────────────────────────────────────────

class AcceleratorProbe {
  public:
    virtual ~AcceleratorProbe() = default;
    // nullopt when no accelerator is present. May throw; the collector
    // treats a throwing probe as absent.
    virtual std::optional<AcceleratorMetrics> read() = 0;
};

// amdgpu-style sysfs counters under <drm_root>/card*/device. When no card
// exposes them, reports Metal presence on Apple builds.
class DrmAcceleratorProbe : public AcceleratorProbe {
  public:
    explicit DrmAcceleratorProbe(std::string drm_root = "/sys/class/drm",
                                 bool metal_fallback = true);
    std::optional<AcceleratorMetrics> read() override;

  private:
    std::string drm_root_;
    bool metal_fallback_;
};

// ─── Collector ───────────────────────────────────────────────────────────────

class TelemetryCollector {
  public:
    // A null probe means no accelerator section in any snapshot. With
    // config.probe_accelerator set and no probe given, a
    // DrmAcceleratorProbe is used.
    explicit TelemetryCollector(TelemetryConfig config = {},
                                std::unique_ptr<AcceleratorProbe> probe = nullptr);

    /// Point-in-time host read. Never throws: an unreadable source is
    /// logged and reported as 0.0, a failing probe omits the accelerator.
    MetricsSnapshot snapshot() const;

    double cpu_percent() const;
    double ram_percent() const;
    double disk_percent() const;

    const TelemetryConfig &config() const { return config_; }

  private:
    TelemetryConfig config_;
    std::unique_ptr<AcceleratorProbe> probe_;
    mutable std::mutex probe_mutex_;
    mutable std::atomic<bool> warned_{false}; // first host read failure only

    void warn(const std::string &msg) const;
};

// ─── Background Sampler ──────────────────────────────────────────────────────

// Snapshots the collector every sample_interval_ms on its own thread, from
// construction until stop() or destruction. The first sample is taken
// immediately.
class TelemetrySampler {
  public:
    explicit TelemetrySampler(const TelemetryCollector &collector);
    ~TelemetrySampler();

    TelemetrySampler(const TelemetrySampler &) = delete;
    TelemetrySampler &operator=(const TelemetrySampler &) = delete;

    // Wakes the thread, joins it and hands over the samples. Later calls
    // return an empty list.
    std::vector<MetricsSnapshot> stop();

  private:
    const TelemetryCollector &collector_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::vector<MetricsSnapshot> samples_;
    std::thread thread_;

    void run();
};

} // namespace diarclip
