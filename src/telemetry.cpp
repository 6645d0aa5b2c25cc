#include "diarclip/telemetry.hpp"

#include "diarclip/log.hpp"

#include <axiom/system.hpp>

#include <sys/statvfs.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace diarclip {

namespace fs = std::filesystem;

namespace {

double round2(double v) { return std::round(v * 100.0) / 100.0; }

double percent(double part, double whole) {
    if (whole <= 0.0)
        return 0.0;
    return round2(std::clamp(100.0 * part / whole, 0.0, 100.0));
}

// ─── /proc/stat ──────────────────────────────────────────────────────────────

struct CpuTimes {
    unsigned long long idle = 0;
    unsigned long long total = 0;
};

CpuTimes read_cpu_times(const std::string &proc_root) {
    std::ifstream file(proc_root + "/stat");
    if (!file)
        throw std::runtime_error("Cannot open " + proc_root + "/stat");

    std::string line;
    std::getline(file, line);
    std::istringstream in(line);
    std::string label;
    in >> label;
    if (label != "cpu")
        throw std::runtime_error("Unexpected first line in " + proc_root +
                                 "/stat");

    // user nice system idle iowait irq softirq steal
    unsigned long long v[8] = {};
    int n = 0;
    while (n < 8 && in >> v[n])
        ++n;
    if (n < 4)
        throw std::runtime_error("Truncated cpu line in " + proc_root + "/stat");

    CpuTimes t;
    t.idle = v[3] + v[4];
    for (int i = 0; i < n; ++i)
        t.total += v[i];
    return t;
}

// ─── /proc/meminfo ───────────────────────────────────────────────────────────

double read_ram_percent(const std::string &proc_root) {
    std::ifstream file(proc_root + "/meminfo");
    if (!file)
        throw std::runtime_error("Cannot open " + proc_root + "/meminfo");

    double total = -1.0, available = -1.0;
    std::string key;
    double value;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream in(line);
        if (!(in >> key >> value))
            continue;
        if (key == "MemTotal:")
            total = value;
        else if (key == "MemAvailable:")
            available = value;
    }
    if (total <= 0.0 || available < 0.0)
        throw std::runtime_error("MemTotal/MemAvailable missing in " +
                                 proc_root + "/meminfo");
    return percent(total - available, total);
}

// ─── sysfs helpers ───────────────────────────────────────────────────────────

std::optional<double> read_number(const fs::path &path) {
    std::ifstream file(path);
    double v;
    if (file && file >> v)
        return v;
    return std::nullopt;
}

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

} // namespace

// ─── JSON ────────────────────────────────────────────────────────────────────

nlohmann::ordered_json to_json(const MetricsSnapshot &snapshot) {
    nlohmann::ordered_json j;
    j["cpu_usage_percent"] = snapshot.cpu_usage_percent;
    j["ram_usage_percent"] = snapshot.ram_usage_percent;
    j["disk_usage_percent"] = snapshot.disk_usage_percent;
    if (snapshot.accelerator) {
        const auto &acc = *snapshot.accelerator;
        nlohmann::ordered_json g;
        g["backend"] = acc.backend;
        if (acc.utilization_percent)
            g["gpu_usage_percent"] = *acc.utilization_percent;
        if (acc.memory_used_mb)
            g["gpu_memory_used_mb"] = *acc.memory_used_mb;
        if (acc.memory_total_mb)
            g["gpu_memory_total_mb"] = *acc.memory_total_mb;
        j["gpu_metrics"] = std::move(g);
    }
    return j;
}

nlohmann::ordered_json to_json(const std::vector<MetricsSnapshot> &samples) {
    auto arr = nlohmann::ordered_json::array();
    for (const auto &s : samples)
        arr.push_back(to_json(s));
    return arr;
}

// ─── DrmAcceleratorProbe ─────────────────────────────────────────────────────

DrmAcceleratorProbe::DrmAcceleratorProbe(std::string drm_root,
                                         bool metal_fallback)
    : drm_root_(std::move(drm_root)), metal_fallback_(metal_fallback) {}

std::optional<AcceleratorMetrics> DrmAcceleratorProbe::read() {
    std::error_code ec;
    if (fs::is_directory(drm_root_, ec)) {
        std::vector<fs::path> cards;
        for (const auto &entry : fs::directory_iterator(drm_root_, ec)) {
            auto name = entry.path().filename().string();
            // card0, card1; skip connector nodes like card0-DP-1
            if (name.starts_with("card") &&
                name.find('-') == std::string::npos)
                cards.push_back(entry.path());
        }
        std::sort(cards.begin(), cards.end());

        for (const auto &card : cards) {
            auto dev = card / "device";
            auto busy = read_number(dev / "gpu_busy_percent");
            auto used = read_number(dev / "mem_info_vram_used");
            auto total = read_number(dev / "mem_info_vram_total");
            if (!busy && !used && !total)
                continue;

            AcceleratorMetrics m;
            m.backend = "drm";
            m.utilization_percent = busy;
            if (used)
                m.memory_used_mb = round2(*used / BYTES_PER_MB);
            if (total)
                m.memory_total_mb = round2(*total / BYTES_PER_MB);
            return m;
        }
    }

    if (metal_fallback_ && axiom::system::is_metal_available()) {
        AcceleratorMetrics m;
        m.backend = "metal";
        return m;
    }
    return std::nullopt;
}

// ─── TelemetryCollector ──────────────────────────────────────────────────────

TelemetryCollector::TelemetryCollector(TelemetryConfig config,
                                       std::unique_ptr<AcceleratorProbe> probe)
    : config_(std::move(config)), probe_(std::move(probe)) {
    if (!probe_ && config_.probe_accelerator)
        probe_ = std::make_unique<DrmAcceleratorProbe>(config_.drm_root);
    if (!config_.probe_accelerator)
        probe_.reset();
}

void TelemetryCollector::warn(const std::string &msg) const {
    if (!warned_.exchange(true))
        log_warn("Telemetry: " + msg);
}

double TelemetryCollector::cpu_percent() const {
    try {
        auto a = read_cpu_times(config_.proc_root);
        if (config_.cpu_window_ms > 0)
            std::this_thread::sleep_for(
                std::chrono::milliseconds(config_.cpu_window_ms));
        auto b = read_cpu_times(config_.proc_root);
        if (b.total <= a.total)
            return 0.0;
        double total = static_cast<double>(b.total - a.total);
        double idle = static_cast<double>(b.idle - a.idle);
        return percent(total - idle, total);
    } catch (const std::exception &e) {
        warn(e.what());
        return 0.0;
    }
}

double TelemetryCollector::ram_percent() const {
    try {
        return read_ram_percent(config_.proc_root);
    } catch (const std::exception &e) {
        warn(e.what());
        return 0.0;
    }
}

double TelemetryCollector::disk_percent() const {
    struct statvfs st {};
    if (statvfs(config_.disk_path.c_str(), &st) != 0) {
        warn("statvfs failed for " + config_.disk_path);
        return 0.0;
    }
    double frsize = static_cast<double>(st.f_frsize);
    double used = static_cast<double>(st.f_blocks - st.f_bfree) * frsize;
    double avail = static_cast<double>(st.f_bavail) * frsize;
    return percent(used, used + avail);
}

MetricsSnapshot TelemetryCollector::snapshot() const {
    MetricsSnapshot s;
    s.cpu_usage_percent = cpu_percent();
    s.ram_usage_percent = ram_percent();
    s.disk_usage_percent = disk_percent();

    if (probe_) {
        std::lock_guard<std::mutex> lock(probe_mutex_);
        try {
            s.accelerator = probe_->read();
        } catch (const std::exception &e) {
            warn(std::string("accelerator probe failed: ") + e.what());
        }
    }
    return s;
}

// ─── TelemetrySampler ────────────────────────────────────────────────────────

TelemetrySampler::TelemetrySampler(const TelemetryCollector &collector)
    : collector_(collector), thread_(&TelemetrySampler::run, this) {}

TelemetrySampler::~TelemetrySampler() { stop(); }

void TelemetrySampler::run() {
    const auto interval = std::chrono::milliseconds(
        std::max(1, collector_.config().sample_interval_ms));
    // At least one sample, even if stop() races the first snapshot
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        lock.unlock();
        auto s = collector_.snapshot();
        lock.lock();
        samples_.push_back(std::move(s));
        if (cv_.wait_for(lock, interval, [this] { return stopping_; }))
            break;
    }
}

std::vector<MetricsSnapshot> TelemetrySampler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable())
        thread_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(samples_, {});
}

} // namespace diarclip
