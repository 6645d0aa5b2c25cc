#include "diarclip/diarclip.hpp"

#include <benchmark/benchmark.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static bool flag_markdown = false;
static bool flag_no_transcode = false;
static int flag_speakers = 3;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--markdown")
            flag_markdown = true;
        else if (arg == "--no-transcode")
            flag_no_transcode = true;
        else if (arg.starts_with("--speakers="))
            flag_speakers = std::max(1, std::stoi(arg.substr(11)));
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

// Split "merge/10000/real_time" → ("merge", 10000)
static std::pair<std::string, long>
parse_name_arg(const std::string &name) {
    auto first_slash = name.find('/');
    if (first_slash == std::string::npos)
        return {name, 0};
    auto second_slash = name.find('/', first_slash + 1);
    std::string arg_str = (second_slash != std::string::npos)
                              ? name.substr(first_slash + 1,
                                            second_slash - first_slash - 1)
                              : name.substr(first_slash + 1);
    long arg = 0;
    for (char c : arg_str) {
        if (c < '0' || c > '9')
            return {name.substr(0, first_slash), 0};
        arg = arg * 10 + (c - '0');
    }
    return {name.substr(0, first_slash), arg};
}

class MarkdownReporter : public benchmark::BenchmarkReporter {
  public:
    bool ReportContext(const Context &) override {
        std::cerr << "Running benchmarks..." << std::endl;
        return true;
    }

    void ReportRuns(const std::vector<Run> &reports) override {
        for (const auto &r : reports)
            runs_.push_back(r);
    }

    void Finalize() override {
        if (runs_.empty())
            return;

        std::cout << "| Stage | Size | Time (ms) | Items/s |\n";
        std::cout << "|-------|------|-----------|---------|\n";

        for (const auto &r : runs_) {
            if (r.skipped != benchmark::internal::NotSkipped)
                continue;

            auto [stage, size] = parse_name_arg(r.benchmark_name());
            double time_ms = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1000.0;
            double items = 0.0;
            auto it = r.counters.find("items_per_second");
            if (it != r.counters.end())
                items = it->second.value;

            std::cout << "| " << stage << " | " << size << " | " << std::fixed
                      << std::setprecision(3) << time_ms << " | "
                      << std::setprecision(0) << items << " |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

// ─── Synthetic inputs ───────────────────────────────────────────────────────

// Alternating turns with short same-speaker pauses, like a real conversation
static std::vector<diarclip::SpeakerEvent> make_events(size_t n, int speakers,
                                                       double duration = 0.0) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> len(0.2, 3.0);
    std::uniform_real_distribution<double> pause(0.0, 1.0);
    std::uniform_int_distribution<int> who(0, speakers - 1);

    std::vector<diarclip::SpeakerEvent> events;
    events.reserve(n);
    double t = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double start = t + pause(rng);
        double end = start + len(rng);
        if (duration > 0.0 && end >= duration)
            break;
        events.push_back(
            {"SPEAKER_0" + std::to_string(who(rng)), start, end});
        t = end;
    }
    return events;
}

static std::vector<uint8_t> make_wav(int seconds, int sample_rate) {
    std::vector<int16_t> pcm(static_cast<size_t>(seconds) * sample_rate);
    for (size_t i = 0; i < pcm.size(); ++i) {
        double t = static_cast<double>(i) / sample_rate;
        pcm[i] = static_cast<int16_t>(8000.0 * std::sin(2.0 * M_PI * 440.0 * t));
    }
    return diarclip::encode_wav_pcm16(pcm.data(), pcm.size(), sample_rate);
}

// ─── Benchmark registration ─────────────────────────────────────────────────

static const std::vector<int64_t> audio_durations = {1, 10, 60, 300};

static void add_duration_args(benchmark::Benchmark *b) {
    for (auto d : audio_durations)
        b->Arg(d);
    b->UseRealTime()->Unit(benchmark::kMillisecond);
}

static void register_benchmarks() {
    // Segment merge over synthetic event lists
    benchmark::RegisterBenchmark("merge", [](benchmark::State &state) {
        auto events =
            make_events(static_cast<size_t>(state.range(0)), flag_speakers);
        for (auto _ : state) {
            auto merged = diarclip::merge_segments(events);
            benchmark::DoNotOptimize(merged.data());
        }
        state.SetItemsProcessed(state.iterations() *
                                static_cast<int64_t>(events.size()));
    })
        ->RangeMultiplier(10)
        ->Range(100, 100000)
        ->UseRealTime()
        ->Unit(benchmark::kMicrosecond);

    // Inline clip extraction: decode, slice, WAV-encode, no storage
    add_duration_args(benchmark::RegisterBenchmark(
        "extract_inline", [](benchmark::State &state) {
            int audio_sec = static_cast<int>(state.range(0));
            auto wav = make_wav(audio_sec, 16000);
            auto segments = diarclip::merge_segments(
                make_events(100000, flag_speakers, audio_sec));
            diarclip::ClipExtractor extractor(diarclip::ClipDelivery::Inline);

            for (auto _ : state) {
                auto clips = extractor.extract(wav, segments);
                benchmark::DoNotOptimize(clips);
            }
            state.SetItemsProcessed(state.iterations() *
                                    static_cast<int64_t>(segments.size()));
        }));

    // Canonical check only (the fast path for already-normalized uploads)
    add_duration_args(benchmark::RegisterBenchmark(
        "validate", [](benchmark::State &state) {
            auto wav = make_wav(static_cast<int>(state.range(0)), 16000);
            diarclip::FormatNormalizer normalizer(
                std::make_unique<diarclip::NativeTranscoder>());
            for (auto _ : state) {
                bool ok = normalizer.validate(wav);
                benchmark::DoNotOptimize(ok);
            }
            state.SetItemsProcessed(state.iterations());
        }));

    // 44.1 kHz → 16 kHz through the in-process transcoder
    if (!flag_no_transcode) {
        add_duration_args(benchmark::RegisterBenchmark(
            "transcode_native", [](benchmark::State &state) {
                int audio_sec = static_cast<int>(state.range(0));
                auto wav = make_wav(audio_sec, 44100);
                diarclip::NativeTranscoder transcoder;
                for (auto _ : state) {
                    auto out = transcoder.transcode(wav, {});
                    benchmark::DoNotOptimize(out.data());
                }
                state.counters["Throughput"] = benchmark::Counter(
                    audio_sec, benchmark::Counter::kIsRate);
            }));
    }

    // One host snapshot without the CPU sampling window
    benchmark::RegisterBenchmark(
        "telemetry_snapshot", [](benchmark::State &state) {
            diarclip::TelemetryConfig cfg;
            cfg.cpu_window_ms = 0;
            cfg.probe_accelerator = false;
            diarclip::TelemetryCollector collector(cfg);
            for (auto _ : state) {
                auto s = collector.snapshot();
                benchmark::DoNotOptimize(s);
            }
            state.SetItemsProcessed(state.iterations());
        })
        ->UseRealTime()
        ->Unit(benchmark::kMicrosecond);
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            std::cerr
                << "Usage: diarclip_bench [options] [benchmark flags]\n"
                << "\nOptions:\n"
                << "  --speakers=N        Speakers in synthetic event lists "
                   "(default: 3)\n"
                << "  --no-transcode      Skip native transcoding benchmarks\n"
                << "  --markdown          Output as markdown table\n"
                << "\nGoogle Benchmark flags (passed through):\n"
                << "  --benchmark_filter=REGEX\n"
                << "  --benchmark_repetitions=N\n"
                << "  --benchmark_format={console|json|csv}\n"
                << std::endl;
            return 0;
        }
    }

    diarclip::set_info_logging(false);

    benchmark::Initialize(&argc, argv);
    register_benchmarks();

    if (flag_markdown) {
        MarkdownReporter reporter;
        benchmark::RunSpecifiedBenchmarks(&reporter);
    } else {
        benchmark::RunSpecifiedBenchmarks();
    }

    benchmark::Shutdown();
    return 0;
}
