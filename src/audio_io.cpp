// Audio I/O: container probing, memory-buffer decoding, resampling
//
// Uses single-header C decoders:
//   - dr_wav, dr_flac, dr_mp3 (mackron/dr_libs)
//   - stb_vorbis (nothings/stb)

#define DR_WAV_IMPLEMENTATION
#define DR_FLAC_IMPLEMENTATION
#define DR_MP3_IMPLEMENTATION

#include "dr_wav.h"
#include "dr_flac.h"
#include "dr_mp3.h"

// stb_vorbis is a .c file; include as extern "C", then clean up leaked macros
extern "C" {
#include "stb_vorbis.c"
}
#undef C
#undef R
#undef L

#include "diarclip/audio_io.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <stdexcept>

namespace diarclip {

const char *format_name(AudioFormat format) {
    switch (format) {
    case AudioFormat::WAV:
        return "wav";
    case AudioFormat::FLAC:
        return "flac";
    case AudioFormat::MP3:
        return "mp3";
    case AudioFormat::OGG:
        return "ogg";
    default:
        return "unknown";
    }
}

// ─── Format Detection ────────────────────────────────────────────────────────

AudioFormat detect_format_by_magic(const uint8_t *data, size_t len) {
    if (len < 4)
        return AudioFormat::Unknown;

    if (len >= 12 && data[0] == 'R' && data[1] == 'I' && data[2] == 'F' &&
        data[3] == 'F' && data[8] == 'W' && data[9] == 'A' &&
        data[10] == 'V' && data[11] == 'E') {
        return AudioFormat::WAV;
    }
    if (data[0] == 'f' && data[1] == 'L' && data[2] == 'a' && data[3] == 'C') {
        return AudioFormat::FLAC;
    }
    if (data[0] == 'O' && data[1] == 'g' && data[2] == 'g' && data[3] == 'S') {
        return AudioFormat::OGG;
    }
    if (data[0] == 'I' && data[1] == 'D' && data[2] == '3') {
        return AudioFormat::MP3;
    }
    // MPEG audio frame sync: 11 set bits
    if (data[0] == 0xFF && (data[1] & 0xE0) == 0xE0) {
        return AudioFormat::MP3;
    }
    return AudioFormat::Unknown;
}

// ─── Probing ─────────────────────────────────────────────────────────────────

AudioInfo probe_audio(const uint8_t *data, size_t len) {
    auto fmt = detect_format_by_magic(data, len);
    AudioInfo info{fmt, 0, 0, 0, 0.0};

    switch (fmt) {
    case AudioFormat::WAV: {
        drwav wav;
        if (!drwav_init_memory(&wav, data, len, nullptr)) {
            throw std::runtime_error("Cannot parse WAV container");
        }
        info.sample_rate = static_cast<int>(wav.sampleRate);
        info.num_channels = wav.channels;
        info.num_frames = wav.totalPCMFrameCount;
        drwav_uninit(&wav);
        break;
    }
    case AudioFormat::FLAC: {
        drflac *flac = drflac_open_memory(data, len, nullptr);
        if (!flac) {
            throw std::runtime_error("Cannot parse FLAC stream");
        }
        info.sample_rate = static_cast<int>(flac->sampleRate);
        info.num_channels = flac->channels;
        info.num_frames = flac->totalPCMFrameCount;
        drflac_close(flac);
        break;
    }
    case AudioFormat::MP3: {
        drmp3 mp3;
        if (!drmp3_init_memory(&mp3, data, len, nullptr)) {
            throw std::runtime_error("Cannot parse MP3 stream");
        }
        info.sample_rate = static_cast<int>(mp3.sampleRate);
        info.num_channels = static_cast<int>(mp3.channels);
        // MP3 has no reliable header length, count frames by scanning
        info.num_frames = drmp3_get_pcm_frame_count(&mp3);
        drmp3_uninit(&mp3);
        if (info.num_frames == 0) {
            throw std::runtime_error("MP3 stream holds no decodable frames");
        }
        break;
    }
    case AudioFormat::OGG: {
        int error = 0;
        stb_vorbis *v = stb_vorbis_open_memory(data, static_cast<int>(len),
                                               &error, nullptr);
        if (!v) {
            throw std::runtime_error("Cannot parse OGG Vorbis stream");
        }
        stb_vorbis_info vi = stb_vorbis_get_info(v);
        info.sample_rate = static_cast<int>(vi.sample_rate);
        info.num_channels = vi.channels;
        info.num_frames = stb_vorbis_stream_length_in_samples(v);
        stb_vorbis_close(v);
        break;
    }
    default:
        throw std::runtime_error("Unrecognized audio container");
    }

    if (info.sample_rate <= 0 || info.num_channels <= 0) {
        throw std::runtime_error(std::string("Invalid ") + format_name(fmt) +
                                 " stream parameters");
    }
    info.duration = static_cast<double>(info.num_frames) / info.sample_rate;
    return info;
}

// ─── Sinc Resampler ──────────────────────────────────────────────────────────

namespace {

// Modified Bessel function I0 (for Kaiser window)
double bessel_i0(double x) {
    double sum = 1.0;
    double term = 1.0;
    for (int k = 1; k < 30; ++k) {
        term *= (x * x) / (4.0 * k * k);
        sum += term;
        if (term < 1e-12 * sum)
            break;
    }
    return sum;
}

// Kaiser-windowed sinc, 16-tap half-width, ~80dB stopband. The kernel is
// stretched by the decimation ratio so downsampling also low-passes.
std::vector<float> sinc_resample(const float *input, size_t input_len,
                                 int src_rate, int dst_rate) {
    if (src_rate == dst_rate || input_len == 0) {
        return std::vector<float>(input, input + input_len);
    }

    constexpr int HALF_WIDTH = 16;
    constexpr double BETA = 7.857;
    const double i0_beta = bessel_i0(BETA);

    int g = std::gcd(src_rate, dst_rate);
    int up = dst_rate / g;
    int down = src_rate / g;
    size_t output_len = static_cast<size_t>(
        (static_cast<int64_t>(input_len) * up + down - 1) / down);

    double step = static_cast<double>(src_rate) / dst_rate;
    double cutoff = std::min(1.0, 1.0 / step);
    double width = std::max(1.0, step);
    int reach = static_cast<int>(std::ceil(HALF_WIDTH * width));

    std::vector<float> output(output_len);
    for (size_t i = 0; i < output_len; ++i) {
        double pos = static_cast<double>(i) * step;
        int center = static_cast<int>(std::floor(pos));
        int lo = std::max(0, center - reach + 1);
        int hi = std::min(static_cast<int>(input_len) - 1, center + reach);

        double sum = 0.0;
        double weight_sum = 0.0;
        for (int j = lo; j <= hi; ++j) {
            double dist = pos - j;
            double r = dist / (HALF_WIDTH * width);
            if (std::abs(r) > 1.0)
                continue;
            double window = bessel_i0(BETA * std::sqrt(1.0 - r * r)) / i0_beta;
            double x = dist * cutoff * M_PI;
            double sinc = std::abs(x) < 1e-10 ? 1.0 : std::sin(x) / x;
            double w = sinc * window;
            sum += input[j] * w;
            weight_sum += w;
        }
        output[i] =
            weight_sum > 1e-10 ? static_cast<float>(sum / weight_sum) : 0.0f;
    }
    return output;
}

// Downmix interleaved multi-channel to mono
std::vector<float> downmix_to_mono(const float *interleaved, size_t total,
                                   int channels) {
    if (channels == 1) {
        return std::vector<float>(interleaved, interleaved + total);
    }
    size_t frames = total / channels;
    std::vector<float> mono(frames);
    float inv_ch = 1.0f / static_cast<float>(channels);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = sum * inv_ch;
    }
    return mono;
}

AudioData make_audio_data(std::vector<float> &&mono, int src_rate,
                          int target_rate, int original_channels,
                          AudioFormat fmt) {
    float duration =
        static_cast<float>(mono.size()) / static_cast<float>(src_rate);

    std::vector<float> final_samples =
        src_rate != target_rate
            ? sinc_resample(mono.data(), mono.size(), src_rate, target_rate)
            : std::move(mono);

    int num_samples = static_cast<int>(final_samples.size());
    auto tensor = axiom::Tensor::from_data(
        final_samples.data(),
        axiom::Shape{static_cast<size_t>(num_samples)}, true);

    return AudioData{
        std::move(tensor), target_rate, src_rate, original_channels,
        num_samples,       duration,    fmt,
    };
}

// ─── Per-Format Decoders ─────────────────────────────────────────────────────

AudioData decode_wav(const uint8_t *data, size_t len, int target_rate) {
    drwav wav;
    if (!drwav_init_memory(&wav, data, len, nullptr)) {
        throw std::runtime_error("Cannot decode WAV from memory buffer");
    }

    size_t total_frames = wav.totalPCMFrameCount;
    int channels = wav.channels;
    int sample_rate = static_cast<int>(wav.sampleRate);

    std::vector<float> interleaved(total_frames * channels);
    size_t frames_read =
        drwav_read_pcm_frames_f32(&wav, total_frames, interleaved.data());
    drwav_uninit(&wav);

    if (frames_read == 0) {
        throw std::runtime_error("Failed to decode WAV from memory");
    }
    interleaved.resize(frames_read * channels);

    auto mono =
        downmix_to_mono(interleaved.data(), interleaved.size(), channels);
    return make_audio_data(std::move(mono), sample_rate, target_rate, channels,
                           AudioFormat::WAV);
}

AudioData decode_flac(const uint8_t *data, size_t len, int target_rate) {
    unsigned int channels, sample_rate;
    drflac_uint64 total_frames;
    float *interleaved = drflac_open_memory_and_read_pcm_frames_f32(
        data, len, &channels, &sample_rate, &total_frames, nullptr);

    if (!interleaved) {
        throw std::runtime_error("Cannot decode FLAC from memory buffer");
    }

    auto mono = downmix_to_mono(interleaved, total_frames * channels,
                                static_cast<int>(channels));
    drflac_free(interleaved, nullptr);

    return make_audio_data(std::move(mono), static_cast<int>(sample_rate),
                           target_rate, static_cast<int>(channels),
                           AudioFormat::FLAC);
}

AudioData decode_mp3(const uint8_t *data, size_t len, int target_rate) {
    drmp3_config config;
    drmp3_uint64 total_frames;
    float *interleaved = drmp3_open_memory_and_read_pcm_frames_f32(
        data, len, &config, &total_frames, nullptr);

    if (!interleaved) {
        throw std::runtime_error("Cannot decode MP3 from memory buffer");
    }

    int channels = static_cast<int>(config.channels);
    auto mono = downmix_to_mono(interleaved, total_frames * channels, channels);
    drmp3_free(interleaved, nullptr);

    return make_audio_data(std::move(mono), static_cast<int>(config.sampleRate),
                           target_rate, channels, AudioFormat::MP3);
}

AudioData decode_ogg(const uint8_t *data, size_t len, int target_rate) {
    int channels, sample_rate;
    short *raw_data;
    int total_samples = stb_vorbis_decode_memory(
        data, static_cast<int>(len), &channels, &sample_rate, &raw_data);
    if (total_samples < 0) {
        throw std::runtime_error("Cannot decode OGG from memory buffer");
    }

    size_t total = static_cast<size_t>(total_samples) * channels;
    std::vector<float> interleaved(total);
    for (size_t i = 0; i < total; ++i) {
        interleaved[i] = static_cast<float>(raw_data[i]) / 32768.0f;
    }
    std::free(raw_data);

    auto mono =
        downmix_to_mono(interleaved.data(), interleaved.size(), channels);
    return make_audio_data(std::move(mono), sample_rate, target_rate, channels,
                           AudioFormat::OGG);
}

} // namespace

// ─── Public API ──────────────────────────────────────────────────────────────

AudioData read_audio(const uint8_t *data, size_t len, int target_sample_rate) {
    switch (detect_format_by_magic(data, len)) {
    case AudioFormat::WAV:
        return decode_wav(data, len, target_sample_rate);
    case AudioFormat::FLAC:
        return decode_flac(data, len, target_sample_rate);
    case AudioFormat::MP3:
        return decode_mp3(data, len, target_sample_rate);
    case AudioFormat::OGG:
        return decode_ogg(data, len, target_sample_rate);
    default:
        throw std::runtime_error(
            "Unsupported or unrecognized audio format in memory buffer");
    }
}

std::vector<int16_t> to_pcm16(const axiom::Tensor &samples) {
    auto cont = samples.ascontiguousarray();
    const float *data = cont.typed_data<float>();
    size_t len = cont.shape()[0];

    std::vector<int16_t> pcm(len);
    for (size_t i = 0; i < len; ++i) {
        float v = std::clamp(data[i], -1.0f, 1.0f) * 32767.0f;
        pcm[i] = static_cast<int16_t>(std::lround(v));
    }
    return pcm;
}

} // namespace diarclip
