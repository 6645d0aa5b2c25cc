#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <axiom/axiom.hpp>

namespace diarclip {

enum class AudioFormat { Unknown, WAV, FLAC, MP3, OGG };

const char *format_name(AudioFormat format);

// Container-level facts, read without resampling.
struct AudioInfo {
    AudioFormat format;
    int sample_rate;
    int num_channels;
    uint64_t num_frames;
    double duration; // seconds
};

struct AudioData {
    axiom::Tensor samples;    // float32, (num_samples,), mono, [-1,1]
    int sample_rate;          // target rate after read_audio
    int original_sample_rate; // source rate before resampling
    int num_channels;         // original channel count before downmix
    int num_samples;          // = samples.shape()[0]
    float duration;           // seconds
    AudioFormat format;
};

// Format detection by magic bytes (RIFF/WAVE, fLaC, OggS, ID3 / MPEG sync).
AudioFormat detect_format_by_magic(const uint8_t *data, size_t len);

// Open the container with the matching decoder and report its layout.
// Throws std::runtime_error if nothing can decode the buffer.
AudioInfo probe_audio(const uint8_t *data, size_t len);

// Decode encoded bytes (WAV/FLAC/MP3/OGG), downmix to mono and resample to
// target_sample_rate. Throws std::runtime_error on decode failure.
AudioData read_audio(const uint8_t *data, size_t len,
                     int target_sample_rate = 16000);

// float32 [-1,1] → int16 with clipping and rounding.
std::vector<int16_t> to_pcm16(const axiom::Tensor &samples);

} // namespace diarclip
