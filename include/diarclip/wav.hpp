#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace diarclip {

// Canonical audio: single-channel 16-bit linear PCM at 16 kHz, WAV framing.
constexpr int CANONICAL_SAMPLE_RATE = 16000;
constexpr int CANONICAL_CHANNELS = 1;
constexpr int CANONICAL_BITS_PER_SAMPLE = 16;

constexpr uint16_t WAV_FORMAT_PCM = 1;
constexpr uint16_t WAV_FORMAT_IEEE_FLOAT = 3;
constexpr uint16_t WAV_FORMAT_EXTENSIBLE = 0xFFFE;

struct WavHeader {
    uint16_t audio_format;    // WAVE_FORMAT_EXTENSIBLE resolved to sub-format
    uint16_t num_channels;
    uint32_t sample_rate;
    uint16_t bits_per_sample;
    uint16_t block_align;
    size_t data_offset;       // byte offset of the first sample
    size_t data_size;         // bytes, clamped to the buffer, whole frames
};

// RIFF....WAVE magic.
bool is_wav(const uint8_t *data, size_t len);

// Scan RIFF chunks in a memory buffer. Throws std::runtime_error if the
// buffer is not a well-formed WAV (missing fmt/data, fmt after data, zero
// channels or rate). An oversized data length (streamed WAVs write
// 0xFFFFFFFF) is clamped to the bytes actually present.
WavHeader parse_wav_header(const uint8_t *data, size_t len);

bool is_canonical(const WavHeader &header);

struct PcmBuffer {
    std::vector<int16_t> samples; // mono
    int sample_rate = CANONICAL_SAMPLE_RATE;

    double duration() const {
        return static_cast<double>(samples.size()) / sample_rate;
    }
};

// Decode a 16-bit PCM mono WAV without any conversion. Throws
// std::runtime_error for any other layout.
PcmBuffer read_wav_pcm16(const uint8_t *data, size_t len);

inline PcmBuffer read_wav_pcm16(const std::vector<uint8_t> &bytes) {
    return read_wav_pcm16(bytes.data(), bytes.size());
}

// Encode mono int16 samples as a self-contained 16-bit PCM WAV (dr_wav).
std::vector<uint8_t> encode_wav_pcm16(const int16_t *samples,
                                      size_t num_samples, int sample_rate);

} // namespace diarclip
