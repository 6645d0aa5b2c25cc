#include "diarclip/wav.hpp"

#include "dr_wav.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace diarclip {

namespace {

struct RiffHeader {
    char riff[4];       // "RIFF"
    uint32_t file_size; // total file size - 8
    char wave[4];       // "WAVE"
};

struct ChunkHeader {
    char id[4];
    uint32_t size;
};

struct FmtChunk {
    uint16_t audio_format; // 1 = PCM, 3 = IEEE float, 0xFFFE = extensible
    uint16_t num_channels;
    uint32_t sample_rate;
    uint32_t byte_rate;
    uint16_t block_align;
    uint16_t bits_per_sample;
};

// WAVE_FORMAT_EXTENSIBLE: cbSize(2) validBits(2) channelMask(4) then the
// SubFormat GUID, whose first two bytes carry the actual format code.
constexpr size_t EXTENSIBLE_SUBFORMAT_OFFSET = sizeof(FmtChunk) + 8;

} // namespace

bool is_wav(const uint8_t *data, size_t len) {
    return len >= 12 && std::memcmp(data, "RIFF", 4) == 0 &&
           std::memcmp(data + 8, "WAVE", 4) == 0;
}

WavHeader parse_wav_header(const uint8_t *data, size_t len) {
    if (!is_wav(data, len)) {
        throw std::runtime_error("Not a valid WAV buffer");
    }

    // Scan chunks (don't assume 44-byte header)
    FmtChunk fmt{};
    bool found_fmt = false;
    uint16_t format_code = 0;
    size_t pos = sizeof(RiffHeader);

    while (pos + sizeof(ChunkHeader) <= len) {
        ChunkHeader chunk{};
        std::memcpy(&chunk, data + pos, sizeof(chunk));
        size_t body = pos + sizeof(ChunkHeader);
        size_t remaining = len - body;

        if (std::strncmp(chunk.id, "fmt ", 4) == 0) {
            if (chunk.size < sizeof(FmtChunk) || remaining < sizeof(FmtChunk)) {
                throw std::runtime_error("WAV: truncated fmt chunk");
            }
            std::memcpy(&fmt, data + body, sizeof(fmt));
            format_code = fmt.audio_format;
            if (format_code == WAV_FORMAT_EXTENSIBLE) {
                if (chunk.size < EXTENSIBLE_SUBFORMAT_OFFSET + 2 ||
                    remaining < EXTENSIBLE_SUBFORMAT_OFFSET + 2) {
                    throw std::runtime_error(
                        "WAV: truncated WAVE_FORMAT_EXTENSIBLE fmt chunk");
                }
                std::memcpy(&format_code,
                            data + body + EXTENSIBLE_SUBFORMAT_OFFSET, 2);
            }
            found_fmt = true;

        } else if (std::strncmp(chunk.id, "data", 4) == 0) {
            if (!found_fmt) {
                throw std::runtime_error("WAV: data chunk before fmt chunk");
            }
            if (fmt.num_channels == 0 || fmt.sample_rate == 0 ||
                fmt.block_align == 0 || fmt.bits_per_sample == 0) {
                throw std::runtime_error("WAV: invalid fmt chunk");
            }

            size_t data_size = std::min<size_t>(chunk.size, remaining);
            data_size -= data_size % fmt.block_align;

            return WavHeader{
                format_code,     fmt.num_channels, fmt.sample_rate,
                fmt.bits_per_sample, fmt.block_align, body,
                data_size,
            };
        }

        // Advance to next chunk (chunks are word-aligned)
        size_t advance = (static_cast<size_t>(chunk.size) + 1) & ~size_t{1};
        if (advance > remaining)
            break;
        pos = body + advance;
    }

    throw std::runtime_error("WAV buffer missing fmt or data chunk");
}

bool is_canonical(const WavHeader &header) {
    return header.audio_format == WAV_FORMAT_PCM &&
           header.num_channels == CANONICAL_CHANNELS &&
           header.bits_per_sample == CANONICAL_BITS_PER_SAMPLE &&
           header.sample_rate == CANONICAL_SAMPLE_RATE;
}

PcmBuffer read_wav_pcm16(const uint8_t *data, size_t len) {
    auto header = parse_wav_header(data, len);
    if (header.audio_format != WAV_FORMAT_PCM || header.bits_per_sample != 16 ||
        header.num_channels != 1) {
        throw std::runtime_error(
            "Expected 16-bit PCM mono WAV, got format=" +
            std::to_string(header.audio_format) +
            " bits=" + std::to_string(header.bits_per_sample) +
            " channels=" + std::to_string(header.num_channels));
    }

    PcmBuffer pcm;
    pcm.sample_rate = static_cast<int>(header.sample_rate);
    pcm.samples.resize(header.data_size / sizeof(int16_t));
    if (!pcm.samples.empty()) {
        std::memcpy(pcm.samples.data(), data + header.data_offset,
                    pcm.samples.size() * sizeof(int16_t));
    }
    return pcm;
}

std::vector<uint8_t> encode_wav_pcm16(const int16_t *samples,
                                      size_t num_samples, int sample_rate) {
    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = 1;
    format.sampleRate = static_cast<drwav_uint32>(sample_rate);
    format.bitsPerSample = 16;

    drwav wav;
    void *out_data = nullptr;
    size_t out_size = 0;
    if (!drwav_init_memory_write(&wav, &out_data, &out_size, &format,
                                 nullptr)) {
        throw std::runtime_error("Cannot initialize WAV encoder");
    }

    drwav_uint64 written = 0;
    if (num_samples > 0) {
        written = drwav_write_pcm_frames(&wav, num_samples, samples);
    }
    drwav_uninit(&wav); // finalizes RIFF/data sizes

    std::vector<uint8_t> bytes;
    if (out_data) {
        auto *begin = static_cast<const uint8_t *>(out_data);
        bytes.assign(begin, begin + out_size);
        drwav_free(out_data, nullptr);
    }

    if (written != num_samples || bytes.empty()) {
        throw std::runtime_error("Failed to encode WAV: wrote " +
                                 std::to_string(written) + " of " +
                                 std::to_string(num_samples) + " frames");
    }
    return bytes;
}

} // namespace diarclip
