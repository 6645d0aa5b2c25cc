#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "diarclip/audio_io.hpp"
#include "diarclip/config.hpp"
#include "diarclip/wav.hpp"

namespace diarclip {

// ─── Transcoders ─────────────────────────────────────────────────────────────

struct TargetFormat {
    int sample_rate = CANONICAL_SAMPLE_RATE;
    int channels = CANONICAL_CHANNELS;
    int bits_per_sample = CANONICAL_BITS_PER_SAMPLE;
};

// Black box: arbitrary audio bytes in, PCM WAV bytes in the target layout
// out. Implementations throw ProcessingError on any failure; an empty
// result is never returned as success.
class Transcoder {
  public:
    virtual ~Transcoder() = default;
    virtual std::vector<uint8_t> transcode(const std::vector<uint8_t> &input,
                                           const TargetFormat &target) = 0;
    virtual std::string name() const = 0;
};

// Pipes the input through `ffmpeg -i pipe:0 ... -f wav pipe:1`.
class FfmpegTranscoder : public Transcoder {
  public:
    explicit FfmpegTranscoder(std::string ffmpeg_path = "ffmpeg");

    std::vector<uint8_t> transcode(const std::vector<uint8_t> &input,
                                   const TargetFormat &target) override;
    std::string name() const override { return "ffmpeg"; }

    // argv used for a given target (exposed for diagnostics and tests)
    std::vector<std::string> command_for(const TargetFormat &target) const;

  private:
    std::string ffmpeg_path_;
};

// In-process: dr_libs / stb_vorbis decode, downmix, sinc resample, dr_wav.
class NativeTranscoder : public Transcoder {
  public:
    std::vector<uint8_t> transcode(const std::vector<uint8_t> &input,
                                   const TargetFormat &target) override;
    std::string name() const override { return "native"; }
};

std::unique_ptr<Transcoder> make_transcoder(const NormalizerConfig &config);

// ─── Format Normalizer ───────────────────────────────────────────────────────

class FormatNormalizer {
  public:
    explicit FormatNormalizer(std::unique_ptr<Transcoder> transcoder,
                              TargetFormat target = {});

    /// True iff `bytes` is a PCM WAV in the target layout.
    /// Readable audio in any other layout returns false; bytes that no
    /// decoder can parse throw InvalidFormatError.
    bool validate(const std::vector<uint8_t> &bytes) const;

    /// Container facts for the upload (throws InvalidFormatError).
    AudioInfo inspect(const std::vector<uint8_t> &bytes) const;

    /// Canonical input comes back unchanged. Anything else goes through the
    /// transcoder and is re-framed; throws ProcessingError if the result is
    /// missing or still not canonical.
    std::vector<uint8_t> normalize(const std::vector<uint8_t> &bytes) const;

    const Transcoder &transcoder() const { return *transcoder_; }

  private:
    std::unique_ptr<Transcoder> transcoder_;
    TargetFormat target_;

    bool matches_target(const WavHeader &header) const;
};

} // namespace diarclip
