#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "diarclip/clip_store.hpp"
#include "diarclip/config.hpp"
#include "diarclip/segment_merge.hpp"
#include "diarclip/wav.hpp"

namespace diarclip {

// ─── Clip Types ──────────────────────────────────────────────────────────────

struct SpeakerClip {
    std::string id; // UUIDv4, unique per clip
    std::string speaker;
    double start; // seconds, as segmented
    double end;
    int64_t start_sample; // [start_sample, end_sample) of the source
    int64_t end_sample;

    // Exactly one payload is set, depending on the delivery mode
    std::vector<uint8_t> audio; // Inline: self-contained WAV bytes
    std::string audio_url;      // Persisted: storage reference

    int64_t num_samples() const { return end_sample - start_sample; }
    bool is_inline() const { return audio_url.empty(); }
};

// speaker → clips in segment time order
using ClipMap = std::map<std::string, std::vector<SpeakerClip>>;

size_t clip_count(const ClipMap &clips);

// ─── Sample Mapping ──────────────────────────────────────────────────────────

struct SampleRange {
    int64_t begin;
    int64_t end;
};

// round(t * sample_rate) for both bounds, clamped to [0, num_samples].
SampleRange to_sample_range(double start, double end, int sample_rate,
                            size_t num_samples);

// ─── Extractor ───────────────────────────────────────────────────────────────

class ClipExtractor {
  public:
    // Persisted delivery requires a store.
    explicit ClipExtractor(ClipDelivery delivery,
                           std::shared_ptr<ClipStore> store = nullptr);

    /// Decode the canonical WAV once and cut one clip per segment.
    /// All-or-nothing: throws ProcessingError and leaves no stored clips
    /// behind if decoding, slicing, encoding or storing fails.
    ClipMap extract(const std::vector<uint8_t> &canonical_wav,
                    const std::vector<SpeakerSegment> &segments) const;

    /// Same, from an already decoded buffer (never modified).
    ClipMap extract(const PcmBuffer &pcm,
                    const std::vector<SpeakerSegment> &segments) const;

    ClipDelivery delivery() const { return delivery_; }

  private:
    ClipDelivery delivery_;
    std::shared_ptr<ClipStore> store_;

    void persist(std::vector<SpeakerClip *> &clips) const;
};

// ─── JSON ────────────────────────────────────────────────────────────────────

// {id, start, end, audio_url | audio_base64}. With with_payload=false inline
// clips carry audio_size_bytes instead of the encoded audio.
nlohmann::ordered_json clip_to_json(const SpeakerClip &clip,
                                    bool with_payload = true);

nlohmann::ordered_json clips_to_json(const ClipMap &clips,
                                     bool with_payload = true);

} // namespace diarclip
