#include "diarclip/clip_extractor.hpp"

#include "diarclip/encoding.hpp"
#include "diarclip/errors.hpp"
#include "diarclip/log.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace diarclip {

size_t clip_count(const ClipMap &clips) {
    size_t n = 0;
    for (const auto &[speaker, list] : clips)
        n += list.size();
    return n;
}

SampleRange to_sample_range(double start, double end, int sample_rate,
                            size_t num_samples) {
    auto limit = static_cast<int64_t>(num_samples);
    auto to_sample = [&](double t) {
        int64_t s = std::llround(t * sample_rate);
        return std::clamp<int64_t>(s, 0, limit);
    };
    SampleRange r{to_sample(start), to_sample(end)};
    r.end = std::max(r.end, r.begin);
    return r;
}

// ─── ClipExtractor ───────────────────────────────────────────────────────────

ClipExtractor::ClipExtractor(ClipDelivery delivery,
                             std::shared_ptr<ClipStore> store)
    : delivery_(delivery), store_(std::move(store)) {
    if (delivery_ == ClipDelivery::Persisted && !store_) {
        throw std::invalid_argument(
            "Persisted clip delivery requires a clip store");
    }
}

ClipMap ClipExtractor::extract(const std::vector<uint8_t> &canonical_wav,
                               const std::vector<SpeakerSegment> &segments) const {
    PcmBuffer pcm;
    try {
        pcm = read_wav_pcm16(canonical_wav);
    } catch (const std::runtime_error &e) {
        throw ProcessingError(
            std::string("Failed to extract speaker segments: ") + e.what());
    }
    return extract(pcm, segments);
}

ClipMap ClipExtractor::extract(const PcmBuffer &pcm,
                               const std::vector<SpeakerSegment> &segments) const {
    // Visit segments in time order even if the caller did not sort them
    std::vector<size_t> order(segments.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return segments[a].start < segments[b].start;
    });

    const size_t total = pcm.samples.size();
    ClipMap clips;

    for (size_t idx : order) {
        const auto &seg = segments[idx];
        if (!(seg.end > seg.start) || seg.start < 0.0) {
            throw ProcessingError("Failed to extract speaker segments: "
                                  "invalid segment [" +
                                  std::to_string(seg.start) + ", " +
                                  std::to_string(seg.end) + ")");
        }

        // Turns reaching past the recording clamp to it, possibly to nothing
        auto range = to_sample_range(seg.start, seg.end, pcm.sample_rate, total);

        SpeakerClip clip;
        clip.id = make_uuid();
        clip.speaker = seg.speaker;
        clip.start = seg.start;
        clip.end = seg.end;
        clip.start_sample = range.begin;
        clip.end_sample = range.end;
        try {
            // Copy out of the shared buffer; the source stays intact
            clip.audio = encode_wav_pcm16(
                pcm.samples.data() + range.begin,
                static_cast<size_t>(range.end - range.begin), pcm.sample_rate);
        } catch (const std::runtime_error &e) {
            throw ProcessingError(
                std::string("Failed to extract speaker segments: ") + e.what());
        }

        clips[seg.speaker].push_back(std::move(clip));
    }

    if (delivery_ == ClipDelivery::Persisted) {
        std::vector<SpeakerClip *> all;
        for (auto &[speaker, list] : clips)
            for (auto &clip : list)
                all.push_back(&clip);
        persist(all);
    }

    log_info("Extracted " + std::to_string(clip_count(clips)) + " clips for " +
             std::to_string(clips.size()) + " speakers");
    return clips;
}

void ClipExtractor::persist(std::vector<SpeakerClip *> &clips) const {
    std::vector<std::string> stored;
    stored.reserve(clips.size());

    for (SpeakerClip *clip : clips) {
        std::string name = clip->id + ".wav";
        try {
            clip->audio_url = store_->store(name, clip->audio);
        } catch (const std::exception &e) {
            // The failing clip may have been partly written too
            stored.push_back(name);
            for (const auto &done : stored)
                store_->remove(done);
            throw ProcessingError(
                std::string("Failed to extract speaker segments: ") + e.what());
        }
        stored.push_back(name);
        clip->audio.clear();
        clip->audio.shrink_to_fit();
    }
}

// ─── JSON ────────────────────────────────────────────────────────────────────

nlohmann::ordered_json clip_to_json(const SpeakerClip &clip,
                                    bool with_payload) {
    nlohmann::ordered_json j;
    j["id"] = clip.id;
    j["start"] = clip.start;
    j["end"] = clip.end;
    if (!clip.is_inline()) {
        j["audio_url"] = clip.audio_url;
    } else if (with_payload) {
        j["audio_base64"] = base64_encode(clip.audio);
    } else {
        j["audio_size_bytes"] = clip.audio.size();
    }
    return j;
}

nlohmann::ordered_json clips_to_json(const ClipMap &clips, bool with_payload) {
    auto j = nlohmann::ordered_json::object();
    for (const auto &[speaker, list] : clips) {
        auto arr = nlohmann::ordered_json::array();
        for (const auto &clip : list)
            arr.push_back(clip_to_json(clip, with_payload));
        j[speaker] = std::move(arr);
    }
    return j;
}

} // namespace diarclip
