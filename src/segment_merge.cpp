#include "diarclip/segment_merge.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace diarclip {

namespace {

// A segment plus the sorted position of the event that opened it. Ordering
// ties by that position keeps the output independent of commit timing.
struct OpenSegment {
    SpeakerSegment seg;
    size_t opened_at;
};

} // namespace

std::vector<SpeakerSegment>
merge_segments(const std::vector<SpeakerEvent> &events,
               const MergeConfig &config) {
    if (config.gap_threshold < 0.0 || config.min_duration < 0.0) {
        throw std::invalid_argument(
            "merge_segments: gap_threshold and min_duration must be >= 0");
    }
    if (events.empty())
        return {};

    // Sort a view of the input; ties keep their original order
    std::vector<const SpeakerEvent *> sorted;
    sorted.reserve(events.size());
    for (const auto &e : events)
        sorted.push_back(&e);
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const SpeakerEvent *a, const SpeakerEvent *b) {
                         return a->start < b->start;
                     });

    std::vector<OpenSegment> committed;
    committed.reserve(events.size());

    auto commit = [&](const OpenSegment &s) {
        if (s.seg.duration() >= config.min_duration)
            committed.push_back(s);
    };

    std::vector<OpenSegment> open; // one per speaker
    std::unordered_map<std::string, size_t> open_index;

    for (size_t i = 0; i < sorted.size(); ++i) {
        const SpeakerEvent &e = *sorted[i];
        auto it = open_index.find(e.speaker);
        if (it == open_index.end()) {
            open_index.emplace(e.speaker, open.size());
            open.push_back({{e.speaker, e.start, e.end}, i});
            continue;
        }

        OpenSegment &current = open[it->second];
        if (e.start - current.seg.end <= config.gap_threshold) {
            // Extend into a new value rather than patching shared records
            current.seg = {current.seg.speaker, current.seg.start,
                           std::max(current.seg.end, e.end)};
        } else {
            commit(current);
            current = {{e.speaker, e.start, e.end}, i};
        }
    }

    for (const auto &s : open)
        commit(s);

    std::sort(committed.begin(), committed.end(),
              [](const OpenSegment &a, const OpenSegment &b) {
                  if (a.seg.start != b.seg.start)
                      return a.seg.start < b.seg.start;
                  return a.opened_at < b.opened_at;
              });

    std::vector<SpeakerSegment> result;
    result.reserve(committed.size());
    for (auto &s : committed)
        result.push_back(std::move(s.seg));
    return result;
}

std::vector<SpeakerEvent>
to_events(const std::vector<SpeakerSegment> &segments) {
    std::vector<SpeakerEvent> events;
    events.reserve(segments.size());
    for (const auto &s : segments)
        events.push_back({s.speaker, s.start, s.end});
    return events;
}

} // namespace diarclip
