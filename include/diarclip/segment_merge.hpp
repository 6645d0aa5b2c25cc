#pragma once

#include <string>
#include <vector>

#include "diarclip/config.hpp"

namespace diarclip {

// ─── Segment Types ───────────────────────────────────────────────────────────

// One speech turn as reported by the diarization engine.
struct SpeakerEvent {
    std::string speaker; // run-local cluster label, e.g. "SPEAKER_00"
    double start;        // seconds
    double end;          // seconds
};

// A merged, filtered turn. Same shape as SpeakerEvent, different guarantee:
// consecutive segments of one speaker are more than gap_threshold apart.
struct SpeakerSegment {
    std::string speaker;
    double start; // seconds
    double end;   // seconds

    double duration() const { return end - start; }
};

inline bool operator==(const SpeakerSegment &a, const SpeakerSegment &b) {
    return a.speaker == b.speaker && a.start == b.start && a.end == b.end;
}

// ─── Merge ───────────────────────────────────────────────────────────────────

/// Collapse speaker events into gap-tolerant segments.
///
/// Events are stable-sorted by start. Each speaker keeps one open segment;
/// the speaker's next event extends it when
/// `next.start - open.end <= gap_threshold` (overlaps always extend),
/// otherwise the open segment is committed and the event opens a new one.
/// Committed segments shorter than min_duration are dropped; the next event
/// of that speaker then starts fresh. Speech of other speakers in between
/// does not interrupt a speaker's run, and different speakers never merge.
///
/// Output is sorted by start. The input is not modified and the result is a
/// fixed point: merging it again with the same config returns it unchanged.
///
/// Throws std::invalid_argument for a negative gap_threshold or min_duration.
std::vector<SpeakerSegment>
merge_segments(const std::vector<SpeakerEvent> &events,
               const MergeConfig &config = {});

// Lift segments back to events (re-merging, engines that emit segments).
std::vector<SpeakerEvent>
to_events(const std::vector<SpeakerSegment> &segments);

} // namespace diarclip
