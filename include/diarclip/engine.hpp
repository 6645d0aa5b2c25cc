#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "diarclip/config.hpp"
#include "diarclip/segment_merge.hpp"

namespace diarclip {

// ─── Diarization Engine ──────────────────────────────────────────────────────

// Opaque "who spoke when": canonical WAV bytes in, speaker events out.
// Failures are reported as ProcessingError.
class DiarizationEngine {
  public:
    virtual ~DiarizationEngine() = default;
    virtual std::vector<SpeakerEvent>
    diarize(const std::vector<uint8_t> &canonical_wav) = 0;
    virtual std::string name() const = 0;
};

// External diarizer process. The canonical WAV is written to its stdin and
// RTTM is read from its stdout.
class CommandDiarizer : public DiarizationEngine {
  public:
    /// Throws ModelUnavailableError if the command is empty or its
    /// executable cannot be resolved.
    explicit CommandDiarizer(EngineConfig config);

    std::vector<SpeakerEvent>
    diarize(const std::vector<uint8_t> &canonical_wav) override;
    std::string name() const override;

    const std::string &executable() const { return executable_; }

  private:
    EngineConfig config_;
    std::string executable_;
};

// ─── RTTM ────────────────────────────────────────────────────────────────────

/// Parse SPEAKER records:
///   SPEAKER <file> <chan> <onset> <duration> <NA> <NA> <label> <NA> <NA>
/// Other record types, blank lines and '#' comments are skipped, as are
/// turns with a non-positive duration. Throws std::runtime_error on a
/// malformed SPEAKER line.
std::vector<SpeakerEvent> parse_rttm(const std::string &text);

// One SPEAKER line per event ("audio" as file id, channel 1).
std::string format_rttm(const std::vector<SpeakerEvent> &events,
                        const std::string &file_id = "audio");

} // namespace diarclip
