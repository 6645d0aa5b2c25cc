#pragma once

#include <stdexcept>
#include <string>

namespace diarclip {

// ─── Error Taxonomy ─────────────────────────────────────────────────────────

// Base for every error the pipeline raises on purpose. Anything else that
// escapes a stage is treated as unexpected by DiarizationService.
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &message) : std::runtime_error(message) {}
};

// Upload cannot be read as audio at all. Client error: the request is
// rejected before any transcoding, clip write or log write.
class InvalidFormatError : public Error {
  public:
    explicit InvalidFormatError(
        const std::string &message =
            "Unable to read the audio file. Expected: 16-bit PCM, 16kHz, mono.")
        : Error(message) {}
};

// Transcoding, diarization, merging or extraction failed. Server error; no
// partial results are returned.
class ProcessingError : public Error {
  public:
    explicit ProcessingError(
        const std::string &message = "Error processing the audio file.")
        : Error(message) {}
};

// The diarization engine could not be initialized. Fatal at startup.
class ModelUnavailableError : public Error {
  public:
    explicit ModelUnavailableError(
        const std::string &message =
            "Failed to load speaker diarization model.")
        : Error(message) {}
};

} // namespace diarclip
