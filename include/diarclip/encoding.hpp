#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace diarclip {

// ─── Base64 (RFC 4648, padded) ──────────────────────────────────────────────

std::string base64_encode(const uint8_t *data, size_t len);

inline std::string base64_encode(const std::vector<uint8_t> &bytes) {
    return base64_encode(bytes.data(), bytes.size());
}

// Throws std::invalid_argument on characters outside the alphabet or a
// length that is not a multiple of 4.
std::vector<uint8_t> base64_decode(const std::string &text);

// ─── Identifiers ────────────────────────────────────────────────────────────

// Random RFC 4122 version-4 UUID, lowercase hex with dashes.
std::string make_uuid();

// Local time as "YYYY-MM-DDTHH-MM-SS" (filename-safe, no colons).
std::string filename_timestamp(std::chrono::system_clock::time_point t);

} // namespace diarclip
