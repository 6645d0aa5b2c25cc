#include "diarclip/encoding.hpp"

#include <array>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <random>
#include <stdexcept>

namespace diarclip {

// ─── Base64 ─────────────────────────────────────────────────────────────────

static const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

std::string base64_encode(const uint8_t *data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) |
                     uint32_t(data[i + 2]);
        out.push_back(BASE64_CHARS[(n >> 18) & 0x3F]);
        out.push_back(BASE64_CHARS[(n >> 12) & 0x3F]);
        out.push_back(BASE64_CHARS[(n >> 6) & 0x3F]);
        out.push_back(BASE64_CHARS[n & 0x3F]);
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out.push_back(BASE64_CHARS[(n >> 18) & 0x3F]);
        out.push_back(BASE64_CHARS[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(BASE64_CHARS[(n >> 18) & 0x3F]);
        out.push_back(BASE64_CHARS[(n >> 12) & 0x3F]);
        out.push_back(BASE64_CHARS[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

static int base64_value(char c) {
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

std::vector<uint8_t> base64_decode(const std::string &text) {
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("base64: length is not a multiple of 4");
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        int pad = 0;
        uint32_t n = 0;
        for (size_t j = 0; j < 4; ++j) {
            char c = text[i + j];
            int v;
            if (c == '=' && i + 4 == text.size() && j >= 2) {
                v = 0;
                ++pad;
            } else {
                if (pad > 0)
                    throw std::invalid_argument("base64: data after padding");
                v = base64_value(c);
                if (v < 0)
                    throw std::invalid_argument("base64: invalid character");
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (pad < 2)
            out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (pad < 1)
            out.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return out;
}

// ─── Identifiers ────────────────────────────────────────────────────────────

std::string make_uuid() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    std::array<uint8_t, 16> b{};
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        uint64_t hi = rng();
        uint64_t lo = rng();
        for (int i = 0; i < 8; ++i) {
            b[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
            b[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
        }
    }
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40); // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80); // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-"
                  "%02x%02x%02x%02x%02x%02x",
                  b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9],
                  b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf);
}

std::string filename_timestamp(std::chrono::system_clock::time_point t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &tm);
    return std::string(buf);
}

} // namespace diarclip
