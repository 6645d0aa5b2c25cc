#include <gtest/gtest.h>

#include "diarclip/diarclip.hpp"

#include <chrono>
#include <cmath>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <thread>

using namespace diarclip;
namespace fs = std::filesystem;

// ─── Helpers ────────────────────────────────────────────────────────────────

// Scratch directory, removed with everything in it
struct TempDir {
    fs::path path;

    TempDir()
        : path(fs::temp_directory_path() / ("diarclip_test_" + make_uuid())) {
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path operator/(const std::string &name) const { return path / name; }
};

static size_t count_files(const fs::path &dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return 0;
    size_t n = 0;
    for (const auto &entry : fs::directory_iterator(dir, ec)) {
        (void)entry;
        ++n;
    }
    return n;
}

static void write_text(const fs::path &path, const std::string &text) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << text;
}

static std::vector<int16_t> make_pcm(size_t n) {
    std::vector<int16_t> pcm(n);
    for (size_t i = 0; i < n; ++i)
        pcm[i] = static_cast<int16_t>(static_cast<int>((i * 7) % 20000) - 10000);
    return pcm;
}

static std::vector<uint8_t> make_wav(double seconds, int sample_rate = 16000) {
    auto pcm = make_pcm(static_cast<size_t>(seconds * sample_rate));
    return encode_wav_pcm16(pcm.data(), pcm.size(), sample_rate);
}

static void put_u16(std::vector<uint8_t> &b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>(v >> 8));
}

static void put_u32(std::vector<uint8_t> &b, uint32_t v) {
    for (int i = 0; i < 4; ++i)
        b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

static void put_tag(std::vector<uint8_t> &b, const char *tag) {
    b.insert(b.end(), tag, tag + 4);
}

// Hand-framed WAV. With extensible set, the fmt chunk is the 40-byte
// WAVE_FORMAT_EXTENSIBLE layout carrying `format` in its SubFormat GUID.
static std::vector<uint8_t> build_wav(uint16_t format, uint16_t channels,
                                      uint32_t rate, uint16_t bits,
                                      const std::vector<uint8_t> &data,
                                      bool extensible = false) {
    uint16_t block_align = static_cast<uint16_t>(channels * bits / 8);
    uint32_t fmt_size = extensible ? 40 : 16;

    std::vector<uint8_t> b;
    put_tag(b, "RIFF");
    put_u32(b, static_cast<uint32_t>(4 + 8 + fmt_size + 8 + data.size()));
    put_tag(b, "WAVE");

    put_tag(b, "fmt ");
    put_u32(b, fmt_size);
    put_u16(b, extensible ? WAV_FORMAT_EXTENSIBLE : format);
    put_u16(b, channels);
    put_u32(b, rate);
    put_u32(b, rate * block_align);
    put_u16(b, block_align);
    put_u16(b, bits);
    if (extensible) {
        put_u16(b, 22);    // cbSize
        put_u16(b, bits);  // valid bits
        put_u32(b, 0x4);   // channel mask
        put_u16(b, format); // SubFormat GUID starts with the format code
        static const uint8_t guid_tail[14] = {0x00, 0x00, 0x00, 0x00, 0x10,
                                              0x00, 0x80, 0x00, 0x00, 0xAA,
                                              0x00, 0x38, 0x9B, 0x71};
        b.insert(b.end(), guid_tail, guid_tail + 14);
    }

    put_tag(b, "data");
    put_u32(b, static_cast<uint32_t>(data.size()));
    b.insert(b.end(), data.begin(), data.end());
    return b;
}

static std::vector<uint8_t> pcm_bytes(const std::vector<int16_t> &pcm) {
    std::vector<uint8_t> out(pcm.size() * 2);
    std::memcpy(out.data(), pcm.data(), out.size());
    return out;
}

static std::vector<uint8_t> to_bytes(const std::string &s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static bool has_ffmpeg() { return !find_executable("ffmpeg").empty(); }

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 1: Segment Merge
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SegmentMerge, InterleavedSpeakers) {
    std::vector<SpeakerEvent> events = {
        {"A", 0.0, 2.0}, {"A", 2.3, 4.0}, {"B", 2.1, 3.0}, {"A", 4.4, 6.0}};

    auto merged = merge_segments(events, {0.5, 0.0});

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0], (SpeakerSegment{"A", 0.0, 6.0}));
    EXPECT_EQ(merged[1], (SpeakerSegment{"B", 2.1, 3.0}));
}

TEST(SegmentMerge, EmptyInput) {
    EXPECT_TRUE(merge_segments({}).empty());
}

TEST(SegmentMerge, GapAtThresholdMerges) {
    auto merged = merge_segments({{"A", 0.0, 1.0}, {"A", 1.5, 2.0}}, {0.5, 0.0});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0], (SpeakerSegment{"A", 0.0, 2.0}));
}

TEST(SegmentMerge, GapAboveThresholdSplits) {
    auto merged = merge_segments({{"A", 0.0, 1.0}, {"A", 1.6, 2.0}}, {0.5, 0.0});
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_DOUBLE_EQ(merged[0].end, 1.0);
    EXPECT_DOUBLE_EQ(merged[1].start, 1.6);
}

TEST(SegmentMerge, ZeroGapStillJoinsTouchingTurns) {
    auto merged = merge_segments({{"A", 0.0, 1.0}, {"A", 1.0, 2.0}}, {0.0, 0.0});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_DOUBLE_EQ(merged[0].end, 2.0);
}

TEST(SegmentMerge, DifferentSpeakersNeverMerge) {
    auto merged = merge_segments({{"A", 0.0, 1.0}, {"B", 1.0, 2.0}}, {5.0, 0.0});
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].speaker, "A");
    EXPECT_EQ(merged[1].speaker, "B");
}

TEST(SegmentMerge, ContainedEventKeepsOuterEnd) {
    auto merged = merge_segments({{"A", 0.0, 3.0}, {"A", 1.0, 2.0}});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0], (SpeakerSegment{"A", 0.0, 3.0}));
}

TEST(SegmentMerge, UnsortedInputComesOutSorted) {
    auto merged = merge_segments(
        {{"B", 5.0, 6.0}, {"A", 0.0, 1.0}, {"C", 2.0, 3.0}, {"A", 8.0, 9.0}});
    ASSERT_EQ(merged.size(), 4u);
    for (size_t i = 1; i < merged.size(); ++i)
        EXPECT_LE(merged[i - 1].start, merged[i].start);
}

TEST(SegmentMerge, SameSpeakerSegmentsSeparatedByMoreThanGap) {
    std::vector<SpeakerEvent> events = {
        {"A", 0.0, 1.0}, {"B", 0.8, 2.0}, {"A", 1.4, 2.5}, {"A", 3.2, 4.0},
        {"B", 2.2, 2.9}, {"B", 4.0, 5.0}, {"A", 4.6, 5.5}};
    MergeConfig cfg{0.5, 0.0};
    auto merged = merge_segments(events, cfg);

    std::map<std::string, const SpeakerSegment *> last;
    for (const auto &s : merged) {
        auto it = last.find(s.speaker);
        if (it != last.end())
            EXPECT_GT(s.start - it->second->end, cfg.gap_threshold);
        last[s.speaker] = &s;
    }
}

TEST(SegmentMerge, Idempotent) {
    std::vector<SpeakerEvent> events = {
        {"A", 0.0, 1.0}, {"B", 0.5, 1.5}, {"A", 1.2, 2.0}, {"B", 2.6, 3.0},
        {"C", 2.6, 2.8}, {"A", 3.5, 4.0}, {"C", 3.0, 3.1}, {"B", 3.4, 3.6}};
    MergeConfig cfg{0.5, 0.15};

    auto once = merge_segments(events, cfg);
    auto twice = merge_segments(to_events(once), cfg);
    EXPECT_EQ(once, twice);
}

TEST(SegmentMerge, MinDurationDropsShortSegments) {
    auto merged = merge_segments(
        {{"A", 0.0, 0.2}, {"B", 1.0, 3.0}, {"A", 5.0, 5.1}}, {0.5, 0.5});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].speaker, "B");
}

TEST(SegmentMerge, MinDurationAppliesAfterMerging) {
    // Each turn is short, the merged run is not
    auto merged = merge_segments(
        {{"A", 0.0, 0.3}, {"A", 0.4, 0.7}, {"A", 0.8, 1.1}}, {0.5, 1.0});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_DOUBLE_EQ(merged[0].start, 0.0);
    EXPECT_DOUBLE_EQ(merged[0].end, 1.1);
}

TEST(SegmentMerge, InputIsNotModified) {
    std::vector<SpeakerEvent> events = {{"A", 2.0, 3.0}, {"A", 0.0, 2.1}};
    auto copy = events;
    merge_segments(events);
    ASSERT_EQ(events.size(), copy.size());
    for (size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].speaker, copy[i].speaker);
        EXPECT_EQ(events[i].start, copy[i].start);
        EXPECT_EQ(events[i].end, copy[i].end);
    }
}

TEST(SegmentMerge, NegativeConfigThrows) {
    EXPECT_THROW(merge_segments({{"A", 0, 1}}, {-0.1, 0.0}),
                 std::invalid_argument);
    EXPECT_THROW(merge_segments({{"A", 0, 1}}, {0.5, -1.0}),
                 std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 2: WAV Framing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Wav, EncodedClipIsCanonical) {
    auto wav = make_wav(1.0);
    ASSERT_TRUE(is_wav(wav.data(), wav.size()));

    auto header = parse_wav_header(wav.data(), wav.size());
    EXPECT_EQ(header.audio_format, WAV_FORMAT_PCM);
    EXPECT_EQ(header.num_channels, 1);
    EXPECT_EQ(header.sample_rate, 16000u);
    EXPECT_EQ(header.bits_per_sample, 16);
    EXPECT_EQ(header.data_size, 32000u);
    EXPECT_TRUE(is_canonical(header));
}

TEST(Wav, ReadsSamplesBack) {
    auto pcm = make_pcm(4000);
    auto wav = encode_wav_pcm16(pcm.data(), pcm.size(), 16000);
    auto decoded = read_wav_pcm16(wav);
    EXPECT_EQ(decoded.sample_rate, 16000);
    EXPECT_EQ(decoded.samples, pcm);
    EXPECT_DOUBLE_EQ(decoded.duration(), 0.25);
}

TEST(Wav, RejectsNonWav) {
    auto bytes = to_bytes("definitely not a riff file");
    EXPECT_FALSE(is_wav(bytes.data(), bytes.size()));
    EXPECT_THROW(parse_wav_header(bytes.data(), bytes.size()),
                 std::runtime_error);
}

TEST(Wav, MissingDataChunkThrows) {
    auto wav = build_wav(WAV_FORMAT_PCM, 1, 16000, 16, {});
    wav.resize(wav.size() - 8); // drop the data chunk header
    EXPECT_THROW(parse_wav_header(wav.data(), wav.size()), std::runtime_error);
}

TEST(Wav, OversizedDataLengthIsClamped) {
    auto wav = make_wav(1.0);
    auto header = parse_wav_header(wav.data(), wav.size());
    // Streamed writers leave 0xFFFFFFFF in the data size
    std::memset(wav.data() + header.data_offset - 4, 0xFF, 4);

    auto clamped = parse_wav_header(wav.data(), wav.size());
    EXPECT_EQ(clamped.data_size, 32000u);
    EXPECT_EQ(read_wav_pcm16(wav).samples.size(), 16000u);
}

TEST(Wav, ExtensibleResolvesSubFormat) {
    auto data = pcm_bytes(make_pcm(160));
    auto wav = build_wav(WAV_FORMAT_PCM, 1, 16000, 16, data, true);

    auto header = parse_wav_header(wav.data(), wav.size());
    EXPECT_EQ(header.audio_format, WAV_FORMAT_PCM);
    EXPECT_TRUE(is_canonical(header));
    EXPECT_EQ(read_wav_pcm16(wav).samples.size(), 160u);
}

TEST(Wav, FloatIsNotCanonical) {
    std::vector<uint8_t> data(16000 * 4, 0);
    auto wav = build_wav(WAV_FORMAT_IEEE_FLOAT, 1, 16000, 32, data);
    auto header = parse_wav_header(wav.data(), wav.size());
    EXPECT_FALSE(is_canonical(header));
    EXPECT_THROW(read_wav_pcm16(wav), std::runtime_error);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 3: Format Normalizer
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FormatNormalizer, CanonicalValidates) {
    FormatNormalizer normalizer(std::make_unique<NativeTranscoder>());
    EXPECT_TRUE(normalizer.validate(make_wav(0.5)));
}

TEST(FormatNormalizer, OtherRateIsReadableButNotCanonical) {
    FormatNormalizer normalizer(std::make_unique<NativeTranscoder>());
    EXPECT_FALSE(normalizer.validate(make_wav(0.5, 44100)));
}

TEST(FormatNormalizer, GarbageIsInvalidFormat) {
    FormatNormalizer normalizer(std::make_unique<NativeTranscoder>());
    EXPECT_THROW(normalizer.validate(to_bytes("hello, world! not audio")),
                 InvalidFormatError);
    EXPECT_THROW(normalizer.normalize(to_bytes("hello, world! not audio")),
                 InvalidFormatError);
    EXPECT_THROW(normalizer.validate({}), InvalidFormatError);
}

TEST(FormatNormalizer, TruncatedWavIsInvalidFormat) {
    auto wav = make_wav(0.1);
    wav.resize(20);
    FormatNormalizer normalizer(std::make_unique<NativeTranscoder>());
    EXPECT_THROW(normalizer.validate(wav), InvalidFormatError);
}

TEST(FormatNormalizer, CanonicalPassesThroughUnchanged) {
    auto wav = make_wav(0.5);
    FormatNormalizer normalizer(std::make_unique<NativeTranscoder>());
    EXPECT_EQ(normalizer.normalize(wav), wav);
}

TEST(FormatNormalizer, NativeResamplesToCanonical) {
    FormatNormalizer normalizer(std::make_unique<NativeTranscoder>());
    auto out = normalizer.normalize(make_wav(1.0, 44100));

    EXPECT_TRUE(normalizer.validate(out));
    auto pcm = read_wav_pcm16(out);
    EXPECT_EQ(pcm.sample_rate, 16000);
    EXPECT_NEAR(static_cast<double>(pcm.samples.size()), 16000.0, 32.0);
}

TEST(FormatNormalizer, NativeDownmixesStereo) {
    std::vector<int16_t> stereo(2 * 11025);
    for (size_t i = 0; i < stereo.size(); ++i)
        stereo[i] = static_cast<int16_t>(i % 2 ? 1000 : -1000);
    auto wav = build_wav(WAV_FORMAT_PCM, 2, 22050, 16, pcm_bytes(stereo));

    FormatNormalizer normalizer(std::make_unique<NativeTranscoder>());
    EXPECT_FALSE(normalizer.validate(wav));

    auto out = normalizer.normalize(wav);
    EXPECT_TRUE(normalizer.validate(out));
    EXPECT_NEAR(static_cast<double>(read_wav_pcm16(out).samples.size()), 8000.0,
                32.0);
}

TEST(FormatNormalizer, NormalizeIsIdempotent) {
    FormatNormalizer normalizer(std::make_unique<NativeTranscoder>());
    auto once = normalizer.normalize(make_wav(0.5, 8000));
    auto twice = normalizer.normalize(once);
    EXPECT_EQ(once, twice);
}

TEST(FormatNormalizer, MissingTranscoderIsProcessingError) {
    FormatNormalizer normalizer(
        std::make_unique<FfmpegTranscoder>("/nonexistent/diarclip/ffmpeg"));
    EXPECT_THROW(normalizer.normalize(make_wav(0.2, 44100)), ProcessingError);
}

TEST(FormatNormalizer, FailingTranscoderIsProcessingError) {
    if (!fs::exists("/bin/false"))
        GTEST_SKIP() << "/bin/false not found";
    FormatNormalizer normalizer(std::make_unique<FfmpegTranscoder>("/bin/false"));
    EXPECT_THROW(normalizer.normalize(make_wav(0.2, 44100)), ProcessingError);
}

TEST(FormatNormalizer, FfmpegCommandTargetsCanonicalLayout) {
    FfmpegTranscoder ffmpeg("ffmpeg");
    auto cmd = ffmpeg.command_for({});
    auto has_pair = [&](const std::string &flag, const std::string &value) {
        for (size_t i = 0; i + 1 < cmd.size(); ++i)
            if (cmd[i] == flag && cmd[i + 1] == value)
                return true;
        return false;
    };
    EXPECT_EQ(cmd.front(), "ffmpeg");
    EXPECT_TRUE(has_pair("-ar", "16000"));
    EXPECT_TRUE(has_pair("-ac", "1"));
    EXPECT_TRUE(has_pair("-acodec", "pcm_s16le"));
    EXPECT_TRUE(has_pair("-i", "pipe:0"));
}

TEST(FormatNormalizer, FfmpegConvertsToCanonical) {
    if (!has_ffmpeg())
        GTEST_SKIP() << "ffmpeg not found";
    FormatNormalizer normalizer(std::make_unique<FfmpegTranscoder>());
    auto out = normalizer.normalize(make_wav(1.0, 44100));
    EXPECT_TRUE(normalizer.validate(out));
    EXPECT_NEAR(static_cast<double>(read_wav_pcm16(out).samples.size()),
                16000.0, 32.0);
}

TEST(AudioProbe, DetectsContainersByMagic) {
    auto wav = make_wav(0.1);
    EXPECT_EQ(detect_format_by_magic(wav.data(), wav.size()), AudioFormat::WAV);

    auto flac = to_bytes("fLaC....");
    EXPECT_EQ(detect_format_by_magic(flac.data(), flac.size()),
              AudioFormat::FLAC);
    auto ogg = to_bytes("OggS....");
    EXPECT_EQ(detect_format_by_magic(ogg.data(), ogg.size()), AudioFormat::OGG);
    auto id3 = to_bytes("ID3.....");
    EXPECT_EQ(detect_format_by_magic(id3.data(), id3.size()), AudioFormat::MP3);
    auto junk = to_bytes("junk");
    EXPECT_EQ(detect_format_by_magic(junk.data(), junk.size()),
              AudioFormat::Unknown);
}

TEST(AudioProbe, ReportsWavLayout) {
    auto wav = make_wav(0.5, 22050);
    auto info = probe_audio(wav.data(), wav.size());
    EXPECT_EQ(info.format, AudioFormat::WAV);
    EXPECT_EQ(info.sample_rate, 22050);
    EXPECT_EQ(info.num_channels, 1);
    EXPECT_EQ(info.num_frames, 11025u);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 4: Clip Extraction
// ═══════════════════════════════════════════════════════════════════════════════

class FlakyClipStore : public ClipStore {
  public:
    FlakyClipStore(fs::path dir, int fail_at)
        : inner_(std::move(dir)), fail_at_(fail_at) {}

    std::string store(const std::string &name,
                      const std::vector<uint8_t> &bytes) override {
        if (++calls_ == fail_at_)
            throw std::runtime_error("disk full");
        return inner_.store(name, bytes);
    }
    void remove(const std::string &name) override {
        ++removed_;
        inner_.remove(name);
    }

    int removed() const { return removed_; }

  private:
    FileClipStore inner_;
    int fail_at_;
    int calls_ = 0;
    int removed_ = 0;
};

TEST(ClipExtractor, SampleExactSlice) {
    auto pcm = make_pcm(48000);
    auto wav = encode_wav_pcm16(pcm.data(), pcm.size(), 16000);
    ClipExtractor extractor(ClipDelivery::Inline);

    auto clips = extractor.extract(wav, {{"A", 1.0, 2.0}});
    ASSERT_EQ(clips.count("A"), 1u);
    const auto &clip = clips["A"][0];
    EXPECT_EQ(clip.start_sample, 16000);
    EXPECT_EQ(clip.end_sample, 32000);

    auto decoded = read_wav_pcm16(clip.audio);
    ASSERT_EQ(decoded.samples.size(), 16000u);
    EXPECT_TRUE(std::equal(decoded.samples.begin(), decoded.samples.end(),
                           pcm.begin() + 16000));
}

TEST(ClipExtractor, GroupsBySpeakerInTimeOrder) {
    ClipExtractor extractor(ClipDelivery::Inline);
    auto clips = extractor.extract(
        make_wav(3.0),
        {{"A", 1.5, 2.0}, {"B", 0.6, 1.0}, {"A", 0.0, 0.5}, {"B", 2.2, 2.9}});

    ASSERT_EQ(clips.size(), 2u);
    ASSERT_EQ(clips["A"].size(), 2u);
    ASSERT_EQ(clips["B"].size(), 2u);
    EXPECT_DOUBLE_EQ(clips["A"][0].start, 0.0);
    EXPECT_DOUBLE_EQ(clips["A"][1].start, 1.5);
    EXPECT_DOUBLE_EQ(clips["B"][0].start, 0.6);
    EXPECT_EQ(clip_count(clips), 4u);
}

TEST(ClipExtractor, IdsAreUnique) {
    ClipExtractor extractor(ClipDelivery::Inline);
    auto clips = extractor.extract(
        make_wav(2.0), {{"A", 0.0, 0.5}, {"A", 1.0, 1.2}, {"B", 0.5, 0.9}});
    std::set<std::string> ids;
    for (const auto &[speaker, list] : clips)
        for (const auto &c : list)
            ids.insert(c.id);
    EXPECT_EQ(ids.size(), 3u);
}

TEST(ClipExtractor, EndPastAudioIsClamped) {
    ClipExtractor extractor(ClipDelivery::Inline);
    auto clips = extractor.extract(make_wav(3.0), {{"A", 2.5, 10.0}});
    EXPECT_EQ(clips["A"][0].end_sample, 48000);
    EXPECT_EQ(read_wav_pcm16(clips["A"][0].audio).samples.size(), 8000u);
}

TEST(ClipExtractor, StartPastAudioYieldsEmptyClip) {
    ClipExtractor extractor(ClipDelivery::Inline);
    auto clips = extractor.extract(make_wav(3.0), {{"A", 5.0, 6.0}});
    ASSERT_EQ(clips["A"].size(), 1u);
    const auto &clip = clips["A"][0];
    EXPECT_EQ(clip.start_sample, 48000);
    EXPECT_EQ(clip.end_sample, 48000);
    EXPECT_EQ(clip.num_samples(), 0);
    EXPECT_TRUE(read_wav_pcm16(clip.audio).samples.empty());
}

TEST(ClipExtractor, FinalTurnAtRecordingEndIsClamped) {
    PcmBuffer pcm;
    pcm.samples = make_pcm(160000); // 10 s
    auto segments = merge_segments(
        {{"A", 0.0, 4.0}, {"B", 4.5, 9.99}, {"A", 10.0, 10.02}}, {0.5, 0.0});

    ClipExtractor extractor(ClipDelivery::Inline);
    auto clips = extractor.extract(pcm, segments);

    ASSERT_EQ(clip_count(clips), 3u);
    ASSERT_EQ(clips["A"].size(), 2u);
    EXPECT_EQ(clips["B"][0].end_sample, 159840);
    EXPECT_EQ(clips["A"][1].start_sample, 160000);
    EXPECT_EQ(clips["A"][1].num_samples(), 0);
}

TEST(ClipExtractor, UndecodableSourceThrows) {
    ClipExtractor extractor(ClipDelivery::Inline);
    EXPECT_THROW(extractor.extract(to_bytes("nope"), {{"A", 0.0, 1.0}}),
                 ProcessingError);
}

TEST(ClipExtractor, SourceBufferUntouched) {
    PcmBuffer pcm;
    pcm.samples = make_pcm(16000);
    auto copy = pcm.samples;
    ClipExtractor extractor(ClipDelivery::Inline);
    extractor.extract(pcm, {{"A", 0.1, 0.4}, {"B", 0.3, 0.9}});
    EXPECT_EQ(pcm.samples, copy);
}

TEST(ClipExtractor, InlineJsonCarriesBase64) {
    ClipExtractor extractor(ClipDelivery::Inline);
    auto clips = extractor.extract(make_wav(1.0), {{"A", 0.0, 0.5}});
    const auto &clip = clips["A"][0];
    EXPECT_TRUE(clip.is_inline());

    auto j = clip_to_json(clip);
    ASSERT_TRUE(j.contains("audio_base64"));
    EXPECT_FALSE(j.contains("audio_url"));
    EXPECT_EQ(base64_decode(j["audio_base64"].get<std::string>()), clip.audio);

    auto summary = clip_to_json(clip, false);
    EXPECT_FALSE(summary.contains("audio_base64"));
    EXPECT_EQ(summary["audio_size_bytes"].get<size_t>(), clip.audio.size());
}

TEST(ClipExtractor, PersistedClipsResolveToStoredFiles) {
    TempDir tmp;
    auto store = std::make_shared<FileClipStore>(tmp / "clips",
                                                 "http://localhost:7000/audio");
    ClipExtractor extractor(ClipDelivery::Persisted, store);

    auto clips = extractor.extract(make_wav(2.0), {{"A", 0.0, 1.0}});
    const auto &clip = clips["A"][0];
    EXPECT_FALSE(clip.is_inline());
    EXPECT_TRUE(clip.audio.empty());
    EXPECT_EQ(clip.audio_url,
              "http://localhost:7000/audio/" + clip.id + ".wav");

    auto bytes = store->load(clip.id + ".wav");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(read_wav_pcm16(*bytes).samples.size(), 16000u);

    auto j = clip_to_json(clip);
    EXPECT_EQ(j["audio_url"].get<std::string>(), clip.audio_url);
    EXPECT_FALSE(j.contains("audio_base64"));
}

TEST(ClipExtractor, FailedStoreRollsBack) {
    TempDir tmp;
    auto store = std::make_shared<FlakyClipStore>(tmp / "clips", 3);
    ClipExtractor extractor(ClipDelivery::Persisted, store);

    EXPECT_THROW(extractor.extract(make_wav(3.0), {{"A", 0.0, 0.5},
                                                   {"B", 1.0, 1.5},
                                                   {"C", 2.0, 2.5}}),
                 ProcessingError);
    EXPECT_EQ(store->removed(), 3); // two stored clips plus the failed one
    EXPECT_EQ(count_files(tmp / "clips"), 0u);
}

TEST(ClipStore, ShortWriteLeavesNoFile) {
    if (!fs::exists("/dev/full"))
        GTEST_SKIP() << "/dev/full not found";
    TempDir tmp;
    // Every write through this name hits ENOSPC
    fs::create_symlink("/dev/full", tmp / "clip.wav");

    FileClipStore store(tmp.path);
    EXPECT_THROW(store.store("clip.wav", make_wav(0.5)), std::runtime_error);
    EXPECT_EQ(count_files(tmp.path), 0u);
}

TEST(ClipExtractor, PersistedRequiresStore) {
    EXPECT_THROW({ ClipExtractor extractor(ClipDelivery::Persisted); },
                 std::invalid_argument);
}

TEST(ClipStore, RejectsPathNames) {
    TempDir tmp;
    FileClipStore store(tmp.path);
    std::vector<uint8_t> bytes = {1, 2, 3};
    EXPECT_THROW(store.store("../escape.wav", bytes), std::invalid_argument);
    EXPECT_THROW(store.store("a/b.wav", bytes), std::invalid_argument);
    EXPECT_THROW(store.load(".."), std::invalid_argument);
    EXPECT_FALSE(store.load("absent.wav").has_value());
    EXPECT_EQ(store.store("ok.wav", bytes), (tmp.path / "ok.wav").string());
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 5: Telemetry
// ═══════════════════════════════════════════════════════════════════════════════

class ThrowingProbe : public AcceleratorProbe {
  public:
    std::optional<AcceleratorMetrics> read() override {
        throw std::runtime_error("driver went away");
    }
};

static TelemetryConfig fake_host_config(const TempDir &tmp) {
    write_text(tmp / "proc/stat",
               "cpu  100 0 50 800 50 0 0 0 0 0\ncpu0 100 0 50 800 50 0 0 0\n");
    write_text(tmp / "proc/meminfo", "MemTotal:        1000 kB\n"
                                     "MemFree:          100 kB\n"
                                     "MemAvailable:     250 kB\n");
    TelemetryConfig cfg;
    cfg.proc_root = (tmp / "proc").string();
    cfg.disk_path = tmp.path.string();
    cfg.cpu_window_ms = 0;
    cfg.probe_accelerator = false;
    return cfg;
}

TEST(Telemetry, ReadsHostMetricsWithoutAccelerator) {
    TempDir tmp;
    TelemetryCollector collector(fake_host_config(tmp));
    auto s = collector.snapshot();

    EXPECT_DOUBLE_EQ(s.ram_usage_percent, 75.0);
    EXPECT_DOUBLE_EQ(s.cpu_usage_percent, 0.0); // unchanged counters
    EXPECT_GE(s.disk_usage_percent, 0.0);
    EXPECT_LE(s.disk_usage_percent, 100.0);
    EXPECT_FALSE(s.accelerator.has_value());

    auto j = to_json(s);
    EXPECT_TRUE(j.contains("cpu_usage_percent"));
    EXPECT_TRUE(j.contains("ram_usage_percent"));
    EXPECT_TRUE(j.contains("disk_usage_percent"));
    EXPECT_FALSE(j.contains("gpu_metrics"));
}

TEST(Telemetry, UnreadableHostNeverThrows) {
    TelemetryConfig cfg;
    cfg.proc_root = "/nonexistent/diarclip/proc";
    cfg.disk_path = "/nonexistent/diarclip/disk";
    cfg.cpu_window_ms = 0;
    cfg.probe_accelerator = false;
    TelemetryCollector collector(cfg);

    MetricsSnapshot s;
    EXPECT_NO_THROW(s = collector.snapshot());
    EXPECT_DOUBLE_EQ(s.cpu_usage_percent, 0.0);
    EXPECT_DOUBLE_EQ(s.ram_usage_percent, 0.0);
    EXPECT_DOUBLE_EQ(s.disk_usage_percent, 0.0);
}

TEST(Telemetry, FailingProbeOmitsAccelerator) {
    TempDir tmp;
    auto cfg = fake_host_config(tmp);
    cfg.probe_accelerator = true;
    TelemetryCollector collector(cfg, std::make_unique<ThrowingProbe>());

    MetricsSnapshot s;
    EXPECT_NO_THROW(s = collector.snapshot());
    EXPECT_FALSE(s.accelerator.has_value());
    EXPECT_DOUBLE_EQ(s.ram_usage_percent, 75.0);
}

TEST(Telemetry, DrmProbeReadsSysfsCounters) {
    TempDir tmp;
    write_text(tmp / "drm/card0/device/gpu_busy_percent", "37\n");
    write_text(tmp / "drm/card0/device/mem_info_vram_used", "536870912\n");
    write_text(tmp / "drm/card0/device/mem_info_vram_total", "2147483648\n");
    write_text(tmp / "drm/card0-DP-1/status", "connected\n");

    DrmAcceleratorProbe probe((tmp / "drm").string(), false);
    auto m = probe.read();
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->backend, "drm");
    EXPECT_DOUBLE_EQ(*m->utilization_percent, 37.0);
    EXPECT_DOUBLE_EQ(*m->memory_used_mb, 512.0);
    EXPECT_DOUBLE_EQ(*m->memory_total_mb, 2048.0);

    MetricsSnapshot s;
    s.accelerator = m;
    auto j = to_json(s);
    EXPECT_EQ(j["gpu_metrics"]["gpu_usage_percent"].get<double>(), 37.0);
}

TEST(Telemetry, DrmProbeWithoutCardsReportsNothing) {
    TempDir tmp;
    fs::create_directories(tmp / "drm");
    DrmAcceleratorProbe probe((tmp / "drm").string(), false);
    EXPECT_FALSE(probe.read().has_value());
}

TEST(Telemetry, SamplerCollectsUntilStopped) {
    TempDir tmp;
    auto cfg = fake_host_config(tmp);
    cfg.sample_interval_ms = 10;
    TelemetryCollector collector(cfg);

    TelemetrySampler sampler(collector);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    auto samples = sampler.stop();
    EXPECT_GE(samples.size(), 1u);
    EXPECT_TRUE(sampler.stop().empty());
}

TEST(Telemetry, SamplerStopsPromptly) {
    TempDir tmp;
    auto cfg = fake_host_config(tmp);
    cfg.sample_interval_ms = 60000;
    TelemetryCollector collector(cfg);

    auto t0 = std::chrono::steady_clock::now();
    std::vector<MetricsSnapshot> samples;
    {
        TelemetrySampler sampler(collector);
        samples = sampler.stop();
    }
    auto elapsed = std::chrono::steady_clock::now() - t0;
    EXPECT_EQ(samples.size(), 1u);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 6: Request Logs
// ═══════════════════════════════════════════════════════════════════════════════

TEST(RequestLog, DisabledWritesNothing) {
    TempDir tmp;
    RequestLogger logger({false, (tmp / "logs").string()});
    EXPECT_FALSE(logger.record({{"request_id", "abc"}}).has_value());
    logger.flush();
    EXPECT_FALSE(fs::exists(tmp / "logs"));
}

TEST(RequestLog, WritesAndReadsBack) {
    TempDir tmp;
    RequestLogger logger({true, (tmp / "logs").string()});
    auto path = logger.record({{"request_id", "abc"}, {"value", 42}});
    ASSERT_TRUE(path.has_value());
    logger.flush();

    auto name = path->filename().string();
    EXPECT_TRUE(name.starts_with("log_"));
    EXPECT_TRUE(name.ends_with("_abc.json"));
    EXPECT_TRUE(fs::exists(*path));

    auto names = list_request_logs(tmp / "logs");
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], name);

    auto record = read_request_log(tmp / "logs", name);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ((*record)["value"].get<int>(), 42);
}

TEST(RequestLog, UnsafeRequestIdIsReplacedWithWarning) {
    TempDir tmp;
    RequestLogger logger({true, (tmp / "logs").string()});

    testing::internal::CaptureStderr();
    auto path = logger.record({{"request_id", "../escape"}});
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->parent_path(), tmp / "logs");
    EXPECT_EQ(path->filename().string().find("escape"), std::string::npos);
    EXPECT_NE(err.find("WARN"), std::string::npos);
    EXPECT_NE(err.find("../escape"), std::string::npos);

    logger.flush();
    auto record = read_request_log(tmp / "logs", path->filename().string());
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ((*record)["request_id"].get<std::string>(), "../escape");
}

TEST(RequestLog, FileNameFormat) {
    auto name = log_filename(std::chrono::system_clock::now(), "req-1");
    EXPECT_TRUE(std::regex_match(
        name, std::regex(R"(log_\d{4}-\d{2}-\d{2}T\d{2}-\d{2}-\d{2}_req-1\.json)")));
}

TEST(RequestLog, ListingSkipsOtherFiles) {
    TempDir tmp;
    write_text(tmp / "logs/notes.txt", "x");
    write_text(tmp / "logs/log_b.json", "{}");
    write_text(tmp / "logs/log_a.json", "{}");
    write_text(tmp / "logs/log_c.json.tmp", "{");

    auto names = list_request_logs(tmp / "logs");
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "log_a.json");
    EXPECT_EQ(names[1], "log_b.json");
}

TEST(RequestLog, MissingDirectoryListsEmpty) {
    EXPECT_TRUE(list_request_logs("/nonexistent/diarclip/logs").empty());
}

TEST(RequestLog, ReadRejectsUnsafeNames) {
    TempDir tmp;
    EXPECT_THROW(read_request_log(tmp.path, "../secret.json"),
                 std::invalid_argument);
    EXPECT_THROW(read_request_log(tmp.path, ".."), std::invalid_argument);
    EXPECT_FALSE(read_request_log(tmp.path, "log_absent.json").has_value());
}

TEST(RequestLog, WriteFailureIsContained) {
    TempDir tmp;
    write_text(tmp / "blocker", "a file where a directory should be");
    RequestLogger logger({true, (tmp / "blocker/logs").string()});

    std::optional<fs::path> path;
    EXPECT_NO_THROW(path = logger.record({{"request_id", "abc"}}));
    EXPECT_TRUE(path.has_value());
    logger.flush();
    EXPECT_EQ(logger.failed_writes(), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 7: Diarization Engine
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Rttm, ParsesSpeakerRecords) {
    auto events = parse_rttm(
        "# produced by a diarizer\n"
        "SPEAKER meeting 1 0.50 1.25 <NA> <NA> spk_a <NA> <NA>\n"
        "\n"
        "SPKR-INFO meeting 1 <NA> <NA> <NA> unknown spk_a <NA> <NA>\n"
        "SPEAKER meeting 1 2.00 0.75 <NA> <NA> spk_b <NA> <NA>\r\n");

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].speaker, "spk_a");
    EXPECT_DOUBLE_EQ(events[0].start, 0.5);
    EXPECT_NEAR(events[0].end, 1.75, 1e-9);
    EXPECT_EQ(events[1].speaker, "spk_b");
    EXPECT_NEAR(events[1].end, 2.75, 1e-9);
}

TEST(Rttm, SkipsEmptyTurns) {
    auto events =
        parse_rttm("SPEAKER f 1 1.0 0.0 <NA> <NA> A <NA> <NA>\n"
                   "SPEAKER f 1 2.0 1.0 <NA> <NA> B <NA> <NA>\n");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].speaker, "B");
}

TEST(Rttm, MalformedLineThrows) {
    EXPECT_THROW(parse_rttm("SPEAKER f 1 abc 1.0 <NA> <NA> A\n"),
                 std::runtime_error);
    EXPECT_THROW(parse_rttm("SPEAKER f 1 0.0\n"), std::runtime_error);
}

TEST(Rttm, FormatParsesBack) {
    std::vector<SpeakerEvent> events = {{"A", 0.25, 1.5}, {"B", 2.0, 3.125}};
    auto parsed = parse_rttm(format_rttm(events));
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_NEAR(parsed[1].end, 3.125, 1e-3);
}

TEST(CommandDiarizer, ReadsRttmFromProcess) {
    CommandDiarizer engine({{"/bin/sh", "-c",
                             "cat > /dev/null; printf 'SPEAKER audio 1 0.00 "
                             "2.00 <NA> <NA> A <NA> <NA>\\n'"}});
    auto events = engine.diarize(make_wav(2.0));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].speaker, "A");
    EXPECT_DOUBLE_EQ(events[0].end, 2.0);
}

TEST(CommandDiarizer, NonZeroExitIsProcessingError) {
    CommandDiarizer engine(
        {{"/bin/sh", "-c", "cat > /dev/null; echo boom >&2; exit 3"}});
    try {
        engine.diarize(make_wav(0.5));
        FAIL() << "expected ProcessingError";
    } catch (const ProcessingError &e) {
        EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
    }
}

TEST(CommandDiarizer, MissingExecutableIsModelUnavailable) {
    EXPECT_THROW(CommandDiarizer({{"/nonexistent/diarclip/diarizer"}}),
                 ModelUnavailableError);
    EXPECT_THROW(CommandDiarizer(EngineConfig{}), ModelUnavailableError);
}

TEST(Subprocess, PipesLargeInputThrough) {
    std::vector<uint8_t> input(1 << 20);
    for (size_t i = 0; i < input.size(); ++i)
        input[i] = static_cast<uint8_t>(i * 31);
    auto result = run_process({"cat"}, input);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out, input);
}

TEST(Subprocess, ChildIgnoringStdinLeavesSignalsAlone) {
    std::vector<uint8_t> input(4 << 20, 0x55);
    auto result = run_process({"/bin/sh", "-c", "exec 0<&-; exit 0"}, input);
    EXPECT_EQ(result.exit_code, 0);

    struct sigaction current {};
    ASSERT_EQ(sigaction(SIGPIPE, nullptr, &current), 0);
    EXPECT_EQ(current.sa_handler, SIG_DFL);
}

TEST(Subprocess, ReportsExitCode) {
    auto result = run_process({"/bin/sh", "-c", "exit 7"}, {});
    EXPECT_EQ(result.exit_code, 7);
}

TEST(Subprocess, MissingExecutableThrows) {
    EXPECT_THROW(run_process({"/nonexistent/diarclip/tool"}, {}),
                 std::runtime_error);
    EXPECT_TRUE(find_executable("/nonexistent/diarclip/tool").empty());
    EXPECT_FALSE(find_executable("sh").empty());
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 8: Diarization Service
// ═══════════════════════════════════════════════════════════════════════════════

class FakeEngine : public DiarizationEngine {
  public:
    explicit FakeEngine(std::vector<SpeakerEvent> events)
        : events_(std::move(events)) {}

    std::vector<SpeakerEvent>
    diarize(const std::vector<uint8_t> &canonical_wav) override {
        ++calls;
        last_input_canonical = is_canonical(
            parse_wav_header(canonical_wav.data(), canonical_wav.size()));
        return events_;
    }
    std::string name() const override { return "fake"; }

    int calls = 0;
    bool last_input_canonical = false;

  private:
    std::vector<SpeakerEvent> events_;
};

template <typename E> class ThrowingEngine : public DiarizationEngine {
  public:
    explicit ThrowingEngine(std::string message) : message_(std::move(message)) {}
    std::vector<SpeakerEvent> diarize(const std::vector<uint8_t> &) override {
        throw E(message_);
    }
    std::string name() const override { return "throwing"; }

  private:
    std::string message_;
};

static std::vector<SpeakerEvent> conversation() {
    return {{"A", 0.0, 1.0}, {"B", 1.1, 1.8}, {"A", 1.2, 1.4}, {"A", 2.0, 2.9}};
}

static ServiceConfig service_config(const TempDir &tmp, bool logging) {
    ServiceConfig cfg;
    cfg.normalizer.transcoder = TranscoderKind::Native;
    cfg.clips.delivery = ClipDelivery::Persisted;
    cfg.clips.storage_dir = (tmp / "clips").string();
    cfg.clips.url_base = "";
    cfg.telemetry.cpu_window_ms = 0;
    cfg.telemetry.sample_interval_ms = 10;
    cfg.telemetry.probe_accelerator = false;
    cfg.logging.enabled = logging;
    cfg.logging.logs_dir = (tmp / "logs").string();
    return cfg;
}

static Upload upload_of(std::vector<uint8_t> bytes,
                        const std::string &name = "meeting.wav") {
    return Upload{name, "audio/wav", std::move(bytes)};
}

TEST(DiarizationService, InlineResponseWithoutLogging) {
    TempDir tmp;
    auto cfg = service_config(tmp, false);
    cfg.clips.delivery = ClipDelivery::Inline;
    DiarizationService service(cfg,
                               std::make_unique<FakeEngine>(conversation()));

    auto response = service.process(upload_of(make_wav(3.0)));

    EXPECT_EQ(response.request_id.size(), 36u);
    EXPECT_EQ(response.file_metadata.file_name, "meeting.wav");
    EXPECT_EQ(response.file_metadata.file_size_bytes, make_wav(3.0).size());
    ASSERT_EQ(response.segments.size(), 3u);
    EXPECT_EQ(response.segments[0], (SpeakerSegment{"A", 0.0, 1.4}));
    EXPECT_EQ(response.speakers["A"].size(), 2u);
    EXPECT_EQ(response.speakers["B"].size(), 1u);
    EXPECT_FALSE(response.system_metrics.has_value());
    EXPECT_FALSE(response.log_file.has_value());
    EXPECT_FALSE(fs::exists(tmp / "logs"));
    EXPECT_FALSE(fs::exists(tmp / "clips"));

    auto j = to_json(response);
    EXPECT_TRUE(j["speakers"]["A"][0].contains("audio_base64"));
    for (const char *key :
         {"audio_validation", "audio_conversion", "diarization_processing",
          "segment_merging", "clip_extraction"})
        EXPECT_TRUE(j["step_timings"].contains(key)) << key;
    EXPECT_FALSE(j.contains("system_metrics"));
}

TEST(DiarizationService, PersistedWithRequestLog) {
    TempDir tmp;
    DiarizationService service(service_config(tmp, true),
                               std::make_unique<FakeEngine>(conversation()));

    auto response = service.process(upload_of(make_wav(3.0)));
    service.flush_logs();

    ASSERT_TRUE(response.system_metrics.has_value());
    EXPECT_GE(response.system_metrics->during_processing.size(), 1u);
    ASSERT_TRUE(response.log_file.has_value());
    EXPECT_TRUE(fs::exists(*response.log_file));

    for (const auto &[speaker, clips] : response.speakers)
        for (const auto &clip : clips)
            EXPECT_TRUE(fs::exists(clip.audio_url)) << clip.audio_url;
    EXPECT_EQ(count_files(tmp / "clips"), 3u);

    auto names = list_request_logs(tmp / "logs");
    ASSERT_EQ(names.size(), 1u);
    auto record = read_request_log(tmp / "logs", names[0]);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ((*record)["status"].get<std::string>(), "success");
    EXPECT_EQ((*record)["request_id"].get<std::string>(), response.request_id);
    EXPECT_EQ((*record)["segments"].size(), 3u);
    EXPECT_TRUE((*record)["speakers"]["A"][0].contains("audio_url"));
    EXPECT_TRUE((*record)["system_metrics"].contains("before_processing"));
    EXPECT_TRUE((*record)["system_metrics"]["during_processing"].is_array());
    EXPECT_TRUE((*record)["system_metrics"].contains("after_processing"));
}

TEST(DiarizationService, InlineLogRecordOmitsAudioPayload) {
    TempDir tmp;
    auto cfg = service_config(tmp, true);
    cfg.clips.delivery = ClipDelivery::Inline;
    DiarizationService service(cfg,
                               std::make_unique<FakeEngine>(conversation()));

    service.process(upload_of(make_wav(3.0)));
    service.flush_logs();

    auto names = list_request_logs(tmp / "logs");
    ASSERT_EQ(names.size(), 1u);
    auto record = read_request_log(tmp / "logs", names[0]);
    const auto &clip = (*record)["speakers"]["A"][0];
    EXPECT_FALSE(clip.contains("audio_base64"));
    EXPECT_GT(clip["audio_size_bytes"].get<size_t>(), 44u);
}

TEST(DiarizationService, NonCanonicalUploadIsConverted) {
    TempDir tmp;
    auto engine = std::make_unique<FakeEngine>(conversation());
    auto *fake = engine.get();
    DiarizationService service(service_config(tmp, false), std::move(engine));

    auto response = service.process(upload_of(make_wav(3.0, 44100)));
    EXPECT_EQ(fake->calls, 1);
    EXPECT_TRUE(fake->last_input_canonical);
    EXPECT_EQ(clip_count(response.speakers), 3u);
}

TEST(DiarizationService, MalformedUploadLeavesNoTrace) {
    TempDir tmp;
    auto engine = std::make_unique<FakeEngine>(conversation());
    auto *fake = engine.get();
    DiarizationService service(service_config(tmp, true), std::move(engine));

    EXPECT_THROW(service.process(upload_of(to_bytes("not audio at all"))),
                 InvalidFormatError);
    service.flush_logs();
    EXPECT_EQ(fake->calls, 0);
    EXPECT_EQ(count_files(tmp / "clips"), 0u);
    EXPECT_EQ(count_files(tmp / "logs"), 0u);
}

TEST(DiarizationService, EngineFailureWritesFailureLog) {
    TempDir tmp;
    DiarizationService service(
        service_config(tmp, true),
        std::make_unique<ThrowingEngine<ProcessingError>>("engine crashed"));

    EXPECT_THROW(service.process(upload_of(make_wav(1.0))), ProcessingError);
    service.flush_logs();

    EXPECT_EQ(count_files(tmp / "clips"), 0u);
    auto names = list_request_logs(tmp / "logs");
    ASSERT_EQ(names.size(), 1u);
    auto record = read_request_log(tmp / "logs", names[0]);
    EXPECT_EQ((*record)["status"].get<std::string>(), "error");
    EXPECT_EQ((*record)["error"]["type"].get<std::string>(), "ProcessingError");
    EXPECT_EQ((*record)["error"]["stage"].get<std::string>(),
              "diarization_processing");
    EXPECT_TRUE((*record)["system_metrics"].contains("at_failure"));
}

TEST(DiarizationService, UnexpectedErrorIsGeneric) {
    TempDir tmp;
    DiarizationService service(
        service_config(tmp, true),
        std::make_unique<ThrowingEngine<std::logic_error>>("internal detail"));

    try {
        service.process(upload_of(make_wav(1.0)));
        FAIL() << "expected ProcessingError";
    } catch (const ProcessingError &e) {
        EXPECT_STREQ(e.what(), "Unexpected error occurred during processing.");
    }
    service.flush_logs();

    auto names = list_request_logs(tmp / "logs");
    ASSERT_EQ(names.size(), 1u);
    auto record = read_request_log(tmp / "logs", names[0]);
    EXPECT_EQ((*record)["error"]["message"].get<std::string>(),
              "internal detail");
}

TEST(DiarizationService, EngineEventPastAudioEndIsClamped) {
    TempDir tmp;
    DiarizationService service(
        service_config(tmp, false),
        std::make_unique<FakeEngine>(std::vector<SpeakerEvent>{
            {"A", 0.0, 0.5}, {"B", 0.8, 1.5}, {"C", 9.0, 10.0}}));

    auto response = service.process(upload_of(make_wav(1.0)));
    ASSERT_EQ(clip_count(response.speakers), 3u);
    EXPECT_EQ(response.speakers["B"][0].end_sample, 16000);
    EXPECT_EQ(response.speakers["C"][0].num_samples(), 0);
    EXPECT_EQ(count_files(tmp / "clips"), 3u);
}

TEST(DiarizationService, FailureWithoutLoggingWritesNoLog) {
    TempDir tmp;
    DiarizationService service(
        service_config(tmp, false),
        std::make_unique<ThrowingEngine<ProcessingError>>("engine crashed"));

    EXPECT_THROW(service.process(upload_of(make_wav(1.0))), ProcessingError);
    service.flush_logs();
    EXPECT_FALSE(fs::exists(tmp / "logs"));
    EXPECT_EQ(count_files(tmp / "clips"), 0u);
}

TEST(DiarizationService, NullEngineIsModelUnavailable) {
    TempDir tmp;
    EXPECT_THROW(DiarizationService(service_config(tmp, false), nullptr),
                 ModelUnavailableError);
}

TEST(DiarizationService, Health) {
    TempDir tmp;
    DiarizationService service(service_config(tmp, false),
                               std::make_unique<FakeEngine>(conversation()));
    auto h = service.health();
    EXPECT_EQ(h["status"].get<std::string>(), "ok");
    EXPECT_EQ(h["model"].get<std::string>(), "loaded");
    EXPECT_EQ(h["engine"].get<std::string>(), "fake");
}

// ═══════════════════════════════════════════════════════════════════════════════
//  Phase 9: Config and Encoding
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Config, Defaults) {
    auto cfg = make_default_config();
    EXPECT_DOUBLE_EQ(cfg.merge.gap_threshold, 0.5);
    EXPECT_EQ(cfg.clips.delivery, ClipDelivery::Persisted);
    EXPECT_EQ(cfg.clips.url_base, "http://localhost:7000/audio");
    EXPECT_TRUE(cfg.logging.enabled);
    EXPECT_EQ(cfg.logging.logs_dir, "logs");

    auto inl = make_inline_config();
    EXPECT_EQ(inl.clips.delivery, ClipDelivery::Inline);
    EXPECT_FALSE(inl.logging.enabled);
}

TEST(Config, LoadsJsonOverrides) {
    TempDir tmp;
    write_text(tmp / "config.json", R"({
        "merge": {"gap_threshold": 1.25},
        "clips": {"delivery": "inline"},
        "normalizer": {"transcoder": "native"},
        "logging": {"enabled": false},
        "engine": {"command": ["diarize", "--rttm"]},
        "unrelated": true
    })");

    auto cfg = load_config((tmp / "config.json").string());
    EXPECT_DOUBLE_EQ(cfg.merge.gap_threshold, 1.25);
    EXPECT_DOUBLE_EQ(cfg.merge.min_duration, 0.0);
    EXPECT_EQ(cfg.clips.delivery, ClipDelivery::Inline);
    EXPECT_EQ(cfg.normalizer.transcoder, TranscoderKind::Native);
    EXPECT_FALSE(cfg.logging.enabled);
    ASSERT_EQ(cfg.engine.command.size(), 2u);
    EXPECT_EQ(cfg.engine.command[1], "--rttm");
}

TEST(Config, RejectsBadValues) {
    TempDir tmp;
    write_text(tmp / "type.json", R"({"merge": {"gap_threshold": "wide"}})");
    write_text(tmp / "enum.json", R"({"clips": {"delivery": "carrier pigeon"}})");
    write_text(tmp / "range.json", R"({"merge": {"min_duration": -1}})");
    write_text(tmp / "syntax.json", "{ not json");

    for (const char *name : {"type.json", "enum.json", "range.json", "syntax.json"})
        EXPECT_THROW(load_config((tmp / name).string()), std::runtime_error)
            << name;
    EXPECT_THROW(load_config((tmp / "absent.json").string()),
                 std::runtime_error);
}

TEST(Encoding, Base64KnownVectors) {
    const std::pair<std::string, std::string> vectors[] = {
        {"", ""},         {"f", "Zg=="},     {"fo", "Zm8="},
        {"foo", "Zm9v"}, {"foob", "Zm9vYg=="}, {"foobar", "Zm9vYmFy"}};
    for (const auto &[plain, encoded] : vectors) {
        EXPECT_EQ(base64_encode(to_bytes(plain)), encoded);
        EXPECT_EQ(base64_decode(encoded), to_bytes(plain));
    }
}

TEST(Encoding, Base64RejectsInvalid) {
    EXPECT_THROW(base64_decode("abc"), std::invalid_argument);
    EXPECT_THROW(base64_decode("ab!d"), std::invalid_argument);
    EXPECT_THROW(base64_decode("a=bc"), std::invalid_argument);
}

TEST(Encoding, UuidV4) {
    auto a = make_uuid();
    auto b = make_uuid();
    EXPECT_NE(a, b);
    EXPECT_TRUE(std::regex_match(
        a, std::regex(
               "[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}")));
}
