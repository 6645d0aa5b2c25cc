#include "diarclip/normalizer.hpp"

#include "diarclip/errors.hpp"
#include "diarclip/log.hpp"
#include "diarclip/subprocess.hpp"

#include <stdexcept>

namespace diarclip {

namespace {

std::string stderr_tail(const std::string &err, size_t max_len = 400) {
    if (err.size() <= max_len)
        return err;
    return "..." + err.substr(err.size() - max_len);
}

} // namespace

// ─── FfmpegTranscoder ────────────────────────────────────────────────────────

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg_path)
    : ffmpeg_path_(std::move(ffmpeg_path)) {}

std::vector<std::string>
FfmpegTranscoder::command_for(const TargetFormat &target) const {
    return {
        ffmpeg_path_, "-hide_banner", "-loglevel", "error", "-nostdin",
        "-i", "pipe:0",
        "-f", "wav",
        "-acodec", "pcm_s" + std::to_string(target.bits_per_sample) + "le",
        "-ar", std::to_string(target.sample_rate),
        "-ac", std::to_string(target.channels),
        "pipe:1",
    };
}

std::vector<uint8_t>
FfmpegTranscoder::transcode(const std::vector<uint8_t> &input,
                            const TargetFormat &target) {
    if (find_executable(ffmpeg_path_).empty()) {
        throw ProcessingError("Audio format conversion failed: transcoder '" +
                              ffmpeg_path_ + "' is not available");
    }

    ProcessResult result;
    try {
        result = run_process(command_for(target), input);
    } catch (const std::runtime_error &e) {
        throw ProcessingError(
            std::string("Audio format conversion failed: ") + e.what());
    }

    if (result.exit_code != 0) {
        throw ProcessingError("Audio format conversion failed: " +
                              ffmpeg_path_ + " exited with status " +
                              std::to_string(result.exit_code) + ": " +
                              stderr_tail(result.err));
    }
    if (result.out.empty()) {
        throw ProcessingError(
            "Audio format conversion failed: transcoder produced no output");
    }
    return std::move(result.out);
}

// ─── NativeTranscoder ────────────────────────────────────────────────────────

std::vector<uint8_t>
NativeTranscoder::transcode(const std::vector<uint8_t> &input,
                            const TargetFormat &target) {
    if (target.channels != 1 || target.bits_per_sample != 16) {
        throw ProcessingError(
            "Native transcoder only produces 16-bit mono PCM");
    }
    try {
        auto audio = read_audio(input.data(), input.size(), target.sample_rate);
        auto pcm = to_pcm16(audio.samples);
        return encode_wav_pcm16(pcm.data(), pcm.size(), target.sample_rate);
    } catch (const std::runtime_error &e) {
        throw ProcessingError(
            std::string("Audio format conversion failed: ") + e.what());
    }
}

std::unique_ptr<Transcoder> make_transcoder(const NormalizerConfig &config) {
    switch (config.transcoder) {
    case TranscoderKind::Native:
        return std::make_unique<NativeTranscoder>();
    case TranscoderKind::FFmpeg:
    default:
        return std::make_unique<FfmpegTranscoder>(config.ffmpeg_path);
    }
}

// ─── FormatNormalizer ────────────────────────────────────────────────────────

FormatNormalizer::FormatNormalizer(std::unique_ptr<Transcoder> transcoder,
                                   TargetFormat target)
    : transcoder_(std::move(transcoder)), target_(target) {
    if (!transcoder_) {
        throw std::invalid_argument("FormatNormalizer requires a transcoder");
    }
}

bool FormatNormalizer::matches_target(const WavHeader &header) const {
    return header.audio_format == WAV_FORMAT_PCM &&
           header.num_channels == target_.channels &&
           header.bits_per_sample == target_.bits_per_sample &&
           static_cast<int>(header.sample_rate) == target_.sample_rate;
}

AudioInfo FormatNormalizer::inspect(const std::vector<uint8_t> &bytes) const {
    try {
        return probe_audio(bytes.data(), bytes.size());
    } catch (const std::runtime_error &e) {
        throw InvalidFormatError(
            std::string("Unable to read the audio file: ") + e.what());
    }
}

bool FormatNormalizer::validate(const std::vector<uint8_t> &bytes) const {
    if (is_wav(bytes.data(), bytes.size())) {
        try {
            auto header = parse_wav_header(bytes.data(), bytes.size());
            if (matches_target(header))
                return true;
        } catch (const std::runtime_error &e) {
            throw InvalidFormatError(
                std::string("Unable to read the audio file: ") + e.what());
        }
    }

    // Not canonical. It still has to be readable audio, or the caller gets
    // a client error rather than a transcoding attempt.
    inspect(bytes);
    return false;
}

std::vector<uint8_t>
FormatNormalizer::normalize(const std::vector<uint8_t> &bytes) const {
    if (validate(bytes))
        return bytes;

    log_warn("Audio needs conversion; running " + transcoder_->name() +
             " transcoder");
    auto transcoded = transcoder_->transcode(bytes, target_);

    // Re-frame: streamed WAV output may carry placeholder chunk sizes
    PcmBuffer pcm;
    try {
        auto header = parse_wav_header(transcoded.data(), transcoded.size());
        if (!matches_target(header)) {
            throw ProcessingError(
                "Audio format conversion failed: transcoder output is format=" +
                std::to_string(header.audio_format) +
                " channels=" + std::to_string(header.num_channels) +
                " rate=" + std::to_string(header.sample_rate) +
                " bits=" + std::to_string(header.bits_per_sample));
        }
        pcm = read_wav_pcm16(transcoded);
    } catch (const ProcessingError &) {
        throw;
    } catch (const std::runtime_error &e) {
        throw ProcessingError(
            std::string("Audio format conversion failed: unreadable output: ") +
            e.what());
    }

    try {
        return encode_wav_pcm16(pcm.samples.data(), pcm.samples.size(),
                                pcm.sample_rate);
    } catch (const std::runtime_error &e) {
        throw ProcessingError(
            std::string("Audio format conversion failed: ") + e.what());
    }
}

} // namespace diarclip
