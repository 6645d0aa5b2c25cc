#include "diarclip/engine.hpp"

#include "diarclip/errors.hpp"
#include "diarclip/log.hpp"
#include "diarclip/subprocess.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace diarclip {

// ─── RTTM ────────────────────────────────────────────────────────────────────

std::vector<SpeakerEvent> parse_rttm(const std::string &text) {
    std::vector<SpeakerEvent> events;
    std::istringstream lines(text);
    std::string line;
    int line_no = 0;

    while (std::getline(lines, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        std::istringstream in(line);
        std::string type;
        if (!(in >> type) || type != "SPEAKER")
            continue;

        std::string file_id, channel, ortho, stype, label;
        double onset = 0.0, duration = 0.0;
        if (!(in >> file_id >> channel >> onset >> duration >> ortho >> stype >>
              label)) {
            throw std::runtime_error("Malformed RTTM line " +
                                     std::to_string(line_no) + ": " + line);
        }
        if (!std::isfinite(onset) || !std::isfinite(duration) || onset < 0.0) {
            throw std::runtime_error("Invalid RTTM times on line " +
                                     std::to_string(line_no) + ": " + line);
        }
        if (duration <= 0.0)
            continue;

        events.push_back({label, onset, onset + duration});
    }
    return events;
}

std::string format_rttm(const std::vector<SpeakerEvent> &events,
                        const std::string &file_id) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3);
    for (const auto &e : events) {
        out << "SPEAKER " << file_id << " 1 " << e.start << " "
            << (e.end - e.start) << " <NA> <NA> " << e.speaker
            << " <NA> <NA>\n";
    }
    return out.str();
}

// ─── CommandDiarizer ─────────────────────────────────────────────────────────

CommandDiarizer::CommandDiarizer(EngineConfig config)
    : config_(std::move(config)) {
    if (config_.command.empty() || config_.command[0].empty()) {
        throw ModelUnavailableError(
            "Failed to load speaker diarization model: no engine command "
            "configured");
    }
    executable_ = find_executable(config_.command[0]);
    if (executable_.empty()) {
        throw ModelUnavailableError(
            "Failed to load speaker diarization model: '" + config_.command[0] +
            "' not found");
    }
    log_info("Diarization engine ready: " + executable_);
}

std::string CommandDiarizer::name() const { return config_.command[0]; }

std::vector<SpeakerEvent>
CommandDiarizer::diarize(const std::vector<uint8_t> &canonical_wav) {
    auto argv = config_.command;
    argv[0] = executable_;

    ProcessResult result;
    try {
        result = run_process(argv, canonical_wav);
    } catch (const std::runtime_error &e) {
        throw ProcessingError(std::string("Diarization engine failed: ") +
                              e.what());
    }

    if (result.exit_code != 0) {
        std::string detail = result.err;
        if (detail.size() > 500)
            detail = detail.substr(detail.size() - 500);
        throw ProcessingError("Diarization engine exited with code " +
                              std::to_string(result.exit_code) +
                              (detail.empty() ? "" : ": " + detail));
    }

    try {
        std::string text(result.out.begin(), result.out.end());
        return parse_rttm(text);
    } catch (const std::runtime_error &e) {
        throw ProcessingError(std::string("Diarization engine output: ") +
                              e.what());
    }
}

} // namespace diarclip
