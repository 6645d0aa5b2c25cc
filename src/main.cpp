#include "diarclip/diarclip.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

static void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <audio> --engine \"<cmd ...>\" [options]\n"
        << "       " << prog << " --list-logs [--logs-dir DIR]\n"
        << "       " << prog << " --show-log NAME [--logs-dir DIR]\n"
        << "       " << prog << " --export-clip NAME OUT [--persist DIR]\n"
        << "       " << prog << " --health --engine \"<cmd ...>\"\n"
        << "\nOptions:\n"
        << "  --engine CMD        Diarizer command (WAV on stdin, RTTM on "
           "stdout)\n"
        << "  --config FILE       JSON config (flags override it)\n"
        << "  --gap S             Same-speaker merge gap (default: 0.5)\n"
        << "  --min-duration S    Drop merged segments shorter than S\n"
        << "  --inline            Return clips as base64 in the response\n"
        << "  --persist DIR       Store clips under DIR (default: "
           "saved_audio)\n"
        << "  --url-base URL      Clip URL prefix (\"\" for file paths)\n"
        << "  --native-transcoder Decode/resample in-process instead of "
           "ffmpeg\n"
        << "  --ffmpeg PATH       ffmpeg executable (default: ffmpeg)\n"
        << "  --content-type T    Declared content type of the upload\n"
        << "  --no-log            Disable request logs and telemetry\n"
        << "  --logs-dir DIR      Request log directory (default: logs)\n"
        << "  --pretty            Indent the JSON output\n"
        << "  --quiet             Only warnings and errors on stderr\n"
        << "\nEnvironment:\n"
        << "  DIARCLIP_LOGGING=false   same as --no-log\n"
        << "  DIARCLIP_USE_GPU=false   skip accelerator metrics\n"
        << std::endl;
}

static bool env_is_false(const char *name) {
    const char *v = std::getenv(name);
    if (!v)
        return false;
    std::string s(v);
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s == "false" || s == "0" || s == "no" || s == "off";
}

static std::vector<std::string> split_command(const std::string &cmd) {
    std::istringstream in(cmd);
    std::vector<std::string> argv;
    std::string word;
    while (in >> word)
        argv.push_back(word);
    return argv;
}

static std::string guess_content_type(const std::string &path) {
    auto dot = path.rfind('.');
    std::string ext = dot == std::string::npos ? "" : path.substr(dot + 1);
    for (auto &c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (ext == "wav")
        return "audio/wav";
    if (ext == "flac")
        return "audio/flac";
    if (ext == "mp3")
        return "audio/mpeg";
    if (ext == "ogg")
        return "audio/ogg";
    return "application/octet-stream";
}

static std::vector<uint8_t> read_file(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

static void print_json(const nlohmann::ordered_json &j, bool pretty) {
    std::cout << j.dump(pretty ? 4 : -1, ' ', false,
                        nlohmann::json::error_handler_t::replace)
              << std::endl;
}

int main(int argc, char *argv[]) {
    using namespace diarclip;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    enum class Command { Process, ListLogs, ShowLog, ExportClip, Health };
    Command command = Command::Process;

    std::string audio_path;
    std::string config_path;
    std::string engine_cmd;
    std::string log_name;
    std::string clip_name, clip_out;
    std::string content_type;
    bool pretty = false;

    // Flag values applied after the config file
    std::optional<double> gap, min_duration;
    std::optional<std::string> persist_dir, url_base, ffmpeg_path, logs_dir;
    bool inline_clips = false;
    bool native_transcoder = false;
    bool no_log = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--list-logs") {
                command = Command::ListLogs;
            } else if (arg == "--show-log" && i + 1 < argc) {
                command = Command::ShowLog;
                log_name = argv[++i];
            } else if (arg == "--export-clip" && i + 2 < argc) {
                command = Command::ExportClip;
                clip_name = argv[++i];
                clip_out = argv[++i];
            } else if (arg == "--health") {
                command = Command::Health;
            } else if (arg == "--engine" && i + 1 < argc) {
                engine_cmd = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--gap" && i + 1 < argc) {
                gap = std::stod(argv[++i]);
            } else if (arg == "--min-duration" && i + 1 < argc) {
                min_duration = std::stod(argv[++i]);
            } else if (arg == "--inline") {
                inline_clips = true;
            } else if (arg == "--persist" && i + 1 < argc) {
                persist_dir = argv[++i];
            } else if (arg == "--url-base" && i + 1 < argc) {
                url_base = argv[++i];
            } else if (arg == "--native-transcoder") {
                native_transcoder = true;
            } else if (arg == "--ffmpeg" && i + 1 < argc) {
                ffmpeg_path = argv[++i];
            } else if (arg == "--content-type" && i + 1 < argc) {
                content_type = argv[++i];
            } else if (arg == "--no-log") {
                no_log = true;
            } else if (arg == "--logs-dir" && i + 1 < argc) {
                logs_dir = argv[++i];
            } else if (arg == "--pretty") {
                pretty = true;
            } else if (arg == "--quiet") {
                set_info_logging(false);
            } else if (!arg.starts_with("--") && audio_path.empty()) {
                audio_path = arg;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

        // 1. Configuration: file, then environment, then flags
        ServiceConfig cfg =
            config_path.empty() ? make_default_config() : load_config(config_path);

        if (env_is_false("DIARCLIP_LOGGING"))
            cfg.logging.enabled = false;
        if (env_is_false("DIARCLIP_USE_GPU"))
            cfg.telemetry.probe_accelerator = false;

        if (gap)
            cfg.merge.gap_threshold = *gap;
        if (min_duration)
            cfg.merge.min_duration = *min_duration;
        if (inline_clips && persist_dir) {
            std::cerr << "Error: --inline and --persist are exclusive"
                      << std::endl;
            return 1;
        }
        if (inline_clips)
            cfg.clips.delivery = ClipDelivery::Inline;
        if (persist_dir) {
            cfg.clips.delivery = ClipDelivery::Persisted;
            cfg.clips.storage_dir = *persist_dir;
        }
        if (url_base)
            cfg.clips.url_base = *url_base;
        if (native_transcoder)
            cfg.normalizer.transcoder = TranscoderKind::Native;
        if (ffmpeg_path)
            cfg.normalizer.ffmpeg_path = *ffmpeg_path;
        if (no_log)
            cfg.logging.enabled = false;
        if (logs_dir)
            cfg.logging.logs_dir = *logs_dir;
        if (!engine_cmd.empty())
            cfg.engine.command = split_command(engine_cmd);

        // 2. Commands that need no engine
        if (command == Command::ListLogs) {
            nlohmann::ordered_json j;
            j["logs"] = list_request_logs(cfg.logging.logs_dir);
            print_json(j, pretty);
            return 0;
        }
        if (command == Command::ShowLog) {
            auto record = read_request_log(cfg.logging.logs_dir, log_name);
            if (!record) {
                std::cerr << "Error: Log file not found: " << log_name
                          << std::endl;
                return 1;
            }
            print_json(*record, pretty);
            return 0;
        }
        if (command == Command::ExportClip) {
            FileClipStore store(cfg.clips.storage_dir);
            auto bytes = store.load(clip_name);
            if (!bytes) {
                std::cerr << "Error: Audio file not found: " << clip_name
                          << std::endl;
                return 1;
            }
            std::ofstream out(clip_out, std::ios::binary);
            out.write(reinterpret_cast<const char *>(bytes->data()),
                      static_cast<std::streamsize>(bytes->size()));
            if (!out) {
                std::cerr << "Error: Cannot write " << clip_out << std::endl;
                return 1;
            }
            log_info("Exported " + clip_name + " to " + clip_out);
            return 0;
        }

        // 3. Engine and service
        auto engine = std::make_unique<CommandDiarizer>(cfg.engine);
        DiarizationService service(cfg, std::move(engine));

        if (command == Command::Health) {
            print_json(service.health(), pretty);
            return 0;
        }

        if (audio_path.empty()) {
            std::cerr << "Error: no audio file given" << std::endl;
            print_usage(argv[0]);
            return 1;
        }

        // 4. Process the upload
        Upload upload;
        upload.file_name =
            std::filesystem::path(audio_path).filename().string();
        upload.content_type =
            content_type.empty() ? guess_content_type(audio_path) : content_type;
        upload.bytes = read_file(audio_path);

        auto response = service.process(upload);
        service.flush_logs();
        print_json(to_json(response), pretty);

    } catch (const InvalidFormatError &e) {
        print_json({{"error", e.what()}}, pretty);
        return 2;
    } catch (const ModelUnavailableError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 3;
    } catch (const ProcessingError &e) {
        print_json({{"error", e.what()}}, pretty);
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
