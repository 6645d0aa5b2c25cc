#include "diarclip/request_log.hpp"

#include "diarclip/clip_store.hpp"
#include "diarclip/encoding.hpp"
#include "diarclip/log.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace diarclip {

namespace fs = std::filesystem;

std::string log_filename(std::chrono::system_clock::time_point when,
                         const std::string &request_id) {
    return "log_" + filename_timestamp(when) + "_" + request_id + ".json";
}

// ─── RequestLogger ───────────────────────────────────────────────────────────

RequestLogger::RequestLogger(RequestLogConfig config)
    : config_(std::move(config)), dir_(config_.logs_dir) {
    if (config_.enabled)
        writer_ = std::thread(&RequestLogger::run, this);
}

RequestLogger::~RequestLogger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_work_.notify_all();
    if (writer_.joinable())
        writer_.join();
}

std::optional<fs::path>
RequestLogger::record(const nlohmann::ordered_json &record) {
    if (!config_.enabled)
        return std::nullopt;

    std::string request_id;
    auto it = record.find("request_id");
    if (it != record.end() && it->is_string())
        request_id = it->get<std::string>();
    if (request_id.empty() || !is_safe_name(request_id)) {
        std::string substitute = make_uuid();
        log_warn("Request log record has " +
                 (request_id.empty() ? std::string("no usable request_id")
                                     : "unsafe request_id '" + request_id + "'") +
                 "; naming its log file by " + substitute);
        request_id = std::move(substitute);
    }

    Pending item;
    item.path = dir_ / log_filename(std::chrono::system_clock::now(), request_id);
    item.body = record.dump(4, ' ', false,
                            nlohmann::json::error_handler_t::replace);

    auto path = item.path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(item));
    }
    cv_work_.notify_one();
    return path;
}

void RequestLogger::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_idle_.wait(lock, [this] { return queue_.empty() && !writing_; });
}

size_t RequestLogger::failed_writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

void RequestLogger::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        cv_work_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        if (queue_.empty()) {
            // stopping and drained
            break;
        }

        Pending item = std::move(queue_.front());
        queue_.pop();
        writing_ = true;
        lock.unlock();

        bool ok = write(item);

        lock.lock();
        writing_ = false;
        if (!ok)
            ++failed_;
        if (queue_.empty())
            cv_idle_.notify_all();
    }
    cv_idle_.notify_all();
}

bool RequestLogger::write(const Pending &item) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        log_error("Failed to create log directory " + dir_.string() + ": " +
                  ec.message());
        return false;
    }

    // Write beside the target, then rename so readers never see half a file
    fs::path tmp = item.path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            log_error("Failed to open log file " + tmp.string());
            return false;
        }
        file << item.body << '\n';
        file.close();
        if (!file) {
            log_error("Failed to write log file " + tmp.string());
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, item.path, ec);
    if (ec) {
        log_error("Failed to save log file " + item.path.string() + ": " +
                  ec.message());
        fs::remove(tmp, ec);
        return false;
    }

    log_info("Log saved: " + item.path.string());
    return true;
}

// ─── Reading Logs Back ───────────────────────────────────────────────────────

std::vector<std::string> list_request_logs(const fs::path &dir) {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return names;

    for (const auto &entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec))
            continue;
        auto name = entry.path().filename().string();
        if (name.starts_with("log_") && name.ends_with(".json"))
            names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<nlohmann::ordered_json>
read_request_log(const fs::path &dir, const std::string &name) {
    if (!is_safe_name(name)) {
        throw std::invalid_argument("Invalid log file name: " + name);
    }

    std::ifstream file(dir / name);
    if (!file)
        return std::nullopt;

    try {
        return nlohmann::ordered_json::parse(file);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("Malformed log file " + name + ": " +
                                 e.what());
    }
}

} // namespace diarclip
