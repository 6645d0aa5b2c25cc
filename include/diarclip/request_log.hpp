#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "diarclip/config.hpp"

namespace diarclip {

// ─── Request Logger ──────────────────────────────────────────────────────────

// "log_<YYYY-MM-DDTHH-MM-SS>_<request_id>.json"
std::string log_filename(std::chrono::system_clock::time_point when,
                         const std::string &request_id);

// Persists one JSON document per request under logs_dir. Writes run on a
// background thread; record() only names the file and queues it.
class RequestLogger {
  public:
    explicit RequestLogger(RequestLogConfig config = {});
    ~RequestLogger();

    RequestLogger(const RequestLogger &) = delete;
    RequestLogger &operator=(const RequestLogger &) = delete;

    /// Queue `record` (an object with a "request_id" string). Returns the
    /// path the file will land at, or nullopt when logging is disabled.
    /// Never throws for I/O; write failures go to the process log.
    std::optional<std::filesystem::path>
    record(const nlohmann::ordered_json &record);

    // Block until every queued record has been written (or has failed).
    void flush();

    bool enabled() const { return config_.enabled; }
    const std::filesystem::path &dir() const { return dir_; }

    // Number of records that could not be written.
    size_t failed_writes() const;

  private:
    struct Pending {
        std::filesystem::path path;
        std::string body;
    };

    RequestLogConfig config_;
    std::filesystem::path dir_;

    mutable std::mutex mutex_;
    std::condition_variable cv_work_;
    std::condition_variable cv_idle_;
    std::queue<Pending> queue_;
    bool writing_ = false;
    bool stopping_ = false;
    size_t failed_ = 0;
    std::thread writer_;

    void run();
    bool write(const Pending &item);
};

// ─── Reading Logs Back ───────────────────────────────────────────────────────

// Sorted file names matching log_*.json; empty if the directory is missing.
std::vector<std::string> list_request_logs(const std::filesystem::path &dir);

// Parsed record, or nullopt when the file does not exist. Throws
// std::invalid_argument for names that are not plain file names and
// std::runtime_error for unparseable content.
std::optional<nlohmann::ordered_json>
read_request_log(const std::filesystem::path &dir, const std::string &name);

} // namespace diarclip
