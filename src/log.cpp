#include "diarclip/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace diarclip {

namespace {

std::atomic<bool> info_enabled{true};
std::mutex log_mutex;

void write_line(const char *level, const std::string &msg) {
    auto now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " - " << level << " - "
         << msg << '\n';

    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << line.str() << std::flush;
}

} // namespace

void log_info(const std::string &msg) {
    if (info_enabled.load())
        write_line("INFO", msg);
}

void log_warn(const std::string &msg) { write_line("WARN", msg); }

void log_error(const std::string &msg) { write_line("ERROR", msg); }

void set_info_logging(bool enabled) { info_enabled.store(enabled); }

} // namespace diarclip
