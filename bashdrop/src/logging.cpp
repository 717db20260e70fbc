#include "logging.h"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace bashdrop {
namespace logging {

namespace {

constexpr size_t kMaxLogBytes = 2048;
constexpr const char* kDefaultLogPath = "bashdrop.logs";

std::mutex log_mutex;
Level min_level = Level::INFO;
bool configured = false;

std::ofstream& log_stream() {
    static std::ofstream stream;
    return stream;
}

/* Caller holds log_mutex. */
std::ofstream& open_stream() {
    auto& stream = log_stream();
    if (!configured) {
        stream.open(kDefaultLogPath, std::ios::app);
        configured = true;
    }
    return stream;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

std::string sanitize(const std::string& input) {
    std::string trimmed = input.substr(0, std::min(input.size(), kMaxLogBytes));
    std::string result;
    result.reserve(trimmed.size());
    for (unsigned char ch : trimmed) {
        if (ch == '\n' || ch == '\r' || ch == '\t') {
            result.push_back(' ');
        } else if (std::isprint(ch)) {
            result.push_back(static_cast<char>(ch));
        } else {
            result.push_back('?');
        }
    }
    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }
    return result;
}

void log_line(Level level, const char* label, const std::string& message) {
    std::string sanitized = sanitize(message);
    if (sanitized.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level) {
        return;
    }
    auto& stream = open_stream();
    if (!stream.is_open()) {
        return;
    }
    stream << timestamp() << " [" << label << "] " << sanitized << '\n';
    stream.flush();
}

}  // namespace

void configure(const std::string& path, Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    auto& stream = log_stream();
    if (stream.is_open()) {
        stream.close();
    }
    stream.clear();
    if (!path.empty()) {
        stream.open(path, std::ios::app);
    }
    min_level = level;
    configured = true;
}

void debug(const std::string& message) {
    log_line(Level::DEBUG, "DEBUG", message);
}

void info(const std::string& message) {
    log_line(Level::INFO, "INFO", message);
}

void warn(const std::string& message) {
    log_line(Level::WARN, "WARN", message);
}

void error(const std::string& message) {
    log_line(Level::ERROR, "ERROR", message);
}

}  // namespace logging
}  // namespace bashdrop
