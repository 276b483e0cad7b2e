#include "yankring/log.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace yankring {

static std::mutex g_log_mutex;

static std::string iso_now() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm {};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

Logger::Logger(bool debug_enabled, std::ostream* out) : debug_(debug_enabled), out_(out) {}

void Logger::debug(std::string_view category, const std::string& message) const {
    if (!debug_) return;
    write(category, false, message);
}

void Logger::error(std::string_view category, const std::string& message) const {
    write(category, true, message);
}

void Logger::write(std::string_view category, bool is_error, const std::string& message) const {
    std::ostringstream line;
    line << "[yankring][" << iso_now() << "][" << category << "]";
    if (is_error) line << "[ERROR]";
    line << ' ' << message << '\n';
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& os = out_ ? *out_ : std::cerr;
    os << line.str();
    os.flush();
}

std::string preview(std::string_view text, size_t max_len) {
    std::string out;
    const size_t n = std::min(text.size(), max_len);
    out.reserve(n + 4);
    for (size_t i = 0; i < n; ++i) {
        char c = text[i];
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out += c; break;
        }
    }
    if (text.size() > max_len) out += "...";
    return out;
}

} // namespace yankring
