// docpdf/cpp/src/log.cpp
#include "docpdf/log.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace docpdf {

namespace {

std::atomic<int> g_level{(int)LogLevel::Info};
std::mutex g_out_mu;

const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

// values with spaces or quotes are quoted so a line stays one record
void append_value(std::ostringstream& oss, const std::string& v) {
    bool plain = !v.empty();
    for (char c : v) {
        if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\r' || c == '\t') {
            plain = false;
            break;
        }
    }
    if (plain) {
        oss << v;
        return;
    }
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:   oss << c;
        }
    }
    oss << '"';
}

} // namespace

LogLevel parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    throw std::invalid_argument("unknown log level: " + std::string(name));
}

void set_log_level(LogLevel lvl) {
    g_level.store((int)lvl, std::memory_order_relaxed);
}

std::string utc_now_iso() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void log_event(LogLevel lvl, std::string_view event, std::initializer_list<LogField> fields) {
    if ((int)lvl < g_level.load(std::memory_order_relaxed)) return;

    std::ostringstream oss;
    oss << utc_now_iso() << " [docpdf] " << level_name(lvl) << " " << event;
    for (const auto& f : fields) {
        oss << " " << f.first << "=";
        append_value(oss, f.second);
    }
    oss << "\n";

    std::lock_guard<std::mutex> lk(g_out_mu);
    std::cerr << oss.str();
    std::cerr.flush();
}

} // namespace docpdf
