// docpdf/cpp/include/docpdf/log.h
#pragma once
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace docpdf {

enum class LogLevel { Debug = 0, Info, Warn, Error };

using LogField = std::pair<std::string_view, std::string>;

// Throws std::invalid_argument for unknown names.
LogLevel parse_log_level(std::string_view name);
void set_log_level(LogLevel lvl);

// One line per event on stderr:
//   2026-01-01T00:00:00Z [docpdf] ERROR engine_failed request=... rc=1
void log_event(LogLevel lvl, std::string_view event, std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view event, std::initializer_list<LogField> fields = {}) {
    log_event(LogLevel::Debug, event, fields);
}
inline void log_info(std::string_view event, std::initializer_list<LogField> fields = {}) {
    log_event(LogLevel::Info, event, fields);
}
inline void log_warn(std::string_view event, std::initializer_list<LogField> fields = {}) {
    log_event(LogLevel::Warn, event, fields);
}
inline void log_error(std::string_view event, std::initializer_list<LogField> fields = {}) {
    log_event(LogLevel::Error, event, fields);
}

std::string utc_now_iso();

} // namespace docpdf
