// docpdf/cpp/include/docpdf/config.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "docpdf/log.h"

namespace docpdf {

constexpr uint64_t MAX_BODY_BYTES = 10ull * 1024 * 1024; // 10 MiB

// Built once at startup, read-only afterwards.
struct Config {
    std::string host{"0.0.0.0"};
    int port{3000};
    std::filesystem::path work_root{"/tmp/convert"};
    std::optional<std::string> api_key;
    std::string engine_bin{"libreoffice"};
    int engine_timeout_sec{0}; // 0 = wait forever
    size_t worker_threads{0};  // 0 = httplib default
    uint64_t max_body_bytes{MAX_BODY_BYTES};
    LogLevel log_level{LogLevel::Info};
};

// Environment first, then argv: [work_root] [--host H] [--port N].
// Throws std::invalid_argument on malformed values.
Config load_config(int argc, char** argv);

} // namespace docpdf
