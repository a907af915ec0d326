// docpdf/cpp/src/config.cpp
#include "docpdf/config.h"

#include <cstdlib>
#include <stdexcept>

namespace docpdf {

static std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

static long long parse_int(const std::string& key, const std::string& s, long long lo, long long hi) {
    size_t pos = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(key + ": not an integer: " + s);
    }
    if (pos != s.size()) throw std::invalid_argument(key + ": not an integer: " + s);
    if (v < lo || v > hi) {
        throw std::invalid_argument(key + ": out of range [" + std::to_string(lo) + ", " +
                                    std::to_string(hi) + "]: " + s);
    }
    return v;
}

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) throw std::invalid_argument(std::string("missing value for ") + argv[i]);
    return argv[++i];
}

Config load_config(int argc, char** argv) {
    Config c;

    if (auto v = env_value("API_KEY")) {
        // an empty key would accept requests without the header
        if (!v->empty()) c.api_key = *v;
    }
    if (auto v = env_value("HOST"); v && !v->empty()) c.host = *v;
    if (auto v = env_value("PORT")) c.port = (int)parse_int("PORT", *v, 1, 65535);
    if (auto v = env_value("CONVERT_WORK_ROOT"); v && !v->empty()) c.work_root = *v;
    if (auto v = env_value("CONVERT_ENGINE"); v && !v->empty()) c.engine_bin = *v;
    if (auto v = env_value("CONVERT_TIMEOUT_SEC")) {
        c.engine_timeout_sec = (int)parse_int("CONVERT_TIMEOUT_SEC", *v, 0, 24 * 3600);
    }
    if (auto v = env_value("CONVERT_THREADS")) {
        c.worker_threads = (size_t)parse_int("CONVERT_THREADS", *v, 0, 1024);
    }
    if (auto v = env_value("LOG_LEVEL"); v && !v->empty()) c.log_level = parse_log_level(*v);

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--host") {
            c.host = arg_value(i, argc, argv);
        } else if (a == "--port") {
            c.port = (int)parse_int("--port", arg_value(i, argc, argv), 1, 65535);
        } else if (!a.empty() && a[0] == '-') {
            throw std::invalid_argument("unknown option: " + a);
        } else {
            c.work_root = a;
        }
    }

    // engine gets file:// URIs and absolute --outdir
    c.work_root = std::filesystem::absolute(c.work_root).lexically_normal();
    return c;
}

} // namespace docpdf
