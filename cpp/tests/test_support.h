// docpdf/cpp/tests/test_support.h
#pragma once
#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "docpdf/engine.h"
#include "docpdf/ingest.h"
#include "docpdf/workspace.h"

namespace testutil {

inline std::filesystem::path mk_tmp_dir(const std::string& tag) {
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("docpdf_test_" + tag + "_" + std::to_string((uint64_t)std::time(nullptr)) + "_" +
                     docpdf::gen_uuid_v4().substr(0, 8));
    std::filesystem::create_directories(p);
    return p;
}

inline std::filesystem::path test_data_file(const char* name) {
#ifndef DOCPDF_TEST_DATA_DIR
    return std::filesystem::path("cpp/tests/data") / name; // fallback
#else
    return std::filesystem::path(DOCPDF_TEST_DATA_DIR) / name;
#endif
}

inline size_t count_entries(const std::filesystem::path& dir) {
    if (!std::filesystem::exists(dir)) return 0;
    return (size_t)std::distance(std::filesystem::directory_iterator(dir), std::filesystem::directory_iterator());
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& p, const std::string& bytes) {
    std::ofstream out(p, std::ios::binary);
    out << bytes;
}

struct Part {
    std::string name;
    std::string filename;
    std::string content;
};

// In-memory multipart body. Data is delivered in `chunk` sized pieces; with
// fail_after_bytes set the stream "breaks" once that many bytes went out.
inline docpdf::MultipartReader memory_multipart(std::vector<Part> parts,
                                                size_t chunk = 7,
                                                long long fail_after_bytes = -1) {
    return [parts, chunk, fail_after_bytes](const docpdf::PartHeaderHandler& on_header,
                                            const docpdf::PartDataHandler& on_data) {
        long long sent = 0;
        for (const auto& p : parts) {
            if (!on_header(docpdf::PartHeader{p.name, p.filename, "application/octet-stream"})) return false;
            for (size_t off = 0; off < p.content.size(); off += chunk) {
                const size_t n = std::min(chunk, p.content.size() - off);
                if (fail_after_bytes >= 0 && sent + (long long)n > fail_after_bytes) return false;
                if (!on_data(p.content.data() + off, n)) return false;
                sent += (long long)n;
            }
        }
        return true;
    };
}

// Engine double. In Pdf mode writes <stem>.pdf = "%PDF-1.4\n" + input bytes.
class FakeEngine : public docpdf::ConversionEngine {
public:
    enum class Mode { Pdf, NonZeroExit, NotLaunched, NoOutput, TimedOut };

    struct Call {
        std::filesystem::path input;
        std::filesystem::path out_dir;
        std::filesystem::path profile_dir;
        std::vector<std::string> out_dir_entries; // at call time
    };

    explicit FakeEngine(Mode mode = Mode::Pdf, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : mode_(mode), delay_(delay) {}

    docpdf::EngineResult convert(const std::filesystem::path& input,
                                 const std::filesystem::path& out_dir,
                                 const std::filesystem::path& profile_dir) override {
        Call c{input, out_dir, profile_dir, {}};
        for (const auto& e : std::filesystem::directory_iterator(out_dir)) {
            c.out_dir_entries.push_back(e.path().filename().string());
        }
        {
            std::lock_guard<std::mutex> lk(mu_);
            calls_.push_back(c);
        }
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);

        docpdf::EngineResult r;
        switch (mode_) {
            case Mode::NotLaunched:
                r.exit_code = 127;
                r.diagnostics = "sh: libreoffice: not found";
                return r;
            case Mode::NonZeroExit:
                r.launched = true;
                r.exit_code = 1;
                r.diagnostics = "Error: source file could not be loaded";
                return r;
            case Mode::TimedOut:
                r.launched = true;
                r.exit_code = 124;
                r.timed_out = true;
                return r;
            case Mode::NoOutput:
                r.launched = true;
                r.exit_code = 0;
                return r;
            case Mode::Pdf:
                break;
        }
        write_file(out_dir / (input.stem().string() + ".pdf"), "%PDF-1.4\n" + read_file(input));
        r.launched = true;
        r.exit_code = 0;
        return r;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lk(mu_);
        return calls_;
    }

private:
    Mode mode_;
    std::chrono::milliseconds delay_;
    mutable std::mutex mu_;
    std::vector<Call> calls_;
};

} // namespace testutil
