// docpdf/cpp/src/engine.cpp
#include "docpdf/engine.h"
#include "docpdf/errors.h"
#include "docpdf/log.h"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>

#include <sys/wait.h>

namespace fs = std::filesystem;

namespace docpdf {

namespace {

// tail kept from the engine output
constexpr std::streamoff MAX_DIAGNOSTIC_BYTES = 16 * 1024;

// shell status when the command itself could not be run
constexpr int SHELL_NOT_EXECUTABLE = 126;
constexpr int SHELL_NOT_FOUND      = 127;

// coreutils `timeout`
constexpr int TIMEOUT_EXPIRED = 124;
constexpr int TIMEOUT_KILLED  = 128 + 9;
constexpr int TIMEOUT_KILL_GRACE_SEC = 5;

std::string shell_quote(const std::string& s) {
    // single-quote safe for sh: ' -> '\''
    std::string out;
    out.reserve(s.size() + 8);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string read_tail(const fs::path& p, std::streamoff max_bytes) {
    std::ifstream in(p, std::ios::binary | std::ios::ate);
    if (!in) return {};
    const std::streamoff size = in.tellg();
    if (size > max_bytes) in.seekg(size - max_bytes, std::ios::beg);
    else in.seekg(0, std::ios::beg);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

std::string profile_uri(const fs::path& dir) {
    static const char* HEX = "0123456789ABCDEF";
    const std::string s = fs::absolute(dir).lexically_normal().generic_string();
    std::string out = "file://";
    out.reserve(out.size() + s.size());
    for (unsigned char c : s) {
        const bool keep = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
        if (keep) {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

// -------------------- SofficeEngine --------------------

SofficeEngine::SofficeEngine(std::string binary, int timeout_sec)
    : binary_(std::move(binary)), timeout_sec_(timeout_sec) {}

std::string SofficeEngine::build_command(const fs::path& input,
                                         const fs::path& out_dir,
                                         const fs::path& profile_dir,
                                         const fs::path& log_path) const {
    std::string cmd;
    if (timeout_sec_ > 0) {
        cmd += "timeout --kill-after=" + std::to_string(TIMEOUT_KILL_GRACE_SEC) + " " +
               std::to_string(timeout_sec_) + " ";
    }
    cmd += shell_quote(binary_) +
        " --headless --nodefault --nofirststartwizard --nolockcheck --nologo --norestore"
        " --convert-to pdf"
        " --outdir " + shell_quote(out_dir.string()) +
        " " + shell_quote("-env:UserInstallation=" + profile_uri(profile_dir)) +
        " " + shell_quote(input.string()) +
        " </dev/null >" + shell_quote(log_path.string()) + " 2>&1";
    return cmd;
}

EngineResult SofficeEngine::convert(const fs::path& input,
                                    const fs::path& out_dir,
                                    const fs::path& profile_dir) {
    EngineResult r;
    const fs::path log_path = out_dir / ENGINE_LOG_NAME;
    const std::string cmd = build_command(input, out_dir, profile_dir, log_path);
    log_debug("engine_exec", {{"cmd", cmd}});

    const int rc = std::system(cmd.c_str());
    if (rc == -1) {
        r.diagnostics = "system() failed";
        return r;
    }

    r.diagnostics = read_tail(log_path, MAX_DIAGNOSTIC_BYTES);

    if (WIFSIGNALED(rc)) {
        r.launched = true;
        r.exit_code = 128 + WTERMSIG(rc);
        return r;
    }
    const int status = WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
    if (status == SHELL_NOT_FOUND || status == SHELL_NOT_EXECUTABLE) {
        r.exit_code = status;
        return r;
    }

    r.launched = true;
    r.exit_code = status;
    if (timeout_sec_ > 0 && (status == TIMEOUT_EXPIRED || status == TIMEOUT_KILLED)) {
        r.timed_out = true;
    }
    return r;
}

// -------------------- invocation --------------------

void invoke_conversion(ConversionEngine& engine, const Workspace& ws, const UploadedFile& file) {
    const fs::path profile = ws.profile_dir();
    std::error_code ec;
    fs::create_directories(profile, ec);
    if (ec) throw ConvertError(ErrorCode::IoError, "mkdir failed: " + profile.string() + " err=" + ec.message());

    log_info("converting", {
        {"request", ws.id()},
        {"file", file.filename},
        {"type", file.content_type},
        {"bytes", std::to_string(file.bytes)},
    });

    EngineResult r = engine.convert(file.path, ws.dir(), profile);

    if (!r.launched) {
        throw ConvertError(ErrorCode::EngineLaunchFailed,
                           "engine did not start rc=" + std::to_string(r.exit_code) + " out=" + r.diagnostics);
    }
    if (r.timed_out) {
        throw ConvertError(ErrorCode::EngineTimedOut,
                           "engine timed out rc=" + std::to_string(r.exit_code) + " out=" + r.diagnostics);
    }
    if (r.exit_code != 0) {
        throw ConvertError(ErrorCode::EngineFailed,
                           "engine exited rc=" + std::to_string(r.exit_code) + " out=" + r.diagnostics);
    }
}

} // namespace docpdf
