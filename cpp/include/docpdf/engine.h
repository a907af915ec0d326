// docpdf/cpp/include/docpdf/engine.h
#pragma once
#include <filesystem>
#include <string>

#include "docpdf/ingest.h"
#include "docpdf/workspace.h"

namespace docpdf {

struct EngineResult {
    bool launched{false};
    int exit_code{-1};
    bool timed_out{false};
    std::string diagnostics; // combined stdout/stderr, for logs only
};

// External renderer. One call converts one input into out_dir.
class ConversionEngine {
public:
    virtual ~ConversionEngine() = default;

    virtual EngineResult convert(const std::filesystem::path& input,
                                 const std::filesystem::path& out_dir,
                                 const std::filesystem::path& profile_dir) = 0;
};

// LibreOffice headless, one isolated UserInstallation per call.
class SofficeEngine : public ConversionEngine {
public:
    explicit SofficeEngine(std::string binary = "libreoffice", int timeout_sec = 0);

    EngineResult convert(const std::filesystem::path& input,
                         const std::filesystem::path& out_dir,
                         const std::filesystem::path& profile_dir) override;

    // Shell command line, output redirected to `log_path`.
    std::string build_command(const std::filesystem::path& input,
                              const std::filesystem::path& out_dir,
                              const std::filesystem::path& profile_dir,
                              const std::filesystem::path& log_path) const;

private:
    std::string binary_;
    int timeout_sec_;
};

// file:// URI for -env:UserInstallation.
std::string profile_uri(const std::filesystem::path& dir);

// Runs `engine` on `file` inside `ws` (output + profile in the workspace).
// Throws ConvertError: EngineLaunchFailed, EngineTimedOut, EngineFailed.
void invoke_conversion(ConversionEngine& engine, const Workspace& ws, const UploadedFile& file);

} // namespace docpdf
