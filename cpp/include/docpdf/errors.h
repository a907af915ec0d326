// docpdf/cpp/include/docpdf/errors.h
#pragma once
#include <stdexcept>
#include <string>

namespace docpdf {

enum class ErrorCode {
    Ok = 0,
    NoFileUploaded,
    StreamInterrupted,
    WorkspaceError,
    IoError,
    EngineFailed,
    EngineLaunchFailed,
    EngineTimedOut,
    OutputNotFound,
    OutputReadFailed,
    Internal,
};

const char* to_string(ErrorCode code);

// HTTP status reported to the client for a failed conversion.
int http_status(ErrorCode code);

// Generic text safe to send to the client (no paths, no engine output).
const char* client_message(ErrorCode code);

class ConvertError : public std::runtime_error {
public:
    ConvertError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace docpdf
