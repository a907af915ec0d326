// docpdf/cpp/src/errors.cpp
#include "docpdf/errors.h"

namespace docpdf {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                 return "ok";
        case ErrorCode::NoFileUploaded:     return "no_file_uploaded";
        case ErrorCode::StreamInterrupted:  return "stream_interrupted";
        case ErrorCode::WorkspaceError:     return "workspace_error";
        case ErrorCode::IoError:            return "io_error";
        case ErrorCode::EngineFailed:       return "engine_failed";
        case ErrorCode::EngineLaunchFailed: return "engine_launch_failed";
        case ErrorCode::EngineTimedOut:     return "engine_timed_out";
        case ErrorCode::OutputNotFound:     return "output_not_found";
        case ErrorCode::OutputReadFailed:   return "output_read_failed";
        case ErrorCode::Internal:           return "internal";
    }
    return "unknown";
}

int http_status(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:
            return 200;
        // the client sent nothing usable or went away mid-upload
        case ErrorCode::NoFileUploaded:
        case ErrorCode::StreamInterrupted:
            return 400;
        default:
            return 500;
    }
}

const char* client_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                 return "OK";
        case ErrorCode::NoFileUploaded:     return "No file uploaded";
        case ErrorCode::StreamInterrupted:  return "Stream interrupted";
        case ErrorCode::EngineFailed:       return "Conversion failed";
        case ErrorCode::EngineLaunchFailed: return "Conversion execution failed";
        case ErrorCode::EngineTimedOut:     return "Conversion timed out";
        case ErrorCode::OutputNotFound:     return "PDF generation failed - output not found";
        case ErrorCode::OutputReadFailed:   return "Read PDF failed";
        case ErrorCode::WorkspaceError:
        case ErrorCode::IoError:
        case ErrorCode::Internal:
            break;
    }
    return "Internal Error";
}

} // namespace docpdf
