// docpdf/cpp/src/ingest.cpp
#include "docpdf/ingest.h"
#include "docpdf/errors.h"
#include "docpdf/filename.h"
#include "docpdf/log.h"

#include <fstream>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace docpdf {

namespace {

enum class ScanState {
    Searching, // no `file` part seen yet
    Writing,   // inside the first `file` part
    Draining,  // got it; consume the rest of the body
};

} // namespace

UploadedFile ingest_upload(const MultipartReader& reader, const Workspace& ws) {
    ScanState state = ScanState::Searching;
    UploadedFile up;
    std::ofstream out;
    std::optional<ConvertError> failure;

    auto on_header = [&](const PartHeader& h) -> bool {
        if (state == ScanState::Writing) {
            // the upload ended where the next part starts
            out.flush();
            if (!out) {
                failure.emplace(ErrorCode::IoError, "flush failed: " + up.path.string());
                return false;
            }
            out.close();
            state = ScanState::Draining;
            return true;
        }
        if (state == ScanState::Draining || h.name != UPLOAD_FIELD) return true;

        up.filename = sanitize_filename(h.filename);
        up.content_type = h.content_type;
        up.path = ws.file_path(up.filename);
        out.open(up.path, std::ios::binary | std::ios::trunc);
        if (!out) {
            failure.emplace(ErrorCode::IoError, "cannot create file: " + up.path.string());
            return false;
        }
        state = ScanState::Writing;
        return true;
    };

    auto on_data = [&](const char* data, size_t len) -> bool {
        if (state != ScanState::Writing) return true;
        out.write(data, (std::streamsize)len);
        if (!out) {
            failure.emplace(ErrorCode::StreamInterrupted, "write failed: " + up.path.string());
            return false;
        }
        up.bytes += (uint64_t)len;
        return true;
    };

    const bool read_ok = reader(on_header, on_data);

    if (!failure && !read_ok) {
        failure.emplace(ErrorCode::StreamInterrupted, "multipart body read failed");
    }
    if (!failure && state == ScanState::Writing) {
        out.flush();
        if (!out) failure.emplace(ErrorCode::IoError, "flush failed: " + up.path.string());
    }

    if (failure) {
        if (out.is_open()) out.close();
        if (!up.path.empty()) {
            std::error_code ec;
            fs::remove(up.path, ec);
            if (ec) log_warn("partial_upload_remove_failed", {{"request", ws.id()}, {"err", ec.message()}});
        }
        throw *failure;
    }

    if (state == ScanState::Searching) {
        throw ConvertError(ErrorCode::NoFileUploaded, "no multipart part named 'file'");
    }

    out.close();
    return up;
}

} // namespace docpdf
