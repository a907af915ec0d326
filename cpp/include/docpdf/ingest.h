// docpdf/cpp/include/docpdf/ingest.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "docpdf/workspace.h"

namespace docpdf {

// Name of the multipart field carrying the document.
constexpr const char* UPLOAD_FIELD = "file";

struct PartHeader {
    std::string name;
    std::string filename;
    std::string content_type;
};

// Returning false from a handler stops the stream.
using PartHeaderHandler = std::function<bool(const PartHeader&)>;
using PartDataHandler   = std::function<bool(const char* data, size_t len)>;

// Drives the handlers over every part of a multipart body, in order.
// Returns false if the body could not be read to the end (client went
// away, malformed framing, payload limit) or a handler stopped it.
using MultipartReader = std::function<bool(const PartHeaderHandler&, const PartDataHandler&)>;

struct UploadedFile {
    std::string filename;        // sanitized
    std::filesystem::path path;  // inside the workspace
    std::string content_type;    // as declared by the client, may be empty
    uint64_t bytes{0};
};

// Streams the first part named `file` into `ws`; later parts are drained and
// ignored. Throws ConvertError: NoFileUploaded, StreamInterrupted, IoError.
UploadedFile ingest_upload(const MultipartReader& reader, const Workspace& ws);

} // namespace docpdf
