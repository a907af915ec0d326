// docpdf/cpp/include/docpdf/pipeline.h
#pragma once
#include <string>

#include "docpdf/engine.h"
#include "docpdf/errors.h"
#include "docpdf/ingest.h"
#include "docpdf/workspace.h"

namespace docpdf {

enum class Stage {
    Created,
    Ingesting,
    Converting,
    Resolving,
    Reading,
    Done,
    Failed,
};

const char* to_string(Stage s);

struct PdfDocument {
    std::string filename;
    std::string bytes;
};

struct ConversionResult {
    std::string request_id;      // empty if no workspace was created
    ErrorCode error{ErrorCode::Ok};
    Stage state{Stage::Created};     // Done or Failed once run() returns
    Stage failed_at{Stage::Created}; // last stage entered before Failed
    PdfDocument pdf;             // set only when ok()

    bool ok() const { return error == ErrorCode::Ok; }
};

// One request: workspace -> ingest -> convert -> resolve -> read.
// The workspace is gone by the time run() returns, whatever happened.
class ConversionPipeline {
public:
    ConversionPipeline(const WorkspaceManager& workspaces, ConversionEngine& engine);

    ConversionResult run(const MultipartReader& reader) const;

private:
    const WorkspaceManager& workspaces_;
    ConversionEngine& engine_;
};

} // namespace docpdf
