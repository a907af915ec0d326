// docpdf/cpp/src/pipeline.cpp
#include "docpdf/pipeline.h"
#include "docpdf/log.h"
#include "docpdf/resolver.h"

#include <exception>

namespace docpdf {

const char* to_string(Stage s) {
    switch (s) {
        case Stage::Created:    return "created";
        case Stage::Ingesting:  return "ingesting";
        case Stage::Converting: return "converting";
        case Stage::Resolving:  return "resolving";
        case Stage::Reading:    return "reading";
        case Stage::Done:       return "done";
        case Stage::Failed:     return "failed";
    }
    return "unknown";
}

ConversionPipeline::ConversionPipeline(const WorkspaceManager& workspaces, ConversionEngine& engine)
    : workspaces_(workspaces), engine_(engine) {}

ConversionResult ConversionPipeline::run(const MultipartReader& reader) const {
    ConversionResult res;
    Stage stage = Stage::Created;

    auto fail = [&](ErrorCode code, const char* detail) {
        log_error("conversion_failed", {
            {"request", res.request_id},
            {"stage", to_string(stage)},
            {"error", to_string(code)},
            {"detail", detail},
        });
        res.error = code;
        res.failed_at = stage;
        res.state = stage = Stage::Failed;
        res.pdf = PdfDocument{};
    };

    try {
        Workspace ws = workspaces_.create();
        res.request_id = ws.id();

        // ws is destroyed at the end of this block on every path
        try {
            stage = Stage::Ingesting;
            UploadedFile up = ingest_upload(reader, ws);

            stage = Stage::Converting;
            invoke_conversion(engine_, ws, up);

            stage = Stage::Resolving;
            // an uploaded .pdf is input, never the artifact
            auto out = find_output(ws.dir(), PDF_EXT, up.path);
            if (!out) throw ConvertError(ErrorCode::OutputNotFound, "no .pdf in " + ws.dir().string());

            stage = Stage::Reading;
            res.pdf.bytes = read_output(out->path);
            res.pdf.filename = out->filename;

            res.state = stage = Stage::Done;
            log_info("converted", {
                {"request", res.request_id},
                {"input", up.filename},
                {"output", res.pdf.filename},
                {"bytes", std::to_string(res.pdf.bytes.size())},
            });
        } catch (const ConvertError& e) {
            fail(e.code(), e.what());
        } catch (const std::exception& e) {
            fail(ErrorCode::Internal, e.what());
        }
    } catch (const ConvertError& e) {
        // workspace creation itself failed
        fail(e.code(), e.what());
    } catch (const std::exception& e) {
        fail(ErrorCode::Internal, e.what());
    }

    return res;
}

} // namespace docpdf
