#include <cassert>
#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "docpdf/errors.h"
#include "docpdf/pipeline.h"
#include "test_support.h"

namespace fs = std::filesystem;
using testutil::FakeEngine;
using testutil::memory_multipart;

static docpdf::ConversionResult run_with(FakeEngine::Mode mode, const fs::path& root,
                                         std::vector<testutil::Part> parts) {
    docpdf::WorkspaceManager mgr{root};
    FakeEngine engine{mode};
    docpdf::ConversionPipeline pipeline{mgr, engine};
    return pipeline.run(memory_multipart(std::move(parts)));
}

int main() {
    const fs::path root = testutil::mk_tmp_dir("pipeline");

    // happy path
    {
        docpdf::WorkspaceManager mgr{root};
        FakeEngine engine;
        docpdf::ConversionPipeline pipeline{mgr, engine};

        auto r = pipeline.run(memory_multipart({{"file", "C:\\tmp\\Quarterly Report.docx", "Q3 numbers"}}));
        assert(r.ok());
        assert(r.state == docpdf::Stage::Done);
        assert(docpdf::http_status(r.error) == 200);
        assert(r.pdf.filename == "Quarterly Report.pdf");
        assert(r.pdf.bytes.rfind("%PDF-", 0) == 0);
        assert(r.pdf.bytes == "%PDF-1.4\nQ3 numbers");
        assert(!r.request_id.empty());
        assert(!fs::exists(root / r.request_id));
        assert(testutil::count_entries(root) == 0);

        // engine saw input, output dir and profile all inside the workspace
        auto calls = engine.calls();
        assert(calls.size() == 1);
        assert(calls[0].out_dir == root / r.request_id);
        assert(calls[0].input == calls[0].out_dir / "Quarterly Report.docx");
        assert(calls[0].profile_dir == calls[0].out_dir / ".lo_profile");
    }

    // every failure maps to its status and leaves nothing behind
    struct Case {
        FakeEngine::Mode mode;
        std::vector<testutil::Part> parts;
        docpdf::ErrorCode want;
        docpdf::Stage stage;
        int status;
    };
    const std::vector<Case> cases = {
        {FakeEngine::Mode::Pdf, {{"attachment", "a.docx", "x"}},
         docpdf::ErrorCode::NoFileUploaded, docpdf::Stage::Ingesting, 400},
        {FakeEngine::Mode::Pdf, {},
         docpdf::ErrorCode::NoFileUploaded, docpdf::Stage::Ingesting, 400},
        {FakeEngine::Mode::NonZeroExit, {{"file", "a.docx", "x"}},
         docpdf::ErrorCode::EngineFailed, docpdf::Stage::Converting, 500},
        {FakeEngine::Mode::NotLaunched, {{"file", "a.docx", "x"}},
         docpdf::ErrorCode::EngineLaunchFailed, docpdf::Stage::Converting, 500},
        {FakeEngine::Mode::TimedOut, {{"file", "a.docx", "x"}},
         docpdf::ErrorCode::EngineTimedOut, docpdf::Stage::Converting, 500},
        {FakeEngine::Mode::NoOutput, {{"file", "a.docx", "x"}},
         docpdf::ErrorCode::OutputNotFound, docpdf::Stage::Resolving, 500},
    };
    for (const auto& c : cases) {
        auto r = run_with(c.mode, root, c.parts);
        assert(!r.ok());
        assert(r.error == c.want);
        assert(r.failed_at == c.stage);
        assert(r.state == docpdf::Stage::Failed);
        assert(docpdf::http_status(r.error) == c.status);
        assert(r.pdf.bytes.empty());
        assert(testutil::count_entries(root) == 0);
    }

    // an uploaded pdf is never echoed back as the result
    for (const char* name : {"scan.pdf", "scan.PDF"}) {
        auto r = run_with(FakeEngine::Mode::NoOutput, root, {{"file", name, "CLIENT-BYTES"}});
        assert(r.error == docpdf::ErrorCode::OutputNotFound);
        assert(docpdf::http_status(r.error) == 500);
        assert(r.pdf.bytes.empty());
        assert(testutil::count_entries(root) == 0);
    }

    // engine output next to a same-stem upload is picked, not the upload
    {
        auto r = run_with(FakeEngine::Mode::Pdf, root, {{"file", "scan.PDF", "CLIENT-BYTES"}});
        assert(r.ok());
        assert(r.pdf.filename == "scan.pdf");
        assert(r.pdf.bytes == "%PDF-1.4\nCLIENT-BYTES");
        assert(testutil::count_entries(root) == 0);
    }

    // client message never carries engine output or paths
    {
        auto r = run_with(FakeEngine::Mode::NonZeroExit, root, {{"file", "a.docx", "x"}});
        const std::string msg = docpdf::client_message(r.error);
        assert(msg == "Conversion failed");
        assert(msg.find("could not be loaded") == std::string::npos);
    }

    // interrupted upload never reaches the engine
    {
        docpdf::WorkspaceManager mgr{root};
        FakeEngine engine;
        docpdf::ConversionPipeline pipeline{mgr, engine};
        auto r = pipeline.run(memory_multipart({{"file", "a.docx", std::string(500, 'x')}}, 50, 120));
        assert(r.error == docpdf::ErrorCode::StreamInterrupted);
        assert(docpdf::http_status(r.error) == 400);
        assert(engine.calls().empty());
        assert(testutil::count_entries(root) == 0);
    }

    // workspace cannot be created
    {
        const fs::path blocker = root / "blocker";
        testutil::write_file(blocker, "file");
        auto r = run_with(FakeEngine::Mode::Pdf, blocker, {{"file", "a.docx", "x"}});
        assert(r.error == docpdf::ErrorCode::WorkspaceError);
        assert(r.request_id.empty());
        assert(docpdf::http_status(r.error) == 500);
        fs::remove(blocker);
    }

    // concurrent requests see only their own workspace and profile
    {
        docpdf::WorkspaceManager mgr{root};
        FakeEngine engine{FakeEngine::Mode::Pdf, std::chrono::milliseconds(50)};
        docpdf::ConversionPipeline pipeline{mgr, engine};

        constexpr int N = 8;
        std::vector<docpdf::ConversionResult> results(N);
        std::vector<std::thread> workers;
        for (int i = 0; i < N; ++i) {
            workers.emplace_back([&, i]() {
                const std::string body = "payload-" + std::to_string(i);
                results[i] = pipeline.run(memory_multipart({{"file", "same-name.docx", body}}));
            });
        }
        for (auto& t : workers) t.join();

        std::set<std::string> ids;
        for (int i = 0; i < N; ++i) {
            assert(results[i].ok());
            assert(results[i].pdf.bytes == "%PDF-1.4\npayload-" + std::to_string(i));
            ids.insert(results[i].request_id);
        }
        assert(ids.size() == (size_t)N);

        std::set<fs::path> profiles;
        for (const auto& c : engine.calls()) {
            profiles.insert(c.profile_dir);
            assert(c.profile_dir.parent_path() == c.out_dir);
            assert(c.input.parent_path() == c.out_dir);
            // only this request's input and profile are visible
            for (const auto& e : c.out_dir_entries) {
                assert(e == "same-name.docx" || e == ".lo_profile");
            }
        }
        assert(profiles.size() == (size_t)N);
        assert(testutil::count_entries(root) == 0);
    }

    fs::remove_all(root);
    return 0;
}
