// docpdf/cpp/src/workspace.cpp
#include "docpdf/workspace.h"
#include "docpdf/errors.h"
#include "docpdf/filename.h"
#include "docpdf/log.h"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace docpdf {

std::string gen_uuid_v4() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // version 4, variant 10xx
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    oss << std::setw(8) << ((a >> 32) & 0xFFFFFFFFULL) << "-";
    oss << std::setw(4) << ((a >> 16) & 0xFFFFULL) << "-";
    oss << std::setw(4) << (a & 0xFFFFULL) << "-";
    oss << std::setw(4) << ((b >> 48) & 0xFFFFULL) << "-";
    oss << std::setw(12) << (b & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

// -------------------- Workspace --------------------

Workspace::Workspace(std::string id, fs::path dir) : id_(std::move(id)), dir_(std::move(dir)) {}

Workspace::~Workspace() {
    destroy();
}

Workspace::Workspace(Workspace&& other) noexcept
    : id_(std::move(other.id_)), dir_(std::move(other.dir_)) {
    other.id_.clear();
    other.dir_.clear();
}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        destroy();
        id_ = std::move(other.id_);
        dir_ = std::move(other.dir_);
        other.id_.clear();
        other.dir_.clear();
    }
    return *this;
}

fs::path Workspace::file_path(const std::string& sanitized_name) const {
    if (sanitized_name == PROFILE_DIR_NAME || sanitized_name == ENGINE_LOG_NAME) {
        return dir_ / DEFAULT_FILENAME;
    }
    return dir_ / sanitized_name;
}

void Workspace::destroy() noexcept {
    if (dir_.empty()) return;
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        log_error("workspace_remove_failed", {{"request", id_}, {"dir", dir_.string()}, {"err", ec.message()}});
        return;
    }
    log_debug("workspace_removed", {{"request", id_}});
    dir_.clear();
}

// -------------------- WorkspaceManager --------------------

WorkspaceManager::WorkspaceManager(fs::path root) : root_(std::move(root)) {}

Workspace WorkspaceManager::create() const {
    // a fresh v4 id colliding is practically impossible, but never reuse a dir
    for (int i = 0; i < 8; ++i) {
        std::string id = gen_uuid_v4();
        fs::path dir = root_ / id;

        std::error_code ec;
        fs::create_directories(root_, ec);
        if (ec) {
            throw ConvertError(ErrorCode::WorkspaceError,
                               "mkdir failed: " + root_.string() + " err=" + ec.message());
        }
        if (fs::create_directory(dir, ec)) {
            log_debug("workspace_created", {{"request", id}, {"dir", dir.string()}});
            return Workspace(std::move(id), std::move(dir));
        }
        if (ec) {
            throw ConvertError(ErrorCode::WorkspaceError,
                               "mkdir failed: " + dir.string() + " err=" + ec.message());
        }
    }
    throw ConvertError(ErrorCode::WorkspaceError, "cannot allocate workspace under " + root_.string());
}

} // namespace docpdf
