// docpdf/cpp/include/docpdf/workspace.h
#pragma once
#include <filesystem>
#include <string>

namespace docpdf {

// Entries the pipeline itself places inside a workspace.
constexpr const char* PROFILE_DIR_NAME = ".lo_profile";
constexpr const char* ENGINE_LOG_NAME  = ".engine.log";

// Per-request directory <root>/<id>. Removed when the handle goes away.
class Workspace {
public:
    Workspace() = default;
    Workspace(std::string id, std::filesystem::path dir);
    ~Workspace();

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::string& id() const { return id_; }
    const std::filesystem::path& dir() const { return dir_; }

    std::filesystem::path profile_dir() const { return dir_ / PROFILE_DIR_NAME; }
    std::filesystem::path engine_log() const { return dir_ / ENGINE_LOG_NAME; }

    // dir / name, with reserved names replaced by the default filename.
    std::filesystem::path file_path(const std::string& sanitized_name) const;

    // Recursive remove. Safe to call repeatedly; failures are logged only.
    void destroy() noexcept;

private:
    std::string id_;
    std::filesystem::path dir_;
};

class WorkspaceManager {
public:
    explicit WorkspaceManager(std::filesystem::path root);

    // Throws ConvertError(WorkspaceError).
    Workspace create() const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::string gen_uuid_v4();

} // namespace docpdf
