// docpdf/cpp/include/docpdf/resolver.h
#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace docpdf {

constexpr const char* PDF_EXT = ".pdf";

struct ResolvedOutput {
    std::filesystem::path path;
    std::string filename;
};

// First regular file directly in `dir` whose extension matches `ext`
// (case-insensitive), other than `exclude` (the uploaded input). Order is
// whatever the directory iterator yields.
std::optional<ResolvedOutput> find_output(const std::filesystem::path& dir,
                                          const std::string& ext = PDF_EXT,
                                          const std::filesystem::path& exclude = {});

// Throws ConvertError(OutputReadFailed).
std::string read_output(const std::filesystem::path& p);

} // namespace docpdf
