// docpdf/cpp/include/docpdf/filename.h
#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace docpdf {

// Used when the client name has no usable final segment.
constexpr const char* DEFAULT_FILENAME = "document";

// Final path segment of a client supplied name. Never empty, never contains
// '/', '\\' or NUL, never "." or "..".
std::string sanitize_filename(std::string_view raw);

// `attachment; filename="..."` with '"' and '\\' backslash-escaped.
std::string content_disposition_attachment(std::string_view filename);

std::string lower_ext(const std::filesystem::path& p);

} // namespace docpdf
