// docpdf/cpp/src/filename.cpp
#include "docpdf/filename.h"

#include <cctype>

namespace docpdf {

static bool is_sep(char c) {
    return c == '/' || c == '\\';
}

std::string sanitize_filename(std::string_view raw) {
    // trailing separators do not start a new segment ("a/b/" -> "b")
    size_t end = raw.size();
    while (end > 0 && is_sep(raw[end - 1])) --end;

    size_t begin = end;
    while (begin > 0 && !is_sep(raw[begin - 1])) --begin;

    std::string out;
    out.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        if (raw[i] != '\0') out.push_back(raw[i]);
    }

    if (out.empty() || out == "." || out == "..") return DEFAULT_FILENAME;
    return out;
}

std::string content_disposition_attachment(std::string_view filename) {
    std::string out = "attachment; filename=\"";
    out.reserve(out.size() + filename.size() + 4);
    for (char c : filename) {
        // header values must not carry line breaks
        if (c == '\r' || c == '\n') continue;
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string lower_ext(const std::filesystem::path& p) {
    std::string ext = p.extension().string();
    for (auto& c : ext) c = (char)std::tolower((unsigned char)c);
    return ext;
}

} // namespace docpdf
