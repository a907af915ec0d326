// docpdf/cpp/src/resolver.cpp
#include "docpdf/resolver.h"
#include "docpdf/errors.h"
#include "docpdf/filename.h"

#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace docpdf {

std::optional<ResolvedOutput> find_output(const fs::path& dir, const std::string& ext, const fs::path& exclude) {
    const std::string want = lower_ext(fs::path("x" + ext));

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return std::nullopt;

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return std::nullopt;
        if (!it->is_regular_file(ec) || ec) { ec.clear(); continue; }
        if (lower_ext(it->path()) != want) continue;
        if (!exclude.empty() && it->path().filename() == exclude.filename()) continue;
        return ResolvedOutput{it->path(), it->path().filename().string()};
    }
    return std::nullopt;
}

std::string read_output(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw ConvertError(ErrorCode::OutputReadFailed, "cannot open file: " + p.string());
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw ConvertError(ErrorCode::OutputReadFailed, "read failed: " + p.string());
    return bytes;
}

} // namespace docpdf
