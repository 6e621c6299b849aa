#include <sift/path_util.hpp>

namespace sift {

namespace fs = std::filesystem;

std::string to_posix(const std::string& p) {
    std::string out = p;
    for (char& c : out) {
        if (c == '\\') c = '/';
    }
    return out;
}

static fs::path strip_trailing_separator(fs::path p) {
    // "a/b/" normalizes to "a/b/" with an empty filename; drop it.
    if (!p.has_filename() && p.has_relative_path()) {
        p = p.parent_path();
    }
    return p;
}

Result<fs::path> effective_cwd(const fs::path& cwd) {
    if (cwd.is_absolute()) {
        return Result<fs::path>::ok(strip_trailing_separator(cwd.lexically_normal()));
    }
    std::error_code ec;
    auto cur = fs::current_path(ec);
    if (ec) {
        return SiftError::io("cannot determine working directory for", cwd, ec);
    }
    if (cwd.empty()) return Result<fs::path>::ok(cur);
    return Result<fs::path>::ok(strip_trailing_separator((cur / cwd).lexically_normal()));
}

fs::path resolve_path(const fs::path& base, const std::string& p) {
    fs::path target(p);
    fs::path joined = target.is_absolute() ? target : base / target;
    return strip_trailing_separator(joined.lexically_normal());
}

std::string relative_posix(const fs::path& absolute, const fs::path& base) {
    fs::path rel = strip_trailing_separator(absolute.lexically_normal())
        .lexically_relative(strip_trailing_separator(base.lexically_normal()));
    std::string out = rel.generic_string();
    if (out == ".") return "";
    return out;
}

} // namespace sift
