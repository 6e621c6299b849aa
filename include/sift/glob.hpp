#pragma once

#include <sift/result.hpp>
#include <string>
#include <vector>
#include <functional>
#include <filesystem>

namespace sift {

// Options for glob_expand.
struct GlobOptions {
    std::filesystem::path cwd;  // root for relative patterns; empty = process cwd
    bool dot = false;           // wildcards may match a leading '.'
    bool nodir = false;         // never return directories
};

// Called with the absolute path (forward slashes) of every directory before
// it is read. Returning true skips the directory and everything below it.
using DirPruner = std::function<bool(const std::string&)>;

// Match a glob pattern against a path (both normalized to forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9],
//           {a,b} alternation (nested allowed). Unterminated '[' and
//           unclosed '{' are literal characters.
// Unless `dot` is set, wildcards do not match a leading '.' in a segment.
bool glob_match(const std::string& pattern, const std::string& path,
                bool dot = false);

// Expand {a,b} groups into the list of alternatives, left to right.
// "{x}" without a comma stays literal, and so does a pattern with an
// unclosed '{': it comes back as the only alternative.
std::vector<std::string> glob_brace_expand(const std::string& pattern);

// Expand a glob pattern against the filesystem.
// Results keep the shape of the pattern: relative patterns yield paths
// relative to opts.cwd ("../" prefixes kept), absolute patterns yield
// absolute paths. Results are sorted and unique. An unterminated '[' or an
// unclosed '{' matches literally. A missing root directory yields no
// matches; a directory that cannot be read, or an unknown process cwd when
// opts.cwd is relative, is an IO error.
Result<std::vector<std::string>> glob_expand(
    const std::string& pattern,
    const GlobOptions& opts,
    const DirPruner& prune = nullptr);

} // namespace sift
