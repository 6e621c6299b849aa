#pragma once

#include <sift/result.hpp>
#include <string>
#include <filesystem>

namespace sift {

// Replace every '\' with '/'.
std::string to_posix(const std::string& p);

// Lexically resolve `p` against the absolute directory `base` into an
// absolute, normalized path. Symlinks are not followed and nothing is read
// from disk. A trailing separator is dropped (except for the filesystem root).
std::filesystem::path resolve_path(const std::filesystem::path& base,
                                   const std::string& p);

// Relative path from `base` to `absolute`, with '/' separators.
// Returns "" when both name the same directory; paths outside `base`
// start with "../".
std::string relative_posix(const std::filesystem::path& absolute,
                           const std::filesystem::path& base);

// The absolute directory an Options::cwd stands for: itself when absolute,
// otherwise joined onto the process working directory. Fails with IO when
// the process working directory cannot be determined (e.g. it was removed).
Result<std::filesystem::path> effective_cwd(const std::filesystem::path& cwd);

} // namespace sift
