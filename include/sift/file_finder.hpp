#pragma once

#include <sift/options.hpp>
#include <sift/result.hpp>
#include <functional>
#include <string>
#include <vector>

namespace sift {

// One file selected for processing.
struct FileRecord {
    std::string filename;  // absolute path
    bool ignored = false;  // named directly but matched by an ignore rule

    bool operator==(const FileRecord& other) const {
        return filename == other.filename && ignored == other.ignored;
    }
};

// Maps a pathname to itself, or to "<dir>/**/*.<ext>" (or "*.{a,b}" for
// several extensions) when it names an existing directory under
// Options::cwd. The result always uses '/' separators.
using PathProcessor = std::function<std::string(const std::string&)>;

// Fails with IO only when a relative Options::cwd cannot be resolved.
Result<PathProcessor> make_path_processor(const Options& options);

// Drop empty patterns and turn directories into extension globs, keeping
// order.
Result<std::vector<std::string>> resolve_file_glob_patterns(
    const std::vector<std::string>& patterns,
    const Options& options);

// Does the pattern text ask for dotfiles? True for ".hidden" or
// "src/.hidden/*", false for "./src" or "../lib/*.js".
bool is_dotfile_pattern(const std::string& pattern);

// Build the list of absolute filenames to process, in pattern order, each
// at most once.
//
// A pattern naming an existing file is a direct path: it is always
// reported, with `ignored` set when an ignore rule matches and
// Options::ignore is on. Anything else is glob-expanded, and matches caught
// by an ignore rule are left out. When Options::dotfiles is not on, a
// pattern that names a dotfile enables dotfiles for that pattern only.
// Filesystem and ignore-file faults, including an unknown process cwd,
// fail the whole call.
Result<std::vector<FileRecord>> list_files_to_process(
    const std::vector<std::string>& glob_patterns,
    const Options& options);

// Same, with default Options (ignore on, process cwd).
Result<std::vector<FileRecord>> list_files_to_process(
    const std::vector<std::string>& glob_patterns);

} // namespace sift
