#pragma once

#include <sift/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sift {

// Settings that drive pattern resolution and file collection.
//
// Loaded from the [files] table of a sift.toml:
//
//   [files]
//   cwd = "."
//   extensions = [".js", ".jsx"]
//   ignore = true
//   ignore-path = ".siftignore"
//   ignore-pattern = ["dist/**"]   # or a single string
//   dotfiles = false
struct Options {
    std::filesystem::path cwd;                 // empty = process cwd
    std::vector<std::string> extensions;       // empty = {".js"}
    bool ignore = true;
    std::string ignore_path;
    std::vector<std::string> ignore_patterns;
    std::optional<bool> dotfiles;              // unset = derived per pattern

    // Track whether `ignore` was explicitly set (for merge)
    bool ignore_set = false;

    // Extensions with the default applied.
    std::vector<std::string> effective_extensions() const;

    // Parse the [files] table from a TOML string. A relative `cwd` is kept
    // as written.
    static Result<Options> parse(const std::string& toml_str);

    // Load from a TOML file; a relative `cwd` is resolved against the
    // directory holding the file.
    static Result<Options> load(const std::filesystem::path& path);

    // Layer explicitly-set fields of `other` on top of this.
    void merge(const Options& other);
};

// Name of the project file consulted for options and ignore paths.
inline constexpr const char* kManifestName = "sift.toml";

// Name of the ignore file looked up in the working directory.
inline constexpr const char* kIgnoreFileName = ".siftignore";

// Read the `paths` array of the [ignore] table of a sift.toml.
// A missing table yields an empty list.
Result<std::vector<std::string>> read_manifest_ignores(const std::filesystem::path& path);

} // namespace sift
