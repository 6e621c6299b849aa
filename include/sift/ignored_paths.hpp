#pragma once

#include <sift/glob.hpp>
#include <sift/ignore.hpp>
#include <sift/options.hpp>
#include <sift/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace sift {

// Which rule set a query consults.
enum class Tier {
    Default,  // built-in rules plus everything loaded from ignore sources
    Custom,   // only the rules loaded from ignore sources
    Any
};

// The ignore policy for one Options value.
//
// The default tier always carries /node_modules/* and /bower_components/*,
// plus ".*" (dotfiles) unless Options::dotfiles is true. When
// Options::ignore is on, rules from the ignore file (Options::ignore_path,
// else .siftignore in cwd, else [ignore] paths of sift.toml) and
// Options::ignore_patterns are added to both tiers.
class IgnoredPaths {
public:
    static Result<IgnoredPaths> create(const Options& options);

    // Is `path` (absolute, or relative to cwd) ignored by `tier`?
    bool contains(const std::string& path, Tier tier = Tier::Any) const;

    // Predicate for glob_expand that skips ignored directories.
    DirPruner folder_checker() const;

    const std::filesystem::path& cwd() const { return cwd_; }

    // Ignore rules are relative to this: cwd, or the ignore file's directory.
    const std::filesystem::path& base_dir() const { return base_dir_; }

    const IgnoreRules& rules(Tier tier) const;

    static const std::vector<std::string>& default_patterns();

private:
    IgnoredPaths() = default;

    std::filesystem::path cwd_;
    std::filesystem::path base_dir_;
    bool dotfiles_ = false;
    bool ignore_ = true;
    IgnoreRules default_;
    IgnoreRules custom_;
};

} // namespace sift
