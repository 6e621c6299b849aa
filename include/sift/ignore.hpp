#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sift {

// One parsed line of an ignore file.
struct IgnoreRule {
    std::string source;    // the line as written
    std::string pattern;   // glob body without '!', leading '/' or trailing '/'
    bool negated = false;  // "!pattern" re-includes
    bool dir_only = false; // "pattern/" matches directories only
    bool anchored = false; // leading or inner '/' ties the rule to the base dir
};

// An ordered set of gitignore-style rules. Paths handed to ignores() are
// relative to the directory the rules were written for, using '/'.
class IgnoreRules {
public:
    // Parse and append one line. Blank lines and '#' comments are skipped.
    void add(const std::string& line);
    void add(const std::vector<std::string>& lines);

    // Append every rule of `other` after the existing ones.
    void append(const IgnoreRules& other);

    // True if `relative_path` or one of its ancestor directories is ignored.
    // The last rule matching a path decides; a negation can re-include a
    // path but not one below an ignored directory.
    bool ignores(const std::string& relative_path, bool is_dir = false) const;

    const std::vector<IgnoreRule>& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }

    // Split file contents on "\n" or "\r\n", dropping empty lines.
    static std::vector<std::string> split_lines(const std::string& text);

private:
    // nullopt when no rule mentions the path
    std::optional<bool> decide(const std::string& candidate, bool is_dir) const;

    std::vector<IgnoreRule> rules_;
};

} // namespace sift
