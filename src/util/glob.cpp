#include <sift/glob.hpp>
#include <sift/path_util.hpp>
#include <sift/log.hpp>
#include <algorithm>
#include <set>

namespace sift {

namespace fs = std::filesystem;

// ---- Helpers ----

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        // Collapse consecutive slashes
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    // Remove trailing slash (unless the entire string is "/")
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

static bool is_dot_name(const std::string& s) {
    return !s.empty() && s[0] == '.';
}

// Index of the ']' closing the class opened at `pi`, or npos.
// A ']' directly after '[' or '[!' is a literal member.
static size_t class_end(const std::string& pat, size_t pi) {
    size_t j = pi + 1;
    if (j < pat.size() && pat[j] == '!') j++;
    if (j < pat.size() && pat[j] == ']') j++;
    while (j < pat.size() && pat[j] != ']') j++;
    return j < pat.size() ? j : std::string::npos;
}

// Match a single segment against a pattern segment (no '/' in either).
// Supports *, ?, [abc], [a-z], [!...]. An unterminated '[' is literal.
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            // Consecutive stars in a single segment collapse
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (si >= str.size()) return false;

        if (pc == '?') {
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            size_t end = class_end(pat, pi);
            if (end != std::string::npos) {
                size_t ci = pi + 1;
                bool negate = false;
                if (pat[ci] == '!') {
                    negate = true;
                    ci++;
                }
                bool matched = false;
                char sc = str[si];
                while (ci < end) {
                    char lo = pat[ci];
                    if (ci + 2 < end && pat[ci + 1] == '-') {
                        char hi = pat[ci + 2];
                        if (sc >= lo && sc <= hi) matched = true;
                        ci += 3;
                    } else {
                        if (sc == lo) matched = true;
                        ci++;
                    }
                }
                if (negate) matched = !matched;
                if (!matched) return false;
                pi = end + 1;
                si++;
                continue;
            }
            // fall through: literal '['
        }

        if (pc != str[si]) return false;
        pi++;
        si++;
    }

    return si == str.size();
}

static bool segment_matches(const std::string& pat, const std::string& name, bool dot) {
    // "." and ".." only ever match themselves
    if ((name == "." || name == "..") && pat != name) return false;
    if (!dot && is_dot_name(name) && !is_dot_name(pat)) return false;
    return match_segment(pat, 0, name, 0);
}

// Recursive matching over path segments, handling '**'.
static bool match_segments(const std::vector<std::string>& pat_segs, size_t pi,
                           const std::vector<std::string>& path_segs, size_t si,
                           bool dot) {
    while (pi < pat_segs.size() && si < path_segs.size()) {
        const auto& ps = pat_segs[pi];

        if (ps == "**") {
            while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;
            if (pi == pat_segs.size()) {
                if (dot) return true;
                for (size_t k = si; k < path_segs.size(); k++) {
                    if (is_dot_name(path_segs[k])) return false;
                }
                return true;
            }
            // '**' never swallows a dot segment unless dot matching is on
            for (size_t k = si; k <= path_segs.size(); k++) {
                if (match_segments(pat_segs, pi, path_segs, k, dot)) return true;
                if (k < path_segs.size() && !dot && is_dot_name(path_segs[k])) return false;
            }
            return false;
        }

        if (!segment_matches(ps, path_segs[si], dot)) return false;
        pi++;
        si++;
    }

    while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;

    return pi == pat_segs.size() && si == path_segs.size();
}

// Appends the brace alternatives of `pat` to `out`; false on an unclosed '{'.
static bool expand_braces(const std::string& pat, std::vector<std::string>& out) {
    for (size_t i = 0; i < pat.size(); i++) {
        if (pat[i] != '{') continue;

        int depth = 0;
        size_t close = std::string::npos;
        std::vector<size_t> commas;
        for (size_t j = i; j < pat.size(); j++) {
            if (pat[j] == '{') {
                depth++;
            } else if (pat[j] == '}') {
                if (--depth == 0) {
                    close = j;
                    break;
                }
            } else if (pat[j] == ',' && depth == 1) {
                commas.push_back(j);
            }
        }
        if (close == std::string::npos) return false;
        if (commas.empty()) continue;

        std::string prefix = pat.substr(0, i);
        std::string suffix = pat.substr(close + 1);
        commas.push_back(close);
        size_t start = i + 1;
        for (size_t c : commas) {
            if (!expand_braces(prefix + pat.substr(start, c - start) + suffix, out)) {
                return false;
            }
            start = c + 1;
        }
        return true;
    }
    out.push_back(pat);
    return true;
}

static bool has_segment_magic(const std::string& seg) {
    return seg.find_first_of("*?[") != std::string::npos;
}

static std::string join_display(const std::string& display, const std::string& name) {
    if (display.empty()) return name;
    if (display.back() == '/') return display + name;
    return display + "/" + name;
}

// ---- Filesystem walk ----

namespace {

struct DirEntry {
    std::string name;
    bool is_dir = false;
    bool is_symlink = false;
};

Result<std::vector<DirEntry>> read_dir(const fs::path& dir) {
    std::vector<DirEntry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory ||
            ec == std::errc::not_a_directory) {
            return Result<std::vector<DirEntry>>::ok(std::move(entries));
        }
        return SiftError::io("cannot read directory", dir, ec);
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        DirEntry e;
        e.name = it->path().filename().string();
        std::error_code sec;
        e.is_symlink = it->is_symlink(sec);
        e.is_dir = it->is_directory(sec);
        entries.push_back(std::move(e));
    }
    if (ec) {
        return SiftError::io("error while reading directory", dir, ec);
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return Result<std::vector<DirEntry>>::ok(std::move(entries));
}

class Walker {
public:
    Walker(const GlobOptions& opts, const DirPruner& prune,
           std::vector<std::string> segs, std::set<std::string>& found)
        : opts_(opts), prune_(prune), segs_(std::move(segs)), found_(found) {}

    Status walk(const fs::path& dir, const std::string& display, size_t si) {
        if (prune_ && prune_(dir.generic_string())) {
            log::trace("glob: pruned %s", dir.generic_string().c_str());
            return ok_status();
        }

        const std::string& seg = segs_[si];
        bool last = si + 1 == segs_.size();

        if (seg == "**") {
            return walk_globstar(dir, display, si, last);
        }

        if (!has_segment_magic(seg)) {
            fs::path child = dir / seg;
            std::error_code ec;
            auto st = fs::status(child, ec);
            if (ec || !fs::exists(st)) return ok_status();
            bool is_dir = fs::is_directory(st);
            if (last) {
                add(join_display(display, seg), is_dir);
            } else if (is_dir) {
                return walk(child, join_display(display, seg), si + 1);
            }
            return ok_status();
        }

        SIFT_TRY_ASSIGN(auto entries, read_dir(dir));
        for (const auto& e : entries) {
            if (!segment_matches(seg, e.name, opts_.dot)) continue;
            if (last) {
                add(join_display(display, e.name), e.is_dir);
            } else if (e.is_dir) {
                SIFT_TRY(walk(dir / e.name, join_display(display, e.name), si + 1));
            }
        }
        return ok_status();
    }

private:
    Status walk_globstar(const fs::path& dir, const std::string& display,
                         size_t si, bool last) {
        // Zero directories consumed by '**'
        if (!last) {
            SIFT_TRY(walk(dir, display, si + 1));
        }

        SIFT_TRY_ASSIGN(auto entries, read_dir(dir));
        for (const auto& e : entries) {
            if (!opts_.dot && is_dot_name(e.name)) continue;
            std::string shown = join_display(display, e.name);
            if (e.is_dir && !e.is_symlink) {
                if (last) add(shown, true);
                SIFT_TRY(walk(dir / e.name, shown, si));
            } else if (last) {
                add(shown, e.is_dir);
            }
        }
        return ok_status();
    }

    void add(const std::string& path, bool is_dir) {
        if (is_dir && opts_.nodir) return;
        found_.insert(path);
    }

    const GlobOptions& opts_;
    const DirPruner& prune_;
    std::vector<std::string> segs_;
    std::set<std::string>& found_;
};

} // namespace

// ---- Public API ----

bool glob_match(const std::string& pattern, const std::string& path, bool dot) {
    auto alternatives = glob_brace_expand(pattern);

    auto path_segs = split_segments(normalize_path(path));
    for (const auto& alt : alternatives) {
        auto pat_segs = split_segments(normalize_path(alt));
        if (match_segments(pat_segs, 0, path_segs, 0, dot)) return true;
    }
    return false;
}

std::vector<std::string> glob_brace_expand(const std::string& pattern) {
    std::vector<std::string> out;
    if (!expand_braces(pattern, out)) {
        // Unbalanced braces match literally
        out.assign(1, pattern);
    }
    return out;
}

Result<std::vector<std::string>> glob_expand(
    const std::string& pattern,
    const GlobOptions& opts,
    const DirPruner& prune)
{
    std::vector<std::string> results;
    if (pattern.empty()) {
        return Result<std::vector<std::string>>::ok(std::move(results));
    }
    auto alternatives = glob_brace_expand(pattern);
    SIFT_TRY_ASSIGN(fs::path cwd, effective_cwd(opts.cwd));
    std::set<std::string> found;

    for (const auto& alt : alternatives) {
        auto norm = normalize_path(alt);
        auto segs = split_segments(norm);
        bool absolute = !norm.empty() && norm[0] == '/';

        size_t literal = 0;
        while (literal < segs.size() && !has_segment_magic(segs[literal])) literal++;

        if (literal == segs.size()) {
            // No wildcards: the pattern names one path
            std::error_code ec;
            auto st = fs::status(resolve_path(cwd, norm), ec);
            if (!ec && fs::exists(st) && !(opts.nodir && fs::is_directory(st))) {
                found.insert(norm);
            }
            continue;
        }

        std::string display;
        for (size_t i = 0; i < literal; i++) {
            if (i > 0) display += "/";
            display += segs[i];
        }
        if (display.empty() && absolute) display = "/";

        fs::path root = display.empty() ? cwd : resolve_path(cwd, display);
        std::vector<std::string> rest(segs.begin() + literal, segs.end());

        log::trace("glob: walking '%s' from %s", alt.c_str(), root.generic_string().c_str());
        Walker walker(opts, prune, std::move(rest), found);
        SIFT_TRY(walker.walk(root, display, 0));
    }

    results.assign(found.begin(), found.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

} // namespace sift
