#include <sift/ignore.hpp>
#include <sift/glob.hpp>
#include <sift/path_util.hpp>

namespace sift {

static std::string trim_trailing_spaces(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && (s[end - 1] == ' ' || s[end - 1] == '\t')) end--;
    return s.substr(0, end);
}

static std::string basename_of(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

void IgnoreRules::add(const std::string& line) {
    std::string text = trim_trailing_spaces(line);
    if (text.empty() || text[0] == '#') return;

    IgnoreRule rule;
    rule.source = line;

    if (text[0] == '!') {
        rule.negated = true;
        text.erase(0, 1);
    } else if (text.size() > 1 && text[0] == '\\' &&
               (text[1] == '#' || text[1] == '!')) {
        text.erase(0, 1);
    }

    if (!text.empty() && text.back() == '/') {
        rule.dir_only = true;
        while (!text.empty() && text.back() == '/') text.pop_back();
    }

    if (!text.empty() && text[0] == '/') {
        rule.anchored = true;
        while (!text.empty() && text[0] == '/') text.erase(0, 1);
    } else if (text.find('/') != std::string::npos) {
        rule.anchored = true;
    }

    if (text.empty()) return;
    rule.pattern = std::move(text);
    rules_.push_back(std::move(rule));
}

void IgnoreRules::add(const std::vector<std::string>& lines) {
    for (const auto& line : lines) add(line);
}

void IgnoreRules::append(const IgnoreRules& other) {
    rules_.insert(rules_.end(), other.rules_.begin(), other.rules_.end());
}

std::optional<bool> IgnoreRules::decide(const std::string& candidate, bool is_dir) const {
    std::optional<bool> verdict;
    std::string base = basename_of(candidate);

    for (const auto& rule : rules_) {
        if (rule.dir_only && !is_dir) continue;
        const std::string& subject = rule.anchored ? candidate : base;
        if (glob_match(rule.pattern, subject, true)) {
            verdict = !rule.negated;
        }
    }
    return verdict;
}

bool IgnoreRules::ignores(const std::string& relative_path, bool is_dir) const {
    std::string path = to_posix(relative_path);
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
        is_dir = true;
    }
    if (path.empty() || rules_.empty()) return false;

    // Ancestors first: nothing below an ignored directory can be re-included
    for (size_t pos = path.find('/'); pos != std::string::npos;
         pos = path.find('/', pos + 1)) {
        if (pos == 0) continue;
        if (decide(path.substr(0, pos), true).value_or(false)) return true;
    }

    return decide(path, is_dir).value_or(false);
}

std::vector<std::string> IgnoreRules::split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string cur;
    for (char c : text) {
        if (c == '\n') {
            if (!cur.empty() && cur.back() == '\r') cur.pop_back();
            if (!cur.empty()) lines.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && cur.back() == '\r') cur.pop_back();
    if (!cur.empty()) lines.push_back(cur);
    return lines;
}

} // namespace sift
