#include <sift/options.hpp>
#include <sift/path_util.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace sift {

namespace fs = std::filesystem;

static Result<std::string> read_text(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return SiftError{SiftError::IO,
            "cannot read file: " + path.generic_string(),
            "expected a regular file", path.generic_string(), 0};
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return SiftError{SiftError::IO,
            "cannot open file: " + path.generic_string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return SiftError{SiftError::IO,
            "error while reading file: " + path.generic_string(),
            "", path.generic_string(), 0};
    }
    return Result<std::string>::ok(ss.str());
}

static Result<toml::table> parse_toml(const std::string& toml_str, const std::string& what) {
    try {
        return Result<toml::table>::ok(toml::parse(toml_str));
    } catch (const toml::parse_error& e) {
        return SiftError{SiftError::Parse,
            what + " TOML parse error: " + std::string(e.description())};
    }
}

// A string or an array of strings.
static Result<std::vector<std::string>> string_list(const toml::node& node,
                                                    const std::string& key) {
    std::vector<std::string> out;
    if (auto s = node.value<std::string>()) {
        out.push_back(*s);
        return Result<std::vector<std::string>>::ok(std::move(out));
    }
    auto arr = node.as_array();
    if (!arr) {
        return SiftError{SiftError::Config,
            "'" + key + "' must be a string or an array of strings"};
    }
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) {
            return SiftError{SiftError::Config,
                "'" + key + "' must contain only strings"};
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

std::vector<std::string> Options::effective_extensions() const {
    if (extensions.empty()) return {".js"};
    return extensions;
}

Result<Options> Options::parse(const std::string& toml_str) {
    SIFT_TRY_ASSIGN(auto doc, parse_toml(toml_str, "config"));

    Options opts;
    auto files = doc["files"].as_table();
    if (!files) {
        return Result<Options>::ok(std::move(opts));
    }

    if (auto node = files->get("cwd")) {
        auto s = node->value<std::string>();
        if (!s) return SiftError{SiftError::Config, "'cwd' must be a string"};
        opts.cwd = *s;
    }

    if (auto node = files->get("extensions")) {
        SIFT_TRY_ASSIGN(opts.extensions, string_list(*node, "extensions"));
    }

    if (auto node = files->get("ignore")) {
        auto b = node->value<bool>();
        if (!b) return SiftError{SiftError::Config, "'ignore' must be a boolean"};
        opts.ignore = *b;
        opts.ignore_set = true;
    }

    if (auto node = files->get("ignore-path")) {
        auto s = node->value<std::string>();
        if (!s) return SiftError{SiftError::Config, "'ignore-path' must be a string"};
        opts.ignore_path = *s;
    }

    if (auto node = files->get("ignore-pattern")) {
        SIFT_TRY_ASSIGN(opts.ignore_patterns, string_list(*node, "ignore-pattern"));
    }

    if (auto node = files->get("dotfiles")) {
        auto b = node->value<bool>();
        if (!b) return SiftError{SiftError::Config, "'dotfiles' must be a boolean"};
        opts.dotfiles = *b;
    }

    return Result<Options>::ok(std::move(opts));
}

Result<Options> Options::load(const fs::path& path) {
    SIFT_TRY_ASSIGN(auto text, read_text(path));
    auto r = Options::parse(text);
    if (r.is_err()) {
        r.error().file = path.generic_string();
        return r;
    }

    Options opts = std::move(r).value();
    if (!opts.cwd.empty() && opts.cwd.is_relative()) {
        SIFT_TRY_ASSIGN(fs::path config_dir, effective_cwd(path.parent_path()));
        opts.cwd = resolve_path(config_dir, opts.cwd.string());
    }
    return Result<Options>::ok(std::move(opts));
}

void Options::merge(const Options& other) {
    if (!other.cwd.empty()) cwd = other.cwd;
    if (!other.extensions.empty()) extensions = other.extensions;
    if (other.ignore_set) {
        ignore = other.ignore;
        ignore_set = true;
    }
    if (!other.ignore_path.empty()) ignore_path = other.ignore_path;
    ignore_patterns.insert(ignore_patterns.end(),
                           other.ignore_patterns.begin(), other.ignore_patterns.end());
    if (other.dotfiles.has_value()) dotfiles = other.dotfiles;
}

Result<std::vector<std::string>> read_manifest_ignores(const fs::path& path) {
    SIFT_TRY_ASSIGN(auto text, read_text(path));
    SIFT_TRY_ASSIGN(auto doc, parse_toml(text, path.filename().string()));

    std::vector<std::string> paths;
    auto node = doc["ignore"]["paths"].node();
    if (!node) {
        return Result<std::vector<std::string>>::ok(std::move(paths));
    }

    auto arr = node->as_array();
    if (!arr) {
        return SiftError{SiftError::Config,
            "[ignore] paths requires an array of paths",
            "write it as paths = [\"dist/\", \"*.min.js\"]",
            path.generic_string(), 0};
    }
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) {
            return SiftError{SiftError::Config,
                "[ignore] paths must contain only strings", "",
                path.generic_string(), 0};
        }
        paths.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(paths));
}

} // namespace sift
