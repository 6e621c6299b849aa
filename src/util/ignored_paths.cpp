#include <sift/ignored_paths.hpp>
#include <sift/log.hpp>
#include <sift/path_util.hpp>
#include <fstream>
#include <sstream>

namespace sift {

namespace fs = std::filesystem;

const std::vector<std::string>& IgnoredPaths::default_patterns() {
    static const std::vector<std::string> patterns = {
        "/node_modules/*",
        "/bower_components/*"
    };
    return patterns;
}

static bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

static Result<std::vector<std::string>> read_ignore_file(const fs::path& path) {
    if (!is_file(path)) {
        return SiftError{SiftError::IO,
            "Cannot read ignore file: " + path.generic_string(),
            "the ignore file must be a regular file",
            path.generic_string(), 0};
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return SiftError{SiftError::IO,
            "Cannot read ignore file: " + path.generic_string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return SiftError{SiftError::IO,
            "Cannot read ignore file: " + path.generic_string(),
            "", path.generic_string(), 0};
    }
    return Result<std::vector<std::string>>::ok(IgnoreRules::split_lines(ss.str()));
}

Result<IgnoredPaths> IgnoredPaths::create(const Options& options) {
    IgnoredPaths ip;
    SIFT_TRY_ASSIGN(ip.cwd_, effective_cwd(options.cwd));
    ip.base_dir_ = ip.cwd_;
    ip.dotfiles_ = options.dotfiles.value_or(false);
    ip.ignore_ = options.ignore;

    ip.default_.add(default_patterns());
    if (!ip.dotfiles_) {
        // Dotfiles, but not parent directories ("../" in relative form)
        ip.default_.add(std::vector<std::string>{".*", "!../"});
    }

    if (!options.ignore) {
        return Result<IgnoredPaths>::ok(std::move(ip));
    }

    fs::path ignore_file;
    if (!options.ignore_path.empty()) {
        log::debug("using ignore file %s", options.ignore_path.c_str());
        ignore_file = resolve_path(ip.cwd_, options.ignore_path);
        if (!is_file(ignore_file)) {
            return SiftError{SiftError::IO,
                "Cannot read ignore file: " + options.ignore_path,
                "check the ignore-path setting",
                ignore_file.generic_string(), 0};
        }
    } else {
        log::debug("looking for %s in %s", kIgnoreFileName, ip.cwd_.generic_string().c_str());
        fs::path candidate = ip.cwd_ / kIgnoreFileName;
        if (is_file(candidate)) {
            ignore_file = candidate;
        } else {
            log::debug("no %s in cwd", kIgnoreFileName);
        }
    }

    if (!ignore_file.empty()) {
        SIFT_TRY_ASSIGN(auto lines, read_ignore_file(ignore_file));
        log::debug("loaded %zu ignore rules from %s", lines.size(),
                   ignore_file.generic_string().c_str());
        ip.base_dir_ = ignore_file.parent_path();
        ip.custom_.add(lines);
        ip.default_.add(lines);
    } else {
        fs::path manifest = ip.cwd_ / kManifestName;
        if (is_file(manifest)) {
            SIFT_TRY_ASSIGN(auto paths, read_manifest_ignores(manifest));
            if (!paths.empty()) {
                log::debug("loaded %zu ignore paths from %s", paths.size(),
                           manifest.generic_string().c_str());
            }
            ip.custom_.add(paths);
            ip.default_.add(paths);
        }
    }

    ip.custom_.add(options.ignore_patterns);
    ip.default_.add(options.ignore_patterns);

    return Result<IgnoredPaths>::ok(std::move(ip));
}

bool IgnoredPaths::contains(const std::string& path, Tier tier) const {
    fs::path absolute = resolve_path(cwd_, path);
    std::string rel = relative_posix(absolute, base_dir_);
    if (rel.empty()) return false;

    switch (tier) {
        case Tier::Default: return default_.ignores(rel);
        case Tier::Custom:  return custom_.ignores(rel);
        case Tier::Any:     return default_.ignores(rel) || custom_.ignores(rel);
    }
    return false;
}

DirPruner IgnoredPaths::folder_checker() const {
    IgnoreRules folders;
    folders.add(default_patterns());
    if (!dotfiles_) {
        // Hidden folders. Not ".*", which would make hidden files impossible
        // to re-include.
        folders.add(std::vector<std::string>{".*/*", "!../"});
    }
    if (ignore_) {
        folders.append(custom_);
    }

    fs::path base = cwd_;
    return [folders = std::move(folders), base](const std::string& absolute_dir) {
        std::string rel = relative_posix(fs::path(absolute_dir), base);
        if (rel.empty()) return false;
        return folders.ignores(rel, true);
    };
}

const IgnoreRules& IgnoredPaths::rules(Tier tier) const {
    return tier == Tier::Custom ? custom_ : default_;
}

} // namespace sift
