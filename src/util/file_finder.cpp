#include <sift/file_finder.hpp>
#include <sift/glob.hpp>
#include <sift/ignored_paths.hpp>
#include <sift/log.hpp>
#include <sift/path_util.hpp>
#include <map>
#include <regex>
#include <unordered_set>

namespace sift {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Pattern resolution
// ---------------------------------------------------------------------------

Result<PathProcessor> make_path_processor(const Options& options) {
    SIFT_TRY_ASSIGN(fs::path cwd, effective_cwd(options.cwd));

    std::vector<std::string> exts = options.effective_extensions();
    for (auto& ext : exts) {
        if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
    }

    std::string suffix = "/**";
    if (exts.size() == 1) {
        suffix += "/*." + exts[0];
    } else {
        suffix += "/*.{";
        for (size_t i = 0; i < exts.size(); i++) {
            if (i > 0) suffix += ",";
            suffix += exts[i];
        }
        suffix += "}";
    }

    PathProcessor process = [cwd, suffix](const std::string& pathname) {
        std::string new_path = pathname;
        std::error_code ec;
        if (fs::is_directory(resolve_path(cwd, pathname), ec)) {
            if (!new_path.empty() && (new_path.back() == '/' || new_path.back() == '\\')) {
                new_path.pop_back();
            }
            new_path += suffix;
        }
        return to_posix(new_path);
    };
    return Result<PathProcessor>::ok(std::move(process));
}

Result<std::vector<std::string>> resolve_file_glob_patterns(
    const std::vector<std::string>& patterns,
    const Options& options)
{
    SIFT_TRY_ASSIGN(auto process, make_path_processor(options));

    std::vector<std::string> out;
    out.reserve(patterns.size());
    for (const auto& p : patterns) {
        if (p.empty()) continue;
        out.push_back(process(p));
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

bool is_dotfile_pattern(const std::string& pattern) {
    // ".hidden" or "/.hidden", but not "./relative" or "../relative"
    static const std::regex dotfiles(R"((?:(?:^\.)|(?:[/\\]\.))[^/\\.].*)");
    return std::regex_search(pattern, dotfiles);
}

// ---------------------------------------------------------------------------
// File collection
// ---------------------------------------------------------------------------

namespace {

class FileCollector {
public:
    FileCollector(const Options& options, fs::path cwd)
        : options_(options), cwd_(std::move(cwd)) {}

    Status collect(const std::string& pattern) {
        fs::path file = resolve_path(cwd_, pattern);
        std::error_code ec;

        if (fs::is_regular_file(file, ec)) {
            SIFT_TRY_ASSIGN(const IgnoredPaths* ignored, engine_for(options_));
            fs::path real = fs::canonical(file, ec);
            if (ec) {
                return SiftError::io("cannot resolve real path of", file, ec);
            }
            log::debug("direct path %s", real.generic_string().c_str());
            add_file(real.string(), true, *ignored);
            return ok_status();
        }

        Options variant = options_;
        if (!options_.dotfiles.value_or(false)) {
            variant.dotfiles = is_dotfile_pattern(pattern);
        }
        SIFT_TRY_ASSIGN(const IgnoredPaths* ignored, engine_for(variant));

        GlobOptions glob_opts;
        glob_opts.cwd = cwd_;
        glob_opts.dot = true;
        glob_opts.nodir = true;

        SIFT_TRY_ASSIGN(auto matches,
                        glob_expand(pattern, glob_opts, ignored->folder_checker()));
        log::debug("glob '%s' matched %zu files", pattern.c_str(), matches.size());

        for (const auto& match : matches) {
            add_file(resolve_path(cwd_, match).string(), false, *ignored);
        }
        return ok_status();
    }

    std::vector<FileRecord> take() { return std::move(files_); }

private:
    // One engine per effective dotfiles setting, built on first use.
    Result<const IgnoredPaths*> engine_for(const Options& variant) {
        bool key = variant.dotfiles.value_or(false);
        auto it = engines_.find(key);
        if (it == engines_.end()) {
            log::debug("building ignore rules (dotfiles %s)", key ? "on" : "off");
            SIFT_TRY_ASSIGN(auto built, IgnoredPaths::create(variant));
            it = engines_.emplace(key, std::move(built)).first;
        }
        return Result<const IgnoredPaths*>::ok(&it->second);
    }

    void add_file(const std::string& filename, bool is_direct_path,
                  const IgnoredPaths& ignored) {
        if (added_.count(filename)) return;

        bool process_custom = options_.ignore;
        bool matches_ignore = ignored.contains(filename, Tier::Default) ||
            (process_custom && ignored.contains(filename, Tier::Custom));

        if (matches_ignore && is_direct_path && options_.ignore) {
            files_.push_back(FileRecord{filename, true});
            added_.insert(filename);
        } else if (!matches_ignore || (is_direct_path && !options_.ignore)) {
            files_.push_back(FileRecord{filename, false});
            added_.insert(filename);
        } else {
            log::trace("ignored %s", filename.c_str());
        }
    }

    const Options& options_;
    fs::path cwd_;
    std::map<bool, IgnoredPaths> engines_;
    std::vector<FileRecord> files_;
    std::unordered_set<std::string> added_;
};

} // namespace

Result<std::vector<FileRecord>> list_files_to_process(
    const std::vector<std::string>& glob_patterns,
    const Options& options)
{
    log::debug("creating list of files to process");
    SIFT_TRY_ASSIGN(fs::path cwd, effective_cwd(options.cwd));
    FileCollector collector(options, std::move(cwd));
    for (const auto& pattern : glob_patterns) {
        SIFT_TRY(collector.collect(pattern));
    }
    return Result<std::vector<FileRecord>>::ok(collector.take());
}

Result<std::vector<FileRecord>> list_files_to_process(
    const std::vector<std::string>& glob_patterns)
{
    return list_files_to_process(glob_patterns, Options{});
}

} // namespace sift
