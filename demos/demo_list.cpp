// demo_list.cpp
//
// Prints the files a lint run would visit for the given patterns. Run it
// from a project directory:
//
//     ./demo_list src/ test/               # directories -> **/*.js globs
//     ./demo_list --ext .js,.jsx src       # several extensions
//     ./demo_list --config sift.toml src   # options from a [files] table
//     ./demo_list --no-ignore node_modules/pkg/index.js
//
// Set SIFT_LOG=debug to watch pattern resolution on stderr.

#include <sift/file_finder.hpp>
#include <sift/log.hpp>
#include <sift/options.hpp>
#include <sift/result.hpp>

#include <cstdio>
#include <string>
#include <vector>

using namespace sift;

struct Args {
    Options options;
    std::string config_path;
    std::vector<std::string> patterns;
};

static std::vector<std::string> split_commas(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];

        // Flags that take a value
        if (a == "--ext" || a == "--config" || a == "--cwd" ||
            a == "--ignore-path" || a == "--ignore-pattern") {
            if (i + 1 >= argc) {
                return SiftError{SiftError::InvalidArg,
                    "missing value for " + a,
                    "usage: demo_list [options] <pattern>..."};
            }
            std::string v = argv[++i];
            if (a == "--ext") args.options.extensions = split_commas(v);
            else if (a == "--config") args.config_path = v;
            else if (a == "--cwd") args.options.cwd = v;
            else if (a == "--ignore-path") args.options.ignore_path = v;
            else args.options.ignore_patterns.push_back(v);
        } else if (a == "--no-ignore") {
            args.options.ignore = false;
            args.options.ignore_set = true;
        } else if (a == "--dotfiles") {
            args.options.dotfiles = true;
        } else if (a.size() > 1 && a[0] == '-' && a[1] == '-') {
            return SiftError{SiftError::InvalidArg, "unknown flag " + a};
        } else {
            args.patterns.push_back(a);
        }
    }

    if (args.patterns.empty()) {
        return SiftError{SiftError::InvalidArg,
            "no patterns given",
            "usage: demo_list [options] <pattern>..."};
    }
    return Result<Args>::ok(std::move(args));
}

// Config file first, then command-line flags on top.
static Result<Options> effective_options(const Args& args) {
    if (args.config_path.empty()) {
        return Result<Options>::ok(args.options);
    }
    SIFT_TRY_ASSIGN(Options opts, Options::load(args.config_path));
    opts.merge(args.options);
    return Result<Options>::ok(std::move(opts));
}

static Status run(int argc, char** argv) {
    SIFT_TRY_ASSIGN(Args args, parse_args(argc, argv));
    SIFT_TRY_ASSIGN(Options opts, effective_options(args));

    SIFT_TRY_ASSIGN(auto patterns, resolve_file_glob_patterns(args.patterns, opts));
    for (const auto& p : patterns) {
        log::debug("pattern: %s", p.c_str());
    }

    SIFT_TRY_ASSIGN(auto files, list_files_to_process(patterns, opts));

    size_t ignored = 0;
    for (const auto& f : files) {
        if (f.ignored) {
            ignored++;
            log::warn("%s: file ignored because of a matching ignore pattern",
                      f.filename.c_str());
            continue;
        }
        std::printf("%s\n", f.filename.c_str());
    }
    log::info("%zu files, %zu ignored", files.size() - ignored, ignored);
    return ok_status();
}

int main(int argc, char** argv) {
    log::init_from_env();

    auto status = run(argc, argv);
    if (status.is_err()) {
        std::fprintf(stderr, "%s\n", status.error().format().c_str());
        return 1;
    }
    return 0;
}
