#include <catch2/catch.hpp>
#include <sift/options.hpp>
#include "temp_dir.hpp"

using namespace sift;

TEST_CASE("defaults", "[options]") {
    Options opts;
    REQUIRE(opts.ignore);
    REQUIRE_FALSE(opts.dotfiles.has_value());
    REQUIRE(opts.cwd.empty());
    REQUIRE(opts.effective_extensions() == std::vector<std::string>{".js"});
}

TEST_CASE("parse [files] table", "[options]") {
    auto r = Options::parse(R"(
[files]
cwd = "project"
extensions = [".js", "jsx"]
ignore = false
ignore-path = "config/.siftignore"
ignore-pattern = ["dist/**", "*.min.js"]
dotfiles = true
)");
    REQUIRE(r.is_ok());
    const auto& o = r.value();
    REQUIRE(o.cwd == fs::path("project"));
    REQUIRE(o.effective_extensions() == std::vector<std::string>{".js", "jsx"});
    REQUIRE_FALSE(o.ignore);
    REQUIRE(o.ignore_set);
    REQUIRE(o.ignore_path == "config/.siftignore");
    REQUIRE(o.ignore_patterns == std::vector<std::string>{"dist/**", "*.min.js"});
    REQUIRE(o.dotfiles == true);
}

TEST_CASE("ignore-pattern accepts a single string", "[options]") {
    auto r = Options::parse("[files]\nignore-pattern = \"build/\"\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().ignore_patterns == std::vector<std::string>{"build/"});
}

TEST_CASE("missing [files] table gives defaults", "[options]") {
    auto r = Options::parse("[other]\nx = 1\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().ignore);
    REQUIRE_FALSE(r.value().ignore_set);
}

TEST_CASE("wrong value types are Config errors", "[options]") {
    auto a = Options::parse("[files]\nignore = \"yes\"\n");
    REQUIRE(a.is_err());
    REQUIRE(a.error().code == SiftError::Config);

    auto b = Options::parse("[files]\nextensions = [\".js\", 3]\n");
    REQUIRE(b.is_err());
    REQUIRE(b.error().code == SiftError::Config);

    auto c = Options::parse("[files]\ndotfiles = 1\n");
    REQUIRE(c.is_err());
    REQUIRE(c.error().code == SiftError::Config);
}

TEST_CASE("invalid TOML is a Parse error", "[options]") {
    auto r = Options::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiftError::Parse);
}

TEST_CASE("load resolves a relative cwd against the file", "[options]") {
    TempDir td;
    td.write_file("conf/sift.toml", "[files]\ncwd = \"../app\"\nextensions = [\".ts\"]\n");

    auto r = Options::load(td.path / "conf/sift.toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().cwd == td.path / "app");
    REQUIRE(r.value().extensions == std::vector<std::string>{".ts"});
}

TEST_CASE("load of a missing file is an IO error", "[options]") {
    TempDir td;
    auto r = Options::load(td.path / "nope.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiftError::IO);
}

TEST_CASE("load of a directory is an IO error", "[options]") {
    TempDir td;
    td.make_dir("sift.toml");
    auto r = Options::load(td.path / "sift.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SiftError::IO);

    auto ignores = read_manifest_ignores(td.path / "sift.toml");
    REQUIRE(ignores.is_err());
    REQUIRE(ignores.error().code == SiftError::IO);
}

TEST_CASE("load tags parse errors with the file", "[options]") {
    TempDir td;
    td.write_file("sift.toml", "[files\n");
    auto r = Options::load(td.path / "sift.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().file == (td.path / "sift.toml").generic_string());
}

TEST_CASE("merge layers explicitly-set fields", "[options]") {
    Options base;
    base.extensions = {".js"};
    base.ignore_patterns = {"dist/"};

    Options cli;
    cli.ignore = false;
    cli.ignore_set = true;
    cli.ignore_patterns = {"tmp/"};
    cli.dotfiles = true;

    base.merge(cli);
    REQUIRE_FALSE(base.ignore);
    REQUIRE(base.extensions == std::vector<std::string>{".js"});
    REQUIRE(base.ignore_patterns == std::vector<std::string>{"dist/", "tmp/"});
    REQUIRE(base.dotfiles == true);

    Options untouched;
    base.merge(untouched);
    REQUIRE_FALSE(base.ignore);
}

TEST_CASE("read_manifest_ignores", "[options]") {
    TempDir td;
    td.write_file("sift.toml", "[ignore]\npaths = [\"dist/\", \"*.min.js\"]\n");
    auto r = read_manifest_ignores(td.path / "sift.toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"dist/", "*.min.js"});

    td.write_file("none.toml", "[files]\nignore = true\n");
    auto none = read_manifest_ignores(td.path / "none.toml");
    REQUIRE(none.is_ok());
    REQUIRE(none.value().empty());

    td.write_file("bad.toml", "[ignore]\npaths = \"dist/\"\n");
    auto bad = read_manifest_ignores(td.path / "bad.toml");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == SiftError::Config);
}
