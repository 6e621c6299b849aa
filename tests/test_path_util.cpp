#include <catch2/catch.hpp>
#include <sift/path_util.hpp>
#include "temp_dir.hpp"

using namespace sift;

TEST_CASE("to_posix converts backslashes", "[path]") {
    REQUIRE(to_posix("src\\lib\\a.js") == "src/lib/a.js");
    REQUIRE(to_posix("src/lib") == "src/lib");
    REQUIRE(to_posix("") == "");
}

TEST_CASE("resolve_path joins relative paths onto the base", "[path]") {
    REQUIRE(resolve_path("/work/app", "src/a.js") == fs::path("/work/app/src/a.js"));
    REQUIRE(resolve_path("/work/app", "./src/../lib/") == fs::path("/work/app/lib"));
    REQUIRE(resolve_path("/work/app", "../other") == fs::path("/work/other"));
}

TEST_CASE("resolve_path keeps absolute paths", "[path]") {
    REQUIRE(resolve_path("/work/app", "/etc/hosts") == fs::path("/etc/hosts"));
    REQUIRE(resolve_path("/work/app", "/") == fs::path("/"));
}

TEST_CASE("effective_cwd falls back to the process cwd", "[path]") {
    auto cwd = fs::current_path();
    auto empty = effective_cwd("");
    REQUIRE(empty.is_ok());
    REQUIRE(empty.value() == cwd);

    auto rel = effective_cwd("sub/dir/");
    REQUIRE(rel.is_ok());
    REQUIRE(rel.value() == (cwd / "sub/dir").lexically_normal());

    auto abs = effective_cwd("/work/app/");
    REQUIRE(abs.is_ok());
    REQUIRE(abs.value() == fs::path("/work/app"));
}

TEST_CASE("effective_cwd fails when the process cwd is gone", "[path]") {
    OrphanedCwd orphan;

    auto empty = effective_cwd("");
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == SiftError::IO);

    auto rel = effective_cwd("src");
    REQUIRE(rel.is_err());
    REQUIRE(rel.error().code == SiftError::IO);

    // An absolute cwd never consults the process directory
    REQUIRE(effective_cwd("/work/app").is_ok());
}

TEST_CASE("relative_posix", "[path]") {
    REQUIRE(relative_posix("/work/app/src/a.js", "/work/app") == "src/a.js");
    REQUIRE(relative_posix("/work/lib/b.js", "/work/app") == "../lib/b.js");
    REQUIRE(relative_posix("/work/app", "/work/app/") == "");
}
