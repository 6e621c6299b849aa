#include <catch2/catch.hpp>
#include <sift/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>

#include <unistd.h>

using namespace sift::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    if (pipe(pipefd) != 0) return "";
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, n);
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    set_level(Trace);
    REQUIRE(get_level() == Trace);
    set_level(Error);
    REQUIRE(get_level() == Error);
    set_level(Info);
}

TEST_CASE("parse_level accepts names in any case", "[log]") {
    REQUIRE(parse_level("debug") == Debug);
    REQUIRE(parse_level("TRACE") == Trace);
    REQUIRE(parse_level("Warning") == Warn);
    REQUIRE(parse_level("warn") == Warn);
    REQUIRE(parse_level("error") == Error);
    REQUIRE_FALSE(parse_level("loud").has_value());
}

TEST_CASE("init_from_env reads the level", "[log]") {
    set_level(Info);
    setenv("SIFT_TEST_LOG_LEVEL", "debug", 1);
    REQUIRE(init_from_env("SIFT_TEST_LOG_LEVEL"));
    REQUIRE(get_level() == Debug);

    setenv("SIFT_TEST_LOG_LEVEL", "nonsense", 1);
    REQUIRE_FALSE(init_from_env("SIFT_TEST_LOG_LEVEL"));
    REQUIRE(get_level() == Debug);

    unsetenv("SIFT_TEST_LOG_LEVEL");
    REQUIRE_FALSE(init_from_env("SIFT_TEST_LOG_LEVEL"));
    set_level(Info);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_stderr([] { debug("glob matched %d files", 3); });
    REQUIRE(output.empty());
    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_stderr([] {
        warn("ignore file %s not found", ".siftignore");
        error("cannot read %s", "src");
    });
    REQUIRE(output.find("warn: ignore file .siftignore not found") != std::string::npos);
    REQUIRE(output.find("error: cannot read src") != std::string::npos);
    set_level(Info);
}

TEST_CASE("Color output wraps the level", "[log]") {
    set_level(Info);
    set_color_enabled(true);
    auto output = capture_stderr([] { info("hello"); });
    REQUIRE(output.find("\033[32m") != std::string::npos);
    REQUIRE(output.find("hello") != std::string::npos);
    set_color_enabled(false);
}

TEST_CASE("Each level function writes its own prefix", "[log]") {
    set_level(Trace);
    set_color_enabled(false);
    auto output = capture_stderr([] {
        trace("t %d", 1);
        debug("d %d", 2);
        info("i %d", 3);
        warn("w %d", 4);
        error("e %d", 5);
    });
    REQUIRE(output == "sift trace: t 1\nsift debug: d 2\nsift info: i 3\n"
                      "sift warn: w 4\nsift error: e 5\n");
    set_level(Info);
}
