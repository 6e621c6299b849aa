#pragma once

#include <string>
#include <system_error>
#include <filesystem>

namespace sift {

struct SiftError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    SiftError() = default;
    SiftError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SiftError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SiftError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Filesystem fault on `path`: "<what> '<path>': <ec.message()>"
    static SiftError io(const std::string& what,
                        const std::filesystem::path& path,
                        const std::error_code& ec);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace sift
