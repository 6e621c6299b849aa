#include <sift/error.hpp>

namespace sift {

const char* SiftError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

SiftError SiftError::io(const std::string& what,
                        const std::filesystem::path& path,
                        const std::error_code& ec) {
    std::string msg = what + " '" + path.generic_string() + "'";
    if (ec) {
        msg += ": ";
        msg += ec.message();
    }
    SiftError err(IO, std::move(msg));
    err.file = path.string();
    return err;
}

std::string SiftError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace sift
