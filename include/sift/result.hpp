#pragma once

#include <sift/error.hpp>
#include <variant>
#include <utility>

namespace sift {

template<typename T>
class Result {
    std::variant<T, SiftError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from SiftError so SIFT_TRY can return errors across Result<T> types
    Result(SiftError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(SiftError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<SiftError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    SiftError& error() & { return std::get<SiftError>(data_); }
    const SiftError& error() const& { return std::get<SiftError>(data_); }
    SiftError&& error() && { return std::get<SiftError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SIFT_TRY(expr) \
    do { \
        auto _sift_result = (expr); \
        if (_sift_result.is_err()) return std::move(_sift_result).error(); \
    } while(0)

#define SIFT_CONCAT_INNER(a, b) a##b
#define SIFT_CONCAT(a, b) SIFT_CONCAT_INNER(a, b)

// Declares `decl` from the value of a Result expression, or returns its error.
//   SIFT_TRY_ASSIGN(auto rules, IgnoreRules::from_file(p));
#define SIFT_TRY_ASSIGN(decl, expr) \
    SIFT_TRY_ASSIGN_IMPL(SIFT_CONCAT(_sift_tmp_, __LINE__), decl, expr)

#define SIFT_TRY_ASSIGN_IMPL(tmp, decl, expr) \
    auto tmp = (expr); \
    if (tmp.is_err()) return std::move(tmp).error(); \
    decl = std::move(tmp).value()

} // namespace sift
