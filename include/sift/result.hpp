#pragma once

#include <sift/error.hpp>
#include <string>
#include <utility>
#include <variant>

namespace sift {

// Value or SiftError. Store and query code returns this instead of throwing.
template<typename T>
class Result {
    std::variant<T, SiftError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit so an error propagates across Result<T> types.
    Result(SiftError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    SiftError& error() & { return std::get<1>(data_); }
    const SiftError& error() const& { return std::get<1>(data_); }
    SiftError&& error() && { return std::get<1>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    // Prefixes the message of an error with the store or step that failed.
    Result context(const std::string& what) && {
        if (is_err()) {
            SiftError& e = std::get<1>(data_);
            e.message = what + ": " + e.message;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define SIFT_TRY(expr) \
    do { \
        auto _sift_result = (expr); \
        if (_sift_result.is_err()) return std::move(_sift_result).error(); \
    } while (0)

#define SIFT_CONCAT_INNER_(a, b) a##b
#define SIFT_CONCAT_(a, b) SIFT_CONCAT_INNER_(a, b)
#define SIFT_TRY_ASSIGN_IMPL_(tmp, decl, expr) \
    auto tmp = (expr); \
    if (tmp.is_err()) return std::move(tmp).error(); \
    decl = std::move(tmp).value()

// SIFT_TRY_ASSIGN(auto v, make()); declares v from the value or returns the error.
#define SIFT_TRY_ASSIGN(decl, expr) \
    SIFT_TRY_ASSIGN_IMPL_(SIFT_CONCAT_(_sift_try_, __LINE__), decl, expr)

} // namespace sift
