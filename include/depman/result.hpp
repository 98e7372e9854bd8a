#pragma once

#include <depman/error.hpp>
#include <utility>
#include <variant>

namespace depman {

// Value-or-error return type used by every fallible depman operation.
template<typename T>
class Result {
    std::variant<T, DepmanError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from DepmanError so DEPMAN_TRY works across Result<T> types
    Result(DepmanError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(DepmanError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<DepmanError>(data_); }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    DepmanError& error() & { return std::get<DepmanError>(data_); }
    const DepmanError& error() const& { return std::get<DepmanError>(data_); }
    DepmanError&& error() && { return std::get<DepmanError>(std::move(data_)); }

    // Shorthand for is_err() && error().code == c
    bool failed_with(DepmanError::Code c) const {
        return is_err() && error().code == c;
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define DEPMAN_TRY(expr) \
    do { \
        auto _depman_result = (expr); \
        if (_depman_result.is_err()) return std::move(_depman_result).error(); \
    } while(0)

} // namespace depman
