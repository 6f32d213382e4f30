#pragma once

#include <tid/error.hpp>
#include <variant>
#include <functional>

namespace tid {

template<typename T>
class Result {
    std::variant<T, TidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from TidError so TID_TRY can return errors across Result<T> types
    Result(TidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TidError& error() & { return std::get<TidError>(data_); }
    const TidError& error() const& { return std::get<TidError>(data_); }
    TidError&& error() && { return std::get<TidError>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define TID_TRY(expr) \
    do { \
        auto _tid_result = (expr); \
        if (_tid_result.is_err()) return std::move(_tid_result).error(); \
    } while(0)

// Declares `var` bound to the Ok value of `expr`, or returns its error
#define TID_TRY_ASSIGN(var, expr) \
    auto _tid_##var = (expr); \
    if (_tid_##var.is_err()) return std::move(_tid_##var).error(); \
    auto var = std::move(_tid_##var).value()

} // namespace tid
