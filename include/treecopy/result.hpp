#pragma once

#include <treecopy/error.hpp>
#include <variant>
#include <utility>

namespace treecopy {

// Either a value or a TreecopyError. Errors convert implicitly so that
// TREECOPY_TRY can forward them across Result<T> types.
template<typename T>
class Result {
    std::variant<T, TreecopyError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    Result(TreecopyError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TreecopyError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TreecopyError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TreecopyError& error() & { return std::get<TreecopyError>(data_); }
    const TreecopyError& error() const& { return std::get<TreecopyError>(data_); }
    TreecopyError&& error() && { return std::get<TreecopyError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Value if ok, otherwise the fallback. The error is discarded.
    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define TREECOPY_TRY(expr) \
    do { \
        auto _treecopy_result = (expr); \
        if (_treecopy_result.is_err()) return std::move(_treecopy_result).error(); \
    } while(0)

} // namespace treecopy
