#pragma once

#include <trellis/error.hpp>
#include <variant>

namespace trellis {

template<typename T>
class Result {
    std::variant<T, TrellisError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from TrellisError so TRELLIS_TRY can return errors across Result<T> types
    Result(TrellisError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TrellisError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TrellisError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TrellisError& error() & { return std::get<TrellisError>(data_); }
    const TrellisError& error() const& { return std::get<TrellisError>(data_); }
    TrellisError&& error() && { return std::get<TrellisError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Rewrites the error in place (e.g. to attach the offending file)
    template<typename F>
    Result map_error(F&& f) && {
        if (is_err()) {
            return Result(f(std::move(error())));
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define TRELLIS_TRY(expr) \
    do { \
        auto _trellis_result = (expr); \
        if (_trellis_result.is_err()) return std::move(_trellis_result).error(); \
    } while(0)

} // namespace trellis
