#pragma once

#include <bmr/error.hpp>
#include <string>
#include <variant>

namespace bmr {

template<typename T>
class Result {
    std::variant<T, BmrError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from BmrError so BMR_TRY can return errors across Result<T> types
    Result(BmrError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(BmrError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<BmrError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    BmrError& error() & { return std::get<BmrError>(data_); }
    const BmrError& error() const& { return std::get<BmrError>(data_); }
    BmrError&& error() && { return std::get<BmrError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Append a context line to the error; no effect on a value
    Result context(std::string entry) && {
        if (is_err()) error().with_context(std::move(entry));
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define BMR_TRY(expr) \
    do { \
        auto _bmr_result = (expr); \
        if (_bmr_result.is_err()) return std::move(_bmr_result).error(); \
    } while(0)

} // namespace bmr
