#pragma once

#include <b58uuid/error.hpp>
#include <utility>
#include <variant>

namespace b58uuid {

// Either a value or the B58Error explaining why there is none.
template<typename T>
class Result {
public:
    // Implicit so a function can `return B58Error(...)` directly
    Result(B58Error err) : state_(std::in_place_index<1>, std::move(err)) {}

    static Result ok(T val) { return Result(std::in_place_index<0>, std::move(val)); }
    static Result err(B58Error e) { return Result(std::move(e)); }

    bool is_ok() const { return state_.index() == 0; }
    bool is_err() const { return state_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    T& value() & { return std::get<0>(state_); }
    const T& value() const& { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }

    B58Error& error() & { return std::get<1>(state_); }
    const B58Error& error() const& { return std::get<1>(state_); }
    B58Error&& error() && { return std::get<1>(std::move(state_)); }

    // Apply f to the value; an error passes through untouched.
    template<typename F>
    auto map(F&& f) && -> Result<decltype(f(std::declval<T&&>()))> {
        using U = decltype(f(std::declval<T&&>()));
        if (is_err()) return std::move(*this).error();
        return Result<U>::ok(f(std::move(*this).value()));
    }

private:
    template<typename... Args>
    explicit Result(std::in_place_index_t<0> tag, Args&&... args)
        : state_(tag, std::forward<Args>(args)...) {}

    std::variant<T, B58Error> state_;
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

// Return early from the enclosing function if expr holds an error.
#define B58UUID_TRY(expr) \
    do { \
        auto&& b58uuid_try_result_ = (expr); \
        if (b58uuid_try_result_.is_err()) \
            return std::move(b58uuid_try_result_).error(); \
    } while (0)

} // namespace b58uuid
