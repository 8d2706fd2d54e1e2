#pragma once
#include <variant>
#include <utility>
#include <functional>
#include <type_traits>
#include <stdexcept>
#include <optional>
namespace cypherpunk::remailer {
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};
template<typename T, typename E>
class Result {
    static constexpr std::size_t OK_INDEX = 0;
    static constexpr std::size_t ERR_INDEX = 1;
    std::variant<T, E> value_;
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> idx, V&& value)
        : value_(idx, std::forward<V>(value)) {}
public:
    using value_type = T;
    using error_type = E;
    static Result Ok(T value) {
        return Result(std::in_place_index<OK_INDEX>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<ERR_INDEX>, std::move(error));
    }
    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == OK_INDEX; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == ERR_INDEX; }
    template<typename Pred>
    [[nodiscard]] bool IsOkAnd(Pred&& pred) const {
        return IsOk() && std::forward<Pred>(pred)(std::get<OK_INDEX>(value_));
    }
    [[nodiscard]] T& Unwrap() & {
        EnsureOk();
        return std::get<OK_INDEX>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        EnsureOk();
        return std::get<OK_INDEX>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        EnsureOk();
        return std::get<OK_INDEX>(std::move(value_));
    }
    [[nodiscard]] E& UnwrapErr() & {
        EnsureErr();
        return std::get<ERR_INDEX>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        EnsureErr();
        return std::get<ERR_INDEX>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        EnsureErr();
        return std::get<ERR_INDEX>(std::move(value_));
    }
    [[nodiscard]] T UnwrapOr(T fallback) && {
        return IsOk() ? std::get<OK_INDEX>(std::move(value_)) : std::move(fallback);
    }
    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<ERR_INDEX>(std::move(value_)));
        }
        return Result<U, E>::Ok(std::forward<F>(func)(std::get<OK_INDEX>(std::move(value_))));
    }
    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsOk()) {
            return Result<T, U>::Ok(std::get<OK_INDEX>(std::move(value_)));
        }
        return Result<T, U>::Err(std::forward<F>(func)(std::get<ERR_INDEX>(std::move(value_))));
    }
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind continuation must keep the error type");
        if (IsErr()) {
            return Next::Err(std::get<ERR_INDEX>(std::move(value_)));
        }
        return std::forward<F>(func)(std::get<OK_INDEX>(std::move(value_)));
    }
    [[nodiscard]] std::optional<T> Ok() && {
        if (IsErr()) {
            return std::nullopt;
        }
        return std::get<OK_INDEX>(std::move(value_));
    }
    [[nodiscard]] std::optional<E> Err() && {
        if (IsOk()) {
            return std::nullopt;
        }
        return std::get<ERR_INDEX>(std::move(value_));
    }
private:
    void EnsureOk() const {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
    }
    void EnsureErr() const {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
    }
};
}
