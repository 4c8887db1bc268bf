#pragma once
#include <stdexcept>
#include <utility>
#include <variant>

namespace olmwire::protocol {

/// Value of an Ok result that carries nothing.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};
inline constexpr Unit unit{};

/**
 * @brief Either a value of T or a failure of E
 *
 * Codec operations return this instead of throwing. Unwrap() on the wrong
 * alternative throws std::logic_error.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<kValue>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<kError>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == kValue; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == kError; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kValue>(state_);
    }

    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kValue>(state_);
    }

    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kValue>(std::move(state_));
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kError>(state_);
    }

    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kError>(std::move(state_));
    }

private:
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : state_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
    }

    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
    }

    std::variant<T, E> state_;
};

} // namespace olmwire::protocol
