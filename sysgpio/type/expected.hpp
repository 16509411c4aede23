#ifndef SYSGPIO_TYPE_EXPECTED_HPP
#define SYSGPIO_TYPE_EXPECTED_HPP

#include <concepts>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace sysgpio::type {

/**
 * @brief Wraps an error value so it can be returned where an `expected`
 * is expected.
 *
 * @tparam E The type of the error value
 */
template <typename E>
class unexpected {
public:
    template <typename U = E>
        requires std::constructible_from<E, U>
    constexpr explicit unexpected(U&& error) noexcept(
        std::is_nothrow_constructible_v<E, U>)
        : error_(std::forward<U>(error)) {}

    [[nodiscard]] constexpr const E& error() const& noexcept { return error_; }
    [[nodiscard]] constexpr E&& error() && noexcept {
        return std::move(error_);
    }

private:
    E error_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

/**
 * @brief Holds either a value of type T or an error of type E.
 *
 * Accessing the wrong alternative through value() or error() throws
 * std::logic_error; operator* and operator-> do not check.
 *
 * @tparam T The type of the expected value
 * @tparam E The type of the error
 */
template <typename T, typename E>
class expected {
public:
    using value_type = T;
    using error_type = E;
    using unexpected_type = unexpected<E>;

    constexpr expected() noexcept(std::is_nothrow_default_constructible_v<T>)
        requires std::is_default_constructible_v<T>
        : storage_(std::in_place_index<0>) {}

    template <typename U = T>
        requires std::constructible_from<T, U> &&
                 (!std::same_as<std::remove_cvref_t<U>, expected>) &&
                 (!std::same_as<std::remove_cvref_t<U>, unexpected<E>>) &&
                 (!std::same_as<std::remove_cvref_t<U>, std::in_place_t>)
    constexpr expected(U&& value) noexcept(
        std::is_nothrow_constructible_v<T, U>)
        : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

    template <typename... Args>
        requires std::constructible_from<T, Args...>
    constexpr explicit expected(std::in_place_t, Args&&... args)
        : storage_(std::in_place_index<0>, std::forward<Args>(args)...) {}

    template <typename U>
        requires std::constructible_from<E, const U&>
    constexpr expected(const unexpected<U>& unex)
        : storage_(std::in_place_index<1>, unex.error()) {}

    template <typename U>
        requires std::constructible_from<E, U>
    constexpr expected(unexpected<U>&& unex)
        : storage_(std::in_place_index<1>, std::move(unex).error()) {}

    expected(const expected&) = default;
    expected(expected&&) = default;
    expected& operator=(const expected&) = default;
    expected& operator=(expected&&) = default;

    [[nodiscard]] constexpr bool has_value() const noexcept {
        return storage_.index() == 0;
    }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    /**
     * @brief Gets the stored value.
     * @throws std::logic_error if the expected contains an error
     */
    [[nodiscard]] constexpr T& value() & {
        checkValue();
        return std::get<0>(storage_);
    }

    [[nodiscard]] constexpr const T& value() const& {
        checkValue();
        return std::get<0>(storage_);
    }

    [[nodiscard]] constexpr T&& value() && {
        checkValue();
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] constexpr T& operator*() & noexcept {
        return *std::get_if<0>(&storage_);
    }
    [[nodiscard]] constexpr const T& operator*() const& noexcept {
        return *std::get_if<0>(&storage_);
    }
    [[nodiscard]] constexpr T* operator->() noexcept {
        return std::get_if<0>(&storage_);
    }
    [[nodiscard]] constexpr const T* operator->() const noexcept {
        return std::get_if<0>(&storage_);
    }

    /**
     * @brief Gets the stored error.
     * @throws std::logic_error if the expected contains a value
     */
    [[nodiscard]] constexpr const E& error() const& {
        checkError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] constexpr E&& error() && {
        checkError();
        return std::get<1>(std::move(storage_));
    }

    /**
     * @brief Chains an operation returning another expected.
     * @return func(value()) on success, otherwise the propagated error
     */
    template <typename Func>
    constexpr auto and_then(Func&& func) const& {
        using Result = std::invoke_result_t<Func, const T&>;
        if (has_value()) {
            return std::invoke(std::forward<Func>(func),
                               std::get<0>(storage_));
        }
        return Result(unexpected<E>(std::get<1>(storage_)));
    }

    /**
     * @brief Maps the value, keeping the error untouched.
     */
    template <typename Func>
    constexpr auto transform(Func&& func) const& {
        using U = std::invoke_result_t<Func, const T&>;
        if (has_value()) {
            if constexpr (std::is_void_v<U>) {
                std::invoke(std::forward<Func>(func), std::get<0>(storage_));
                return expected<U, E>();
            } else {
                return expected<U, E>(std::invoke(std::forward<Func>(func),
                                                  std::get<0>(storage_)));
            }
        }
        return expected<U, E>(unexpected<E>(std::get<1>(storage_)));
    }

private:
    constexpr void checkValue() const {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
    }

    constexpr void checkError() const {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of expected for operations that only report
 * success or failure.
 *
 * @tparam E The type of the error
 */
template <typename E>
class expected<void, E> {
public:
    using value_type = void;
    using error_type = E;
    using unexpected_type = unexpected<E>;

    constexpr expected() noexcept : storage_(std::monostate{}) {}

    template <typename U>
        requires std::constructible_from<E, const U&>
    constexpr expected(const unexpected<U>& unex)
        : storage_(std::in_place_index<1>, unex.error()) {}

    template <typename U>
        requires std::constructible_from<E, U>
    constexpr expected(unexpected<U>&& unex)
        : storage_(std::in_place_index<1>, std::move(unex).error()) {}

    [[nodiscard]] constexpr bool has_value() const noexcept {
        return storage_.index() == 0;
    }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    /**
     * @brief Validates that the expected holds success.
     * @throws std::logic_error if the expected contains an error
     */
    constexpr void value() const {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
    }

    [[nodiscard]] constexpr const E& error() const& {
        checkError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] constexpr E&& error() && {
        checkError();
        return std::get<1>(std::move(storage_));
    }

    template <typename Func>
    constexpr auto and_then(Func&& func) const& {
        using Result = std::invoke_result_t<Func>;
        if (has_value()) {
            return std::invoke(std::forward<Func>(func));
        }
        return Result(unexpected<E>(std::get<1>(storage_)));
    }

private:
    constexpr void checkError() const {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
    }

    std::variant<std::monostate, E> storage_;
};

/**
 * @brief Creates an unexpected error object.
 */
template <typename E>
constexpr auto make_unexpected(E&& error) -> unexpected<std::decay_t<E>> {
    return unexpected<std::decay_t<E>>(std::forward<E>(error));
}

}  // namespace sysgpio::type

#endif  // SYSGPIO_TYPE_EXPECTED_HPP
