#pragma once

#include <libassert/assert.hpp>

#include <concepts>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace nexusexec {

struct UnexpectedT
{
};

/// Tag used to construct an Expected in its error state when the value and error types are ambiguous
inline constexpr UnexpectedT unexpected{};

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: implicit construction requires that T and E are not convertible between one another.
 * Use the ``unexpected`` tag otherwise.
 */
class [[nodiscard]] Expected
{
    using ValueStorage = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        requires(std::is_void_v<T> || std::default_initializable<T>)
        : data_{std::in_place_index<0>} {}

    template <typename... Args>
    explicit constexpr Expected(std::in_place_t /*unused*/, Args&&... args)
        requires(!std::is_void_v<T> && std::constructible_from<T, Args...>)
        : data_{std::in_place_index<0>, std::forward<Args>(args)...} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && !std::same_as<std::remove_cvref_t<Tu>, Expected> &&
                 std::convertible_to<Tu, T>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(!std::same_as<std::remove_cvref_t<Eu>, Expected> && std::convertible_to<Eu, E> &&
                 !std::convertible_to<Eu, ValueStorage>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    template <typename Eu>
    constexpr Expected(UnexpectedT /*unused*/, Eu&& error)
        requires(std::convertible_to<Eu, E>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value() &
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const&
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr U&& value() &&
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
    constexpr void value() const&
        requires(std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
    }

    template <typename U = T>
    constexpr U& operator*() &
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr const U& operator*() const&
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    constexpr const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(!has_value());
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    template <typename Func, typename U = T>
    constexpr Expected<std::invoke_result_t<Func, const U&>, E> transform(const Func& func) const
        requires(!std::is_void_v<U>)
    {
        if (!has_value()) {
            return {unexpected, error()};
        }

        return func(value());
    }

    constexpr bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<E> && (std::is_void_v<T> || std::equality_comparable<T>))
    {
        return data_ == rhs.data_;
    }

    template <typename Tu>
    constexpr bool operator==(const Tu& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    {
        if (!has_value()) {
            return false;
        }

        return value() == rhs;
    }

    template <typename Eu>
    constexpr bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E> &&
                 !std::equality_comparable_with<Eu, ValueStorage>)
    {
        if (has_value()) {
            return false;
        }

        return error() == rhs;
    }

private:
    std::variant<ValueStorage, E> data_;
};

} // namespace nexusexec
