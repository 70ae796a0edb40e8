#pragma once

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <functional>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace execbox {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
    using StorageT = std::variant<std::conditional_t<std::is_void_v<T>, std::monostate, T>, E>;

public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        requires(std::is_void_v<T> || std::default_initializable<T>)
        : data_{std::in_place_index<0>} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T> && !std::same_as<std::remove_cvref_t<Tu>, Expected>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && (std::is_void_v<T> || !std::is_convertible_v<Eu, T>) &&
                 !std::same_as<std::remove_cvref_t<Eu>, Expected>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value() &
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const&
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr U&& value() &&
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
        return std::get<0>(std::move(data_));
    }

    template <typename U = T>
    constexpr void value() const&
        requires(std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value(), "value() called on an Expected holding an error");
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
        DEBUG_ASSERT(has_error(), "error() called on an Expected holding a value");
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr E error_or(Eu&& default_value) const {
        if (has_value()) {
            return static_cast<E>(std::forward<Eu>(default_value));
        }
        return std::get<1>(data_);
    }

    /// Apply ``func`` to the held value, if any. Errors pass through untouched.
    template <typename Func>
    constexpr auto transform(Func&& func) const
        -> Expected<std::invoke_result_t<Func, std::add_lvalue_reference_t<const T>>, E>
        requires(!std::is_void_v<T>)
    {
        if (!has_value()) {
            return error();
        }

        return std::invoke(std::forward<Func>(func), value());
    }

    /// Map the held error to another error type, if any.
    template <typename Func>
    constexpr auto transform_error(Func&& func) const -> Expected<T, std::invoke_result_t<Func, const E&>> {
        using NewE = std::invoke_result_t<Func, const E&>;

        if (has_error()) {
            return Expected<T, NewE>{std::invoke(std::forward<Func>(func), error())};
        }

        if constexpr (std::is_void_v<T>) {
            return Expected<T, NewE>{};
        } else {
            return Expected<T, NewE>{value()};
        }
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
        return has_value() && value() == rhs;
    }

    template <typename Eu>
    constexpr bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E> &&
                 (std::is_void_v<T> || !std::equality_comparable_with<Eu, T>))
    {
        return has_error() && error() == rhs;
    }

private:
    StorageT data_;
};

} // namespace execbox

template <typename T, typename E>
struct fmt::formatter<::execbox::Expected<T, E>> : fmt::formatter<std::string>
{
    auto format(const ::execbox::Expected<T, E>& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(format_impl(from), ctx);
    }

private:
    static std::string format_impl(const ::execbox::Expected<T, E>& from) {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format("Error({})", from.error());
            } else {
                return "Error(<unformattable>)";
            }
        }

        if constexpr (std::is_void_v<T>) {
            return "Expected(void)";
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format("Expected({})", from.value());
        } else {
            return "Expected(<unformattable>)";
        }
    }
};
