#pragma once

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace objmodel {

template <typename T = void, typename E = std::string>
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
public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && !std::is_convertible_v<T, E>)
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value()
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value(), "Bad expected access");
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const
        requires(!std::is_void_v<U>)
    {
        ASSERT(has_value(), "Bad expected access");
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr void value() const
        requires(std::is_void_v<U>)
    {
        ASSERT(has_value(), "Bad expected access");
    }

    template <typename U = T>
    constexpr U& operator*()
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr const U& operator*() const
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
        ASSERT(!has_value(), "Bad expected error access");
        return std::get<1>(data_);
    }

    template <typename Func, typename U = T>
    constexpr Expected<std::invoke_result_t<Func, const U&>, E> transform(const Func& func) const
        requires(!std::is_void_v<U>)
    {
        if (!has_value()) {
            return error();
        }

        return func(value());
    }

    constexpr bool operator==(const Expected& rhs) const = default;

    template <typename Tu>
    constexpr bool operator==(const Tu& rhs) const
        requires(!std::is_void_v<T> && !std::same_as<Tu, Expected> && std::equality_comparable_with<Tu, T>)
    {
        return has_value() && value() == rhs;
    }

private:
    using ValueStorage = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::variant<ValueStorage, E> data_;
};

} // namespace objmodel

template <typename T, typename E>
struct fmt::formatter<::objmodel::Expected<T, E>> : formatter<std::string>
{
    template <typename Context>
    auto format(const ::objmodel::Expected<T, E>& from, Context& ctx) const {
        return formatter<std::string>::format(format_impl(from), ctx);
    }

private:
    static std::string format_impl(const ::objmodel::Expected<T, E>& from) {
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
