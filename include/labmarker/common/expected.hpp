#pragma once

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace labmarker {

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
    using StorageT = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, StorageT> && !std::convertible_to<Tu, E>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && (std::is_void_v<T> || !std::convertible_to<Eu, StorageT>))
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value()
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr void value() const
        requires(std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
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
    constexpr StorageT value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(has_error());
        return std::get<1>(data_);
    }

    constexpr bool operator==(const Expected& rhs) const
        requires(std::equality_comparable<E> && (std::is_void_v<T> || std::equality_comparable<T>))
    {
        return data_ == rhs.data_;
    }

    template <typename Eu>
    constexpr bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E>)
    {
        return has_error() && error() == rhs;
    }

private:
    std::variant<StorageT, E> data_;
};

} // namespace labmarker

template <typename T, typename E>
struct fmt::formatter<::labmarker::Expected<T, E>> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const ::labmarker::Expected<T, E>& from, FormatContext& ctx) const {
        if (!from) {
            return fmt::format_to(ctx.out(), "Error({})", from.error());
        }

        if constexpr (std::is_void_v<T>) {
            return fmt::format_to(ctx.out(), "Expected(void)");
        } else {
            return fmt::format_to(ctx.out(), "Expected({})", from.value());
        }
    }
};
