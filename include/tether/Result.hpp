//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tether/Result.hpp
// Purpose: Fallible return type shared by bound functions and the conversion
//          runtime.
// Key invariants: A Result holds exactly one of a value or an error.
// Ownership/Lifetime: Result owns the contained value or error.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace tether
{

/// @brief Tag type used to construct successful Result values explicitly.
struct SuccessTag
{
    constexpr SuccessTag() = default;
};

inline constexpr SuccessTag kSuccessTag{};

/// @brief Tag type used to construct failed Result values explicitly.
struct FailureTag
{
    constexpr FailureTag() = default;
};

inline constexpr FailureTag kFailureTag{};

/// @brief Value-or-error container returned by fallible bound functions.
/// @details Implicit construction from a value means success, so a function
///          returning `Result<double>` may simply `return 4.0;`. Failures are
///          always built through failure() or the FailureTag constructor,
///          which keeps `Result<std::string, std::string>` unambiguous.
template <typename T, typename E = std::string> class Result
{
  public:
    using value_type = T;
    using error_type = E;

    template <typename U = T> Result(SuccessTag /*tag*/, U &&value) : value_(std::forward<U>(value))
    {
    }

    template <typename U = T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result> &&
                                          std::is_constructible_v<T, U &&>>>
    Result(U &&value) : Result(kSuccessTag, std::forward<U>(value))
    {
    }

    template <typename G = E> Result(FailureTag /*tag*/, G &&error) : error_(std::forward<G>(error))
    {
    }

    template <typename U = T> static Result success(U &&value)
    {
        return Result(kSuccessTag, std::forward<U>(value));
    }

    template <typename G = E> static Result failure(G &&error)
    {
        return Result(kFailureTag, std::forward<G>(error));
    }

    /// @invariant When true, value() is valid; when false, error() is valid.
    [[nodiscard]] bool isOk() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return isOk();
    }

    /// @pre isOk()
    T &value() &
    {
        return *value_;
    }

    /// @pre isOk()
    const T &value() const &
    {
        return *value_;
    }

    /// @pre isOk()
    T &&value() &&
    {
        return std::move(*value_);
    }

    /// @pre !isOk()
    const E &error() const
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<E> error_;
};

/// @brief Result specialization for operations that produce no value.
template <typename E> class Result<void, E>
{
  public:
    using value_type = void;
    using error_type = E;

    /// @brief Successful, valueless result.
    Result() = default;

    Result(SuccessTag /*tag*/) {}

    template <typename G = E> Result(FailureTag /*tag*/, G &&error) : error_(std::forward<G>(error))
    {
    }

    static Result success()
    {
        return Result();
    }

    template <typename G = E> static Result failure(G &&error)
    {
        return Result(kFailureTag, std::forward<G>(error));
    }

    [[nodiscard]] bool isOk() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return isOk();
    }

    /// @pre !isOk()
    const E &error() const
    {
        return *error_;
    }

  private:
    std::optional<E> error_;
};

} // namespace tether
