//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tether/runtime/Convert.hpp
// Purpose: Generic conversion between engine values and native C++ values.
//          Generated slow-path wrappers route every primitive and opaque
//          argument through fromValue() and every returned value through
//          toValue().
// Key invariants:
//   - fromValue() never throws; failures are reported as Result errors whose
//     text is appended to the wrapper's argument diagnostic.
//   - toValue() yields std::nullopt when the value has no faithful engine
//     representation (64-bit integers beyond the safe-integer range).
// Ownership/Lifetime: Returned handles belong to the scope passed in.
// Links: docs/manifest-format.md
//
// Extending:
//   Types without a built-in conversion are classified as opaque by the
//   generator. Provide a specialization of tether::runtime::Convert<T> with
//   the three members below and the generated code picks it up:
//
//     template <> struct tether::runtime::Convert<Point> {
//         static constexpr std::string_view kName = "Point";
//         static ConvertResult<Point> fromValue(host::Scope &, host::Local<host::Value>);
//         static std::optional<host::Local<host::Value>> toValue(host::Scope &, const Point &);
//     };
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tether/Result.hpp"
#include "tether/host/Scope.hpp"
#include "tether/host/Value.hpp"

#include <cmath>
#include <cstdint>
#include <exception>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tether::runtime
{

template <class T> using ConvertResult = Result<T, std::string>;

/// @brief Largest integer magnitude a double represents exactly (2^53 - 1).
inline constexpr int64_t kMaxSafeInteger = (int64_t{1} << 53) - 1;

namespace detail
{
/// @brief Category name of @p value, or "empty" for an empty handle.
std::string typeNameOf(const host::Local<host::Value> &value);

/// @brief "invalid type; expected: <expected>, got: <actual>".
std::string mismatch(std::string_view expected, const host::Local<host::Value> &value);

/// @brief "value out of range for <type>".
std::string outOfRange(std::string_view type);

/// @brief Read a number; fails with a mismatch error naming @p expected.
ConvertResult<double> readNumber(const host::Local<host::Value> &value, std::string_view expected);

/// @brief True when @p value is within +-kMaxSafeInteger.
[[nodiscard]] constexpr bool isSafeInteger(int64_t value) noexcept
{
    return value >= -kMaxSafeInteger && value <= kMaxSafeInteger;
}

[[nodiscard]] constexpr bool isSafeInteger(uint64_t value) noexcept
{
    return value <= static_cast<uint64_t>(kMaxSafeInteger);
}

template <class T> constexpr std::string_view integerName()
{
    constexpr bool s = std::is_signed_v<T>;
    switch (sizeof(T))
    {
        case 1:
            return s ? "int8" : "uint8";
        case 2:
            return s ? "int16" : "uint16";
        case 4:
            return s ? "int32" : "uint32";
        default:
            return s ? "int64" : "uint64";
    }
}

template <class T> constexpr std::string_view handleName()
{
    if constexpr (std::is_same_v<T, host::Function>)
        return "Function";
    else if constexpr (std::is_same_v<T, host::Array>)
        return "Array";
    else if constexpr (std::is_same_v<T, host::Uint8Array>)
        return "Uint8Array";
    else if constexpr (std::is_same_v<T, host::ArrayBuffer>)
        return "ArrayBuffer";
    else if constexpr (std::is_same_v<T, host::Promise>)
        return "Promise";
    else if constexpr (std::is_same_v<T, host::Object>)
        return "Object";
    else if constexpr (std::is_same_v<T, host::String>)
        return "String";
    else if constexpr (std::is_same_v<T, host::Number>)
        return "Number";
    else if constexpr (std::is_same_v<T, host::Boolean>)
        return "Boolean";
    else if constexpr (std::is_same_v<T, host::External>)
        return "External";
    else
        return "Value";
}
} // namespace detail

/// @brief Conversion trait; specialize for user types.
template <class T, class Enable = void> struct Convert;

template <> struct Convert<bool>
{
    static constexpr std::string_view kName = "boolean";
    static ConvertResult<bool> fromValue(host::Scope &scope, host::Local<host::Value> value);
    static std::optional<host::Local<host::Value>> toValue(host::Scope &scope, bool value);
};

template <> struct Convert<double>
{
    static constexpr std::string_view kName = "number";
    static ConvertResult<double> fromValue(host::Scope &scope, host::Local<host::Value> value);
    static std::optional<host::Local<host::Value>> toValue(host::Scope &scope, double value);
};

template <> struct Convert<float>
{
    static constexpr std::string_view kName = "number";
    static ConvertResult<float> fromValue(host::Scope &scope, host::Local<host::Value> value);
    static std::optional<host::Local<host::Value>> toValue(host::Scope &scope, float value);
};

template <> struct Convert<std::string>
{
    static constexpr std::string_view kName = "string";
    static ConvertResult<std::string> fromValue(host::Scope &scope,
                                                host::Local<host::Value> value);
    static std::optional<host::Local<host::Value>> toValue(host::Scope &scope,
                                                          const std::string &value);
};

/// @brief Integers: finite numbers truncated toward zero, then range-checked.
template <class T>
struct Convert<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
{
    static constexpr std::string_view kName = detail::integerName<T>();

    static ConvertResult<T> fromValue(host::Scope &, host::Local<host::Value> value)
    {
        auto number = detail::readNumber(value, kName);
        if (!number.isOk())
            return ConvertResult<T>::failure(number.error());
        const double d = number.value();
        if (!std::isfinite(d))
            return ConvertResult<T>::failure(detail::outOfRange(kName));
        const double t = std::trunc(d);
        const double lo = static_cast<double>(std::numeric_limits<T>::min());
        const double hiExclusive = std::ldexp(1.0, std::numeric_limits<T>::digits);
        if (t < lo || t >= hiExclusive)
            return ConvertResult<T>::failure(detail::outOfRange(kName));
        return ConvertResult<T>::success(static_cast<T>(t));
    }

    static std::optional<host::Local<host::Value>> toValue(host::Scope &scope, T value)
    {
        if constexpr (sizeof(T) == 8)
        {
            if constexpr (std::is_signed_v<T>)
            {
                if (!detail::isSafeInteger(static_cast<int64_t>(value)))
                    return std::nullopt;
            }
            else
            {
                if (!detail::isSafeInteger(static_cast<uint64_t>(value)))
                    return std::nullopt;
            }
        }
        return host::Local<host::Value>(scope.newNumber(static_cast<double>(value)));
    }
};

/// @brief Optional values: undefined and null map to absent.
template <class T> struct Convert<std::optional<T>>
{
    static constexpr std::string_view kName = Convert<T>::kName;

    static ConvertResult<std::optional<T>> fromValue(host::Scope &scope,
                                                     host::Local<host::Value> value)
    {
        if (value.isEmpty() || value->isNullOrUndefined())
            return ConvertResult<std::optional<T>>::success(std::optional<T>{});
        auto inner = Convert<T>::fromValue(scope, value);
        if (!inner.isOk())
            return ConvertResult<std::optional<T>>::failure(inner.error());
        return ConvertResult<std::optional<T>>::success(
            std::optional<T>(std::move(inner).value()));
    }

    static std::optional<host::Local<host::Value>> toValue(host::Scope &scope,
                                                          const std::optional<T> &value)
    {
        if (!value)
            return scope.null();
        return Convert<T>::toValue(scope, *value);
    }
};

/// @brief Sequences map to engine arrays element by element.
template <class T> struct Convert<std::vector<T>>
{
    static constexpr std::string_view kName = "array";

    static ConvertResult<std::vector<T>> fromValue(host::Scope &scope,
                                                   host::Local<host::Value> value)
    {
        if (value.isEmpty() || !value->isArray())
            return ConvertResult<std::vector<T>>::failure(detail::mismatch(kName, value));
        auto array = value.as<host::Array>();
        std::vector<T> out;
        out.reserve(array->length());
        for (uint32_t i = 0; i < array->length(); ++i)
        {
            auto element = Convert<T>::fromValue(scope, array->at(i));
            if (!element.isOk())
                return ConvertResult<std::vector<T>>::failure("element " + std::to_string(i) +
                                                              ": " + element.error());
            out.push_back(std::move(element).value());
        }
        return ConvertResult<std::vector<T>>::success(std::move(out));
    }

    static std::optional<host::Local<host::Value>> toValue(host::Scope &scope,
                                                          const std::vector<T> &values)
    {
        std::vector<host::Local<host::Value>> elements;
        elements.reserve(values.size());
        for (const auto &v : values)
        {
            auto element = Convert<T>::toValue(scope, v);
            if (!element)
                return std::nullopt;
            elements.push_back(*element);
        }
        return host::Local<host::Value>(scope.newArray(elements));
    }
};

/// @brief Engine handles pass through with a checked cast.
template <class T> struct Convert<host::Local<T>>
{
    static constexpr std::string_view kName = detail::handleName<T>();

    static ConvertResult<host::Local<T>> fromValue(host::Scope &, host::Local<host::Value> value)
    {
        if (value.isEmpty())
            return ConvertResult<host::Local<T>>::failure(detail::mismatch(kName, value));
        if constexpr (std::is_same_v<T, host::Value>)
        {
            return ConvertResult<host::Local<T>>::success(value);
        }
        else
        {
            auto cast = value.tryAs<T>();
            if (!cast)
                return ConvertResult<host::Local<T>>::failure(detail::mismatch(kName, value));
            return ConvertResult<host::Local<T>>::success(cast);
        }
    }

    static std::optional<host::Local<host::Value>> toValue(host::Scope &scope,
                                                          const host::Local<T> &value)
    {
        if (value.isEmpty())
            return scope.undefined();
        return host::Local<host::Value>(value);
    }
};

/// @brief Deserialize @p value as a @p T.
template <class T>
ConvertResult<T> fromValue(host::Scope &scope, const host::Local<host::Value> &value)
{
    return Convert<T>::fromValue(scope, value);
}

/// @brief Serialize @p value; std::nullopt when it has no engine representation.
template <class T>
std::optional<host::Local<host::Value>> toValue(host::Scope &scope, const T &value)
{
    return Convert<std::decay_t<T>>::toValue(scope, value);
}

/// @brief Text of an application error surfaced by a fallible function.
/// @details Strings are used verbatim, exceptions contribute what(), and any
///          other type must be printable with operator<<.
template <class E> std::string describeError(const E &error)
{
    if constexpr (std::is_convertible_v<const E &, std::string_view>)
    {
        return std::string(std::string_view(error));
    }
    else if constexpr (std::is_base_of_v<std::exception, E>)
    {
        return error.what();
    }
    else
    {
        std::ostringstream os;
        os << error;
        return os.str();
    }
}

} // namespace tether::runtime
