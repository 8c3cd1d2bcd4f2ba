//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the non-template conversions of the runtime layer: booleans,
// floating-point numbers and strings, plus the shared error-text helpers
// used by every Convert specialization.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Out-of-line members of the built-in Convert specializations.

#include "tether/runtime/Convert.hpp"

namespace tether::runtime
{
namespace detail
{
std::string typeNameOf(const host::Local<host::Value> &value)
{
    if (value.isEmpty())
        return "empty";
    return value->typeName();
}

std::string mismatch(std::string_view expected, const host::Local<host::Value> &value)
{
    std::string msg = "invalid type; expected: ";
    msg.append(expected);
    msg += ", got: ";
    msg += typeNameOf(value);
    return msg;
}

std::string outOfRange(std::string_view type)
{
    std::string msg = "value out of range for ";
    msg.append(type);
    return msg;
}

ConvertResult<double> readNumber(const host::Local<host::Value> &value, std::string_view expected)
{
    if (value.isEmpty() || !value->isNumber())
        return ConvertResult<double>::failure(mismatch(expected, value));
    return ConvertResult<double>::success(value.as<host::Number>()->value());
}
} // namespace detail

ConvertResult<bool> Convert<bool>::fromValue(host::Scope &, host::Local<host::Value> value)
{
    if (value.isEmpty() || !value->isBoolean())
        return ConvertResult<bool>::failure(detail::mismatch(kName, value));
    return ConvertResult<bool>::success(value.as<host::Boolean>()->value());
}

std::optional<host::Local<host::Value>> Convert<bool>::toValue(host::Scope &scope, bool value)
{
    return host::Local<host::Value>(scope.newBoolean(value));
}

ConvertResult<double> Convert<double>::fromValue(host::Scope &, host::Local<host::Value> value)
{
    return detail::readNumber(value, kName);
}

std::optional<host::Local<host::Value>> Convert<double>::toValue(host::Scope &scope, double value)
{
    return host::Local<host::Value>(scope.newNumber(value));
}

/// @details Narrowing to float follows the usual IEEE rounding; values
///          outside float's range become infinities rather than errors.
ConvertResult<float> Convert<float>::fromValue(host::Scope &, host::Local<host::Value> value)
{
    auto number = detail::readNumber(value, kName);
    if (!number.isOk())
        return ConvertResult<float>::failure(number.error());
    return ConvertResult<float>::success(static_cast<float>(number.value()));
}

std::optional<host::Local<host::Value>> Convert<float>::toValue(host::Scope &scope, float value)
{
    return host::Local<host::Value>(scope.newNumber(static_cast<double>(value)));
}

ConvertResult<std::string> Convert<std::string>::fromValue(host::Scope &,
                                                           host::Local<host::Value> value)
{
    if (value.isEmpty() || !value->isString())
        return ConvertResult<std::string>::failure(detail::mismatch(kName, value));
    return ConvertResult<std::string>::success(value.as<host::String>()->value());
}

std::optional<host::Local<host::Value>> Convert<std::string>::toValue(host::Scope &scope,
                                                                     const std::string &value)
{
    return host::Local<host::Value>(scope.newString(value));
}

} // namespace tether::runtime
