//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements option resolution and FunctionSignature construction. This is the
// first stage that can reject a manifest for semantic reasons; everything it
// reports is a Configuration diagnostic carrying the location of the
// offending option or parameter.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Binding option validation and signature assembly.

#include "bind/Signature.hpp"

#include "bind/TypeNames.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_set>

namespace tether::bind
{
using support::makeConfigError;
using support::makeWarning;

namespace
{

const char *shapeName(RawOption::Shape shape)
{
    switch (shape)
    {
        case RawOption::Shape::Flag:
        case RawOption::Shape::Bool:
            return "a boolean";
        case RawOption::Shape::String:
            return "a string";
        case RawOption::Shape::Type:
            return "a type";
    }
    return "a value";
}

support::Diag wrongShape(const RawOption &opt, const char *expected)
{
    return makeConfigError(opt.loc,
                           "option '" + opt.key + "' expects " + expected + ", got " +
                               shapeName(opt.shape));
}

bool isBoolShape(RawOption::Shape shape)
{
    return shape == RawOption::Shape::Flag || shape == RawOption::Shape::Bool;
}

/// @brief True when @p type or any of its arguments is `()` or `void`.
bool mentionsVoid(const TypeRef &type)
{
    if (type.isUnit())
        return true;
    if (type.args.empty() && names::primitiveFromName(type.lastSegment()) == PrimitiveKind::Void)
        return true;
    return std::any_of(type.args.begin(), type.args.end(), mentionsVoid);
}

/// @brief Identifiers the generated wrappers declare around the native call.
bool isWrapperIdentifier(std::string_view name)
{
    static constexpr std::string_view kReserved[] = {
        "scope", "args", "rv", "options", "data", "result", "value", "state", "capsule",
        "deferred"};
    for (auto r : kReserved)
    {
        if (name == r)
            return true;
    }
    // argN locals hold converted arguments.
    if (name.size() > 3 && name.substr(0, 3) == "arg")
    {
        return std::all_of(name.begin() + 3, name.end(), [](char ch) {
            return std::isdigit(static_cast<unsigned char>(ch)) != 0;
        });
    }
    return false;
}

} // namespace

size_t FunctionSignature::valueParamCount() const
{
    return static_cast<size_t>(std::count_if(
        params.begin(), params.end(), [](const Param &p) { return p.role == ParamRole::Value; }));
}

support::Expected<MethodOptions> resolveOptions(const std::vector<RawOption> &options)
{
    MethodOptions out;
    std::unordered_set<std::string> seen;
    for (const auto &opt : options)
    {
        if (!seen.insert(opt.key).second)
            return makeConfigError(opt.loc, "duplicate option '" + opt.key + "'");

        if (opt.key == "state")
        {
            if (opt.shape != RawOption::Shape::Type)
                return wrongShape(opt, "a type");
            out.state = opt.typeValue;
        }
        else if (opt.key == "name")
        {
            if (opt.shape != RawOption::Shape::String)
                return wrongShape(opt, "a string");
            if (opt.stringValue.empty())
                return makeConfigError(opt.loc, "option 'name' must not be empty");
            out.name = opt.stringValue;
        }
        else if (opt.key == "promise")
        {
            if (!isBoolShape(opt.shape))
                return wrongShape(opt, "a boolean");
            out.promise = opt.boolValue;
        }
        else if (opt.key == "fast")
        {
            if (!isBoolShape(opt.shape))
                return wrongShape(opt, "a boolean");
            out.fast = opt.boolValue;
        }
        else
        {
            return makeConfigError(opt.loc,
                                   "unknown option '" + opt.key +
                                       "'; expected one of: state, name, promise, fast");
        }
    }
    return out;
}

support::Expected<FunctionSignature> buildSignature(const FunctionDecl &decl,
                                                    support::DiagnosticEngine &diags)
{
    auto options = resolveOptions(decl.options);
    if (!options)
        return options.error();

    if (isWrapperIdentifier(decl.name))
        return makeConfigError(decl.loc,
                               "function name '" + decl.name +
                                   "' is reserved for generated wrapper code");

    FunctionSignature sig;
    sig.name = decl.name;
    sig.scriptName = options.value().name.value_or(decl.name);
    sig.returnType = decl.returnType;
    sig.asyncWrapped = options.value().promise;
    sig.fastRequested = options.value().fast;
    sig.stateType = options.value().state;
    sig.loc = decl.loc;

    std::unordered_set<std::string> names;
    for (const auto &param : decl.params)
    {
        if (!names.insert(param.name).second)
            return makeConfigError(param.loc,
                                   "duplicate parameter '" + param.name + "' in '" + decl.name +
                                       "'");
        if (param.role == ParamRole::Scope)
        {
            if (sig.usesScope)
                return makeConfigError(param.loc,
                                       "function '" + decl.name + "' declares more than one scope parameter");
            sig.usesScope = true;
        }
        else if (param.role == ParamRole::State)
        {
            if (sig.usesState)
                return makeConfigError(param.loc,
                                       "function '" + decl.name + "' declares more than one state parameter");
            sig.usesState = true;
        }
        else if (mentionsVoid(param.type))
        {
            // Void crosses the boundary only as a return type.
            return makeConfigError(param.loc,
                                   "parameter '" + param.name + "' of '" + decl.name +
                                       "' cannot have type " + param.type.display());
        }
        sig.params.push_back(param);
    }

    if (sig.stateType && !sig.usesState)
    {
        diags.report(makeWarning(decl.loc,
                                 "function '" + decl.name + "' sets a state type (" +
                                     sig.stateType->display() +
                                     ") but has no 'state' parameter; the option is ignored"));
        sig.stateType.reset();
    }
    return sig;
}

} // namespace tether::bind
