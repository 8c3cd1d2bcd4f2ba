//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/Signature.hpp
// Purpose: Function declarations as parsed from a manifest, their raw binding
//          options, and the resolved FunctionSignature handed to the planner.
// Key invariants:
//   - A FunctionSignature has at most one Scope and at most one State
//     parameter; usesScope/usesState mirror their presence.
//   - Value parameters keep declaration order; their position among the
//     Value parameters is the call-site argument index.
//   - Option resolution rejects unknown keys, duplicate keys and values of the
//     wrong shape with Configuration diagnostics.
// Ownership/Lifetime: All types are values owning their strings and types.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bind/TypeRef.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tether::bind
{

enum class ParamRole
{
    Value, ///< Supplied by the script caller.
    Scope, ///< Receives the execution scope.
    State, ///< Receives the bound application state.
};

struct Param
{
    std::string name;
    TypeRef type; ///< Declared type; ignored for Scope and State roles.
    ParamRole role = ParamRole::Value;
    support::SourceLoc loc;
};

/// @brief One `key = value` entry of an attribute list, before validation.
struct RawOption
{
    enum class Shape
    {
        Flag,   ///< `fast`
        Bool,   ///< `fast = false`
        String, ///< `name = "x"` or a bare `"x"`
        Type,   ///< `state = Counter`
    };

    std::string key;
    Shape shape = Shape::Flag;
    bool boolValue = true;
    std::string stringValue;
    TypeRef typeValue;
    support::SourceLoc loc;
};

/// @brief A function declaration exactly as the manifest spells it.
struct FunctionDecl
{
    std::string name;
    std::vector<Param> params;
    TypeRef returnType = TypeRef::unit();
    std::vector<RawOption> options;
    support::SourceLoc loc;
};

/// @brief The four recognized binding options after validation.
struct MethodOptions
{
    std::optional<TypeRef> state;
    std::optional<std::string> name;
    bool promise = false;
    bool fast = false;
};

/// @brief Immutable input to classification and planning.
struct FunctionSignature
{
    std::string name;       ///< Native function name.
    std::string scriptName; ///< Name the callable is installed under.
    std::vector<Param> params;
    TypeRef returnType = TypeRef::unit();
    bool usesScope = false;
    bool usesState = false;
    bool asyncWrapped = false;
    bool fastRequested = false;
    std::optional<TypeRef> stateType;
    support::SourceLoc loc;

    /// @brief Number of parameters supplied by the script caller.
    [[nodiscard]] size_t valueParamCount() const;
};

/// @brief Validate the raw option list of one declaration.
/// @return The resolved options, or the first Configuration diagnostic.
support::Expected<MethodOptions> resolveOptions(const std::vector<RawOption> &options);

/// @brief Resolve @p decl into a FunctionSignature.
/// @details Fatal problems (bad options, duplicate parameters, a second scope
///          or state parameter) are returned as the error. Non-fatal findings,
///          such as a state type without a state parameter, are reported to
///          @p diags as warnings.
support::Expected<FunctionSignature> buildSignature(const FunctionDecl &decl,
                                                    support::DiagnosticEngine &diags);

} // namespace tether::bind
