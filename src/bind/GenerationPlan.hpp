//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/GenerationPlan.hpp
// Purpose: Per-function generation plan: classified parameters and return,
//          resolved state handling, and the slow-only/dual-path verdict.
// Key invariants:
//   - The slow path is always planned; the verdict only governs the fast pair.
//   - A DualPath verdict implies every Value parameter and the return classify
//     as fast-eligible primitives, the scope is not consumed, and any state is
//     PinnedCapsule.
//   - reason is FallbackReason::None exactly when verdict is DualPath.
//   - Eligibility is decided here once; emitters never re-derive it.
// Ownership/Lifetime: Plans own copies of their signature and types.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bind/Signature.hpp"
#include "bind/StateBinding.hpp"
#include "bind/TypeClass.hpp"
#include "bind/TypeRef.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tether::bind
{

enum class PathVerdict
{
    SlowOnly,
    DualPath,
};

/// @brief Why a function did not get a fast pair.
enum class FallbackReason
{
    None,                  ///< DualPath.
    NotRequested,          ///< `fast` was not set.
    ParameterNotPrimitive, ///< Gate (a).
    ReturnNotPrimitive,    ///< Gate (b).
    UsesScope,             ///< Gate (c): the function takes the scope.
    PromiseWrapped,        ///< Gate (c): settling a deferred needs the scope.
};

/// @brief Analysis of a declared return type.
struct ReturnShape
{
    TypeRef declared = TypeRef::unit();
    TypeClass declaredClass = TypeClass::primitive(PrimitiveKind::Void);

    /// Declared as Result<T, E>.
    bool fallible = false;

    /// The produced value (T for Result<T, E>) is not void.
    bool hasValue = false;

    TypeRef valueType = TypeRef::unit();
    TypeClass valueClass = TypeClass::primitive(PrimitiveKind::Void);
};

struct PlannedParam
{
    Param param;
    TypeClass cls = TypeClass::opaque();

    /// Call-site argument index; -1 for Scope and State parameters.
    int argIndex = -1;
};

struct GenerationPlan
{
    FunctionSignature signature;
    std::vector<PlannedParam> params;
    ReturnShape ret;
    std::optional<StateSpec> state;
    PathVerdict verdict = PathVerdict::SlowOnly;
    FallbackReason reason = FallbackReason::NotRequested;

    /// Human-readable explanation of a gate failure; empty otherwise.
    std::string fallbackDetail;

    [[nodiscard]] bool hasFastPair() const
    {
        return verdict == PathVerdict::DualPath;
    }

    [[nodiscard]] bool needsCapsule() const
    {
        return state && state->mode == StateMode::PinnedCapsule;
    }

    /// @brief A registration helper is emitted for dual-path and capsule bindings.
    [[nodiscard]] bool hasTemplateHelper() const
    {
        return hasFastPair() || needsCapsule();
    }
};

struct PlannerOptions
{
    /// Receives one line per planning decision when non-null.
    std::ostream *trace = nullptr;
};

/// @brief Analyze a declared return type.
ReturnShape analyzeReturn(const TypeRef &declared);

/// @brief Classify, resolve state and run the eligibility gates for @p sig.
/// @details Gate failures are not errors: the plan falls back to SlowOnly and,
///          when the fast path was requested, a FastPathFallback warning is
///          reported to @p diags. Missing or incompatible state configuration
///          is returned as the error.
support::Expected<GenerationPlan> planFunction(const FunctionSignature &sig,
                                               support::DiagnosticEngine &diags,
                                               const PlannerOptions &options = {});

/// @brief Human-readable dump used by `tether-gen --plan`.
void printPlan(const GenerationPlan &plan, std::ostream &os);

const char *pathVerdictName(PathVerdict verdict);
const char *fallbackReasonName(FallbackReason reason);

} // namespace tether::bind
